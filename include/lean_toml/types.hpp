// MIT License
//
// Copyright (c) 2022 Steven Pilkington
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#ifndef LEAN_TOML_TYPES_HPP
#define LEAN_TOML_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <tuple>

namespace lean_toml
{
	// Simple date type.
	struct date
	{
		std::uint16_t year = {};
		std::uint8_t month = {},
			day = {};
	};

	// Simple time type.
	struct time
	{
		std::uint8_t hours = {},
			minutes = {},
			seconds = {};
		std::uint32_t nanoseconds = {};
	};

	// Whether a date_time is in UTC (parsed with an offset) or
	// in an unspecified local time zone
	enum class time_kind : std::uint8_t
	{
		local,
		utc
	};

	// Compound date/time type
	// values parsed with an offset are converted to utc
	struct date_time
	{
		lean_toml::date date = {};
		lean_toml::time time = {};
		time_kind kind = time_kind::local;
	};

	// Signed duration, eg. 07:32:00 or -1.12:00:00
	using time_span = std::chrono::nanoseconds;

	constexpr bool operator==(const date& lhs, const date& rhs) noexcept
	{
		return std::tie(lhs.year, lhs.month, lhs.day) ==
			std::tie(rhs.year, rhs.month, rhs.day);
	}

	constexpr bool operator!=(const date& lhs, const date& rhs) noexcept
	{
		return !(lhs == rhs);
	}

	constexpr bool operator==(const time& lhs, const time& rhs) noexcept
	{
		return std::tie(lhs.hours, lhs.minutes, lhs.seconds, lhs.nanoseconds) ==
			std::tie(rhs.hours, rhs.minutes, rhs.seconds, rhs.nanoseconds);
	}

	constexpr bool operator!=(const time& lhs, const time& rhs) noexcept
	{
		return !(lhs == rhs);
	}

	constexpr bool operator==(const date_time& lhs, const date_time& rhs) noexcept
	{
		return lhs.date == rhs.date &&
			lhs.time == rhs.time &&
			lhs.kind == rhs.kind;
	}

	constexpr bool operator!=(const date_time& lhs, const date_time& rhs) noexcept
	{
		return !(lhs == rhs);
	}

	// TOML value types
	enum class value_type : std::uint8_t
	{
		text,
		number,
		boolean,
		date_time,
		time_span,
		array,
		table,
		// moved from, no longer holds anything
		bad
	};

	// Configurable options for controlling writer output
	struct writer_options
	{
		// If true, avoids unrequired whitespace eg: name = value -> name=value.
		// Also skips the blank line before table headers.
		bool compact_spacing = false;
		// Date Time separator.
		enum class date_time_separator_t : std::uint8_t
		{
			big_t,
			whitespace
		};

		// Default to big_t.
		date_time_separator_t date_time_separator = {};
		// Write a utf-8 BOM into the start of the stream.
		bool utf8_bom = false;
	};

	struct parser_options
	{
		// Keys are not checked for uniqueness; lookups return the first match.
		// If false, repeated keys and table names throw duplicate_element.
		bool allow_duplicate_keys = true;
	};
}

#endif
