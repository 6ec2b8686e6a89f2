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

#ifndef LEAN_TOML_STRING_UTIL_HPP
#define LEAN_TOML_STRING_UTIL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "lean_toml/types.hpp"

// These functions assume chars, strings and string_views are encoded in utf-8

namespace lean_toml
{
	// Parses TOML floating point and integer strings, including inf and nan.
	// Underscores between digits are allowed.
	std::optional<double> parse_number(std::string_view str);
	// Exactly "true" or "false"
	std::optional<bool> parse_boolean(std::string_view str) noexcept;
	// [-][d.]hh:mm[:ss[.fraction]]
	std::optional<time_span> parse_time_span(std::string_view str);
	// RFC 3339 date-time with an offset, the result is converted to utc
	std::optional<date_time> parse_offset_date_time(std::string_view str);
	// RFC 3339 date-time without offset, or a date on its own
	std::optional<date_time> parse_local_date_time(std::string_view str);

	// monostate means str should be treated as text
	using scalar_t = std::variant<std::monostate, double, bool, time_span, date_time>;

	// Tries each of the parse functions above in turn:
	// number, boolean, time span, offset date-time, local date-time.
	scalar_t parse_scalar(std::string_view str);

	// Strips spaces and tabs from both ends
	std::string_view trim(std::string_view str) noexcept;

	// Shortest representation that parses back to the same value
	std::string to_string(double);
	std::string to_string(bool);
	std::string to_string(const date_time&,
		writer_options::date_time_separator_t = writer_options::date_time_separator_t::big_t);
	std::string to_string(time_span);

	// Adds quotations around str if it couldn't be read back as the same key or table name.
	// Throws toml_error if str contains both ' and "
	std::string quote_toml_name(std::string_view str);
	// As above, but also quotes text that would be read back as another type of value
	// eg. "true" or "8000"
	std::string quote_toml_text(std::string_view str);
}

#endif // !LEAN_TOML_STRING_UTIL_HPP
