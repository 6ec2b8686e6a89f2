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

#ifndef LEAN_TOML_VALUE_HPP
#define LEAN_TOML_VALUE_HPP

#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "lean_toml/internal.hpp"
#include "lean_toml/types.hpp"

namespace lean_toml
{
	class array;
	class table;
	class token_reader;

	// A single TOML value: text, number, boolean, date-time, time span,
	// or an owned array or inline table.
	// Values are move only; a moved from value is 'bad' and
	// every accessor throws bad_value.
	class value
	{
	public:
		value(const char*);
		value(std::string);
		value(std::string_view);
		value(double) noexcept;
		value(bool) noexcept;
		value(date_time) noexcept;
		value(time_span) noexcept;
		value(array);
		value(table);

		// integers and other non-bool arithmetic types are stored as double
		template<typename Number, std::enable_if_t<detail::is_number_v<Number>, int> = 0>
		value(Number n) noexcept : value{ static_cast<double>(n) }
		{}

		value(const value&) = delete;
		value(value&&) noexcept;
		value& operator=(const value&) = delete;
		value& operator=(value&&) noexcept;
		~value() noexcept;

		value_type type() const noexcept;
		// false for moved from values
		bool good() const noexcept;

		// Throws wrong_type if the value isn't of the requested type
		// Throws bad_value if !good()
		const std::string& as_text() const;
		double as_number() const;
		bool as_boolean() const;
		date_time as_date_time() const;
		time_span as_time_span() const;
		array& as_array();
		const array& as_array() const;
		table& as_table();
		const table& as_table() const;

		// T can be any of the scalar types or an arithmetic type(converted from number)
		template<typename T>
		T as_type() const;

		// Reads a value starting at the next token: bare or quoted text, an array or an inline table.
		// name is given to inline tables.
		// Throws unexpected_token if the next token can't start a value.
		static value read(token_reader&, const parser_options&, std::string_view name = {});
		// Performs type inference on bare text
		// number, boolean, time span, offset date-time, local date-time, text
		static value from_bare_text(std::string_view);

		void write(std::ostream&, const writer_options& = {}) const;
		std::string to_string(const writer_options& = {}) const;

	private:
		// alternatives are ordered to match value_type
		using variant_t = std::variant<
			std::string,
			double,
			bool,
			date_time,
			time_span,
			std::unique_ptr<array>,
			std::unique_ptr<table>,
			std::monostate
		>;

		variant_t _value;
	};

	std::ostream& operator<<(std::ostream&, const value&);
}

#include "lean_toml/value.inl"

#endif // !LEAN_TOML_VALUE_HPP
