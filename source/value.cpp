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

#include "lean_toml/value.hpp"

#include <array>
#include <ostream>
#include <sstream>
#include <utility>

#include "lean_toml/array.hpp"
#include "lean_toml/except.hpp"
#include "lean_toml/reader.hpp"
#include "lean_toml/string_util.hpp"
#include "lean_toml/table.hpp"

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace lean_toml
{
	namespace
	{
		constexpr auto type_names = std::array{
			"text"sv,
			"number"sv,
			"boolean"sv,
			"date-time"sv,
			"time span"sv,
			"array"sv,
			"table"sv,
			"bad"sv
		};

		template<typename T, typename Variant>
		auto& get_as(Variant& var, std::string_view function)
		{
			if (std::holds_alternative<std::monostate>(var))
				throw bad_value{ "Called "s + std::string{ function } + " on a moved from value"s };

			try
			{
				return std::get<T>(var);
			}
			catch (const std::bad_variant_access&)
			{
				throw wrong_type{ "Called "s + std::string{ function } + " on a value of type "s +
					std::string{ type_names[var.index()] } };
			}
		}

		struct write_visitor
		{
		public:
			std::ostream& out;
			const writer_options& options;

			void operator()(const std::string& s)
			{
				out << quote_toml_text(s);
				return;
			}

			void operator()(double d)
			{
				out << lean_toml::to_string(d);
				return;
			}

			void operator()(bool b)
			{
				out << lean_toml::to_string(b);
				return;
			}

			void operator()(const date_time& dt)
			{
				out << lean_toml::to_string(dt, options.date_time_separator);
				return;
			}

			void operator()(time_span t)
			{
				out << lean_toml::to_string(t);
				return;
			}

			void operator()(const std::unique_ptr<array>& a)
			{
				a->write(out, options);
				return;
			}

			void operator()(const std::unique_ptr<table>& t)
			{
				t->write_inline(out, options);
				return;
			}

			void operator()(std::monostate)
			{
				throw bad_value{ "Cannot write a moved from value"s };
			}
		};
	}

	value::value(const char* s)
		: value{ std::string{ s } }
	{}

	value::value(std::string s)
		: _value{ std::in_place_type<std::string>, std::move(s) }
	{}

	value::value(std::string_view s)
		: value{ std::string{ s } }
	{}

	value::value(double d) noexcept
		: _value{ std::in_place_type<double>, d }
	{}

	value::value(bool b) noexcept
		: _value{ std::in_place_type<bool>, b }
	{}

	value::value(date_time dt) noexcept
		: _value{ std::in_place_type<date_time>, dt }
	{}

	value::value(time_span t) noexcept
		: _value{ std::in_place_type<time_span>, t }
	{}

	value::value(array a)
		: _value{ std::in_place_type<std::unique_ptr<array>>, std::make_unique<array>(std::move(a)) }
	{}

	value::value(table t)
		: _value{ std::in_place_type<std::unique_ptr<table>>, std::make_unique<table>(std::move(t)) }
	{}

	value::value(value&& other) noexcept
		: _value{ std::exchange(other._value, std::monostate{}) }
	{}

	value& value::operator=(value&& other) noexcept
	{
		if (this != &other)
			_value = std::exchange(other._value, std::monostate{});
		return *this;
	}

	value::~value() noexcept = default;

	value_type value::type() const noexcept
	{
		static_assert(std::variant_size_v<variant_t> == static_cast<std::size_t>(value_type::bad) + 1);
		return static_cast<value_type>(_value.index());
	}

	bool value::good() const noexcept
	{
		return !std::holds_alternative<std::monostate>(_value);
	}

	const std::string& value::as_text() const
	{
		return get_as<std::string>(_value, "as_text"sv);
	}

	double value::as_number() const
	{
		return get_as<double>(_value, "as_number"sv);
	}

	bool value::as_boolean() const
	{
		return get_as<bool>(_value, "as_boolean"sv);
	}

	date_time value::as_date_time() const
	{
		return get_as<date_time>(_value, "as_date_time"sv);
	}

	time_span value::as_time_span() const
	{
		return get_as<time_span>(_value, "as_time_span"sv);
	}

	array& value::as_array()
	{
		return *get_as<std::unique_ptr<array>>(_value, "as_array"sv);
	}

	const array& value::as_array() const
	{
		return *get_as<std::unique_ptr<array>>(_value, "as_array"sv);
	}

	table& value::as_table()
	{
		return *get_as<std::unique_ptr<table>>(_value, "as_table"sv);
	}

	const table& value::as_table() const
	{
		return *get_as<std::unique_ptr<table>>(_value, "as_table"sv);
	}

	value value::read(token_reader& reader, const parser_options& options, std::string_view name)
	{
		const auto next = reader.peek();
		if (!next)
			reader.error<unexpected_token>("Unexpected end of input, expected a value"sv, reader.input_size());

		switch (next->type)
		{
		case token_type::text:
			reader.read();
			if (next->quoted)
				return value{ std::string{ reader.text(*next) } };
			return from_bare_text(reader.text(*next));
		case token_type::start_array:
			return array::read(reader, options);
		case token_type::start_inline_table:
			return table::read_inline(reader, options, std::string{ name });
		default:
			reader.error<unexpected_token>("Expected a value, found "s +
				std::string{ lean_toml::to_string(next->type) }, next->position);
		}
	}

	value value::from_bare_text(std::string_view text)
	{
		const auto str = trim(text);
		return std::visit([str](auto&& scalar) -> value {
			using T = std::decay_t<decltype(scalar)>;
			if constexpr (std::is_same_v<T, std::monostate>)
				return value{ std::string{ str } };
			else
				return value{ scalar };
		}, parse_scalar(str));
	}

	void value::write(std::ostream& out, const writer_options& options) const
	{
		std::visit(write_visitor{ out, options }, _value);
		return;
	}

	std::string value::to_string(const writer_options& options) const
	{
		auto out = std::ostringstream{};
		write(out, options);
		return out.str();
	}

	std::ostream& operator<<(std::ostream& out, const value& v)
	{
		v.write(out);
		return out;
	}
}
