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

#include "lean_toml/array.hpp"

#include <ostream>
#include <sstream>
#include <utility>

#include "lean_toml/except.hpp"
#include "lean_toml/reader.hpp"

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace lean_toml
{
	namespace
	{
		constexpr auto initial_capacity = std::size_t{ 4 };
	}

	array::array()
	{
		_values.reserve(initial_capacity);
	}

	array::array(container_t values)
		: _values{ std::move(values) }
	{
		_values.reserve(initial_capacity);
	}

	array::array(std::initializer_list<double> numbers)
		: array{}
	{
		for (const auto n : numbers)
			_values.emplace_back(n);
		return;
	}

	void array::push_back(value v)
	{
		_values.push_back(std::move(v));
		return;
	}

	value& array::at(std::size_t i)
	{
		return _values.at(i);
	}

	const value& array::at(std::size_t i) const
	{
		return _values.at(i);
	}

	array array::read(token_reader& reader, const parser_options& options)
	{
		reader.expect(token_type::start_array, "'['"sv);

		auto out = array{};
		while (true)
		{
			const auto next = reader.peek();
			if (!next)
				reader.error<unexpected_token>("Unexpected end of input, expected ']'"sv, reader.input_size());

			switch (next->type)
			{
			case token_type::end_array:
				reader.read();
				return out;
			case token_type::comma:
				reader.read();
				break;
			case token_type::comment_prefix:
				reader.read();
				reader.skip_line();
				break;
			default:
				out.push_back(value::read(reader, options));
			}
		}
	}

	void array::write(std::ostream& out, const writer_options& options) const
	{
		if (_values.empty())
		{
			out << "[]"sv;
			return;
		}

		const auto separator = options.compact_spacing ? ","sv : ", "sv;
		out << (options.compact_spacing ? "["sv : "[ "sv);
		auto first = true;
		for (const auto& v : _values)
		{
			if (!first)
				out << separator;
			v.write(out, options);
			first = false;
		}
		out << (options.compact_spacing ? "]"sv : " ]"sv);
		return;
	}

	std::string array::to_string(const writer_options& options) const
	{
		auto out = std::ostringstream{};
		write(out, options);
		return out.str();
	}

	std::ostream& operator<<(std::ostream& out, const array& a)
	{
		a.write(out);
		return out;
	}
}
