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

#include "lean_toml/table.hpp"

#include <algorithm>
#include <ostream>
#include <sstream>
#include <utility>

#include "lean_toml/except.hpp"
#include "lean_toml/reader.hpp"
#include "lean_toml/string_util.hpp"

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace lean_toml
{
	namespace
	{
		template<typename KeyValues>
		auto find_key(KeyValues& key_values, std::string_view key) noexcept
		{
			return std::find_if(begin(key_values), end(key_values), [key](const key_value& kv) {
				return kv.key() == key;
			});
		}

		// offset of the first character of t, including the opening quote
		std::size_t token_start(const token& t) noexcept
		{
			return t.quoted ? t.position - 1 : t.position;
		}
	}

	table::table(std::string name)
		: _name{ std::move(name) }
	{}

	void table::add(key_value kv)
	{
		_key_values.push_back(std::move(kv));
		return;
	}

	void table::add(std::string key, value v)
	{
		_key_values.emplace_back(std::move(key), std::move(v));
		return;
	}

	bool table::contains_key(std::string_view key) const noexcept
	{
		return try_get_value(key) != nullptr;
	}

	value* table::try_get_value(std::string_view key) noexcept
	{
		const auto iter = find_key(_key_values, key);
		if (iter == end(_key_values))
			return nullptr;
		return &iter->get();
	}

	const value* table::try_get_value(std::string_view key) const noexcept
	{
		const auto iter = find_key(_key_values, key);
		if (iter == end(_key_values))
			return nullptr;
		return &iter->get();
	}

	value& table::get_value(std::string_view key)
	{
		if (const auto v = try_get_value(key); v)
			return *v;
		throw missing_key{ "Key not found: "s + std::string{ key } };
	}

	const value& table::get_value(std::string_view key) const
	{
		if (const auto v = try_get_value(key); v)
			return *v;
		throw missing_key{ "Key not found: "s + std::string{ key } };
	}

	void table::read_key_value(token_reader& reader, const parser_options& options)
	{
		const auto next = reader.peek();
		const auto start = next ? token_start(*next) : reader.position();
		auto kv = key_value::read(reader, options);
		if (!options.allow_duplicate_keys && contains_key(kv.key()))
			reader.error<duplicate_element>("Duplicate key: "s + kv.key(), start);

		add(std::move(kv));
		return;
	}

	table table::read(token_reader& reader, const parser_options& options)
	{
		reader.expect(token_type::start_array, "'['"sv);
		const auto name = reader.expect(token_type::text, "a table name"sv);
		reader.expect(token_type::end_array, "']'"sv);

		const auto name_str = reader.text(name);
		auto out = table{ std::string{ name.quoted ? name_str : trim(name_str) } };

		// key_values continue until the next table header
		while (true)
		{
			const auto next = reader.peek();
			if (!next || next->type == token_type::start_array)
				return out;

			if (next->type == token_type::comment_prefix)
			{
				reader.read();
				reader.skip_line();
			}
			else
				out.read_key_value(reader, options);
		}
	}

	table table::read_inline(token_reader& reader, const parser_options& options, std::string name)
	{
		reader.expect(token_type::start_inline_table, "'{'"sv);

		auto out = table{ std::move(name) };
		while (true)
		{
			const auto next = reader.peek();
			if (!next)
				reader.error<unexpected_token>("Unexpected end of input, expected '}'"sv, reader.input_size());

			switch (next->type)
			{
			case token_type::end_inline_table:
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
				out.read_key_value(reader, options);
			}
		}
	}

	void table::write(std::ostream& out, const writer_options& options) const
	{
		if (!options.compact_spacing)
			out << '\n';

		out << '[' << quote_toml_name(_name) << "]\n"sv;
		for (const auto& kv : _key_values)
		{
			kv.write(out, options);
			out << '\n';
		}
		return;
	}

	void table::write_inline(std::ostream& out, const writer_options& options) const
	{
		if (_key_values.empty())
		{
			out << "{}"sv;
			return;
		}

		const auto separator = options.compact_spacing ? ","sv : ", "sv;
		out << (options.compact_spacing ? "{"sv : "{ "sv);
		auto first = true;
		for (const auto& kv : _key_values)
		{
			if (!first)
				out << separator;
			kv.write(out, options);
			first = false;
		}
		out << (options.compact_spacing ? "}"sv : " }"sv);
		return;
	}

	std::string table::to_string(const writer_options& options) const
	{
		auto out = std::ostringstream{};
		write(out, options);
		return out.str();
	}

	std::ostream& operator<<(std::ostream& out, const table& t)
	{
		t.write(out);
		return out;
	}
}
