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

#include "lean_toml/document.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <utility>

#include "uni_algo/conv.h"

#include "lean_toml/except.hpp"
#include "lean_toml/reader.hpp"

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace lean_toml
{
	namespace
	{
		// byte order mark for utf-8, optionally included at the beginning of utf8 text documents
		constexpr auto utf8_bom = "\xEF\xBB\xBF"sv;

		template<typename Tables>
		auto find_table(Tables& tables, std::string_view name) noexcept
		{
			return std::find_if(begin(tables), end(tables), [name](const table& t) {
				return t.name() == name;
			});
		}
	}

	document document::create()
	{
		return document{};
	}

	document document::parse(std::string_view toml, const parser_options& options)
	{
		if (!uni::is_valid_utf8(toml))
			throw unicode_error{ "Toml document is not valid utf-8"s };

		auto reader = token_reader{ toml };
		auto doc = document{};

		while (true)
		{
			const auto next = reader.peek();
			if (!next)
				return doc;

			switch (next->type)
			{
			case token_type::comment_prefix:
				reader.read();
				reader.skip_line();
				break;
			case token_type::text:
				doc._root.read_key_value(reader, options);
				break;
			case token_type::start_array:
			{
				const auto start = next->position;
				auto t = table::read(reader, options);
				if (!options.allow_duplicate_keys && doc.contains_table(t.name()))
					reader.error<duplicate_element>("Duplicate table: "s + t.name(), start);
				doc._tables.push_back(std::move(t));
				break;
			}
			default:
				// stray punctuation at the top level is skipped
				reader.read();
			}
		}
	}

	document document::parse(const std::string& toml, const parser_options& options)
	{
		return parse(std::string_view{ toml }, options);
	}

	document document::parse(const char* toml, const parser_options& options)
	{
		return parse(std::string_view{ toml }, options);
	}

	document document::parse(std::istream& strm, const parser_options& options)
	{
		const auto toml = std::string{ std::istreambuf_iterator<char>{ strm }, std::istreambuf_iterator<char>{} };
		return parse(std::string_view{ toml }, options);
	}

	document document::parse(const std::filesystem::path& filename, const parser_options& options)
	{
		auto strm = std::ifstream{ filename, std::ios_base::binary };
		if (!strm.good())
			throw toml_error{ "Unable to open file: "s + filename.string() };
		return parse(strm, options);
	}

	std::optional<document> document::try_parse(std::string_view toml, const parser_options& options)
	{
		try
		{
			return parse(toml, options);
		}
		catch (const toml_error& e)
		{
			std::cerr << e.what() << '\n';
			return {};
		}
	}

	std::optional<document> document::try_parse(const std::string& toml, const parser_options& options)
	{
		return try_parse(std::string_view{ toml }, options);
	}

	std::optional<document> document::try_parse(const char* toml, const parser_options& options)
	{
		return try_parse(std::string_view{ toml }, options);
	}

	void document::add(key_value kv)
	{
		_root.add(std::move(kv));
		return;
	}

	void document::add(std::string key, value v)
	{
		_root.add(std::move(key), std::move(v));
		return;
	}

	void document::add(table t)
	{
		_tables.push_back(std::move(t));
		return;
	}

	bool document::contains_key(std::string_view key) const noexcept
	{
		return _root.contains_key(key);
	}

	value* document::try_get_value(std::string_view key) noexcept
	{
		return _root.try_get_value(key);
	}

	const value* document::try_get_value(std::string_view key) const noexcept
	{
		return _root.try_get_value(key);
	}

	value& document::get_value(std::string_view key)
	{
		return _root.get_value(key);
	}

	const value& document::get_value(std::string_view key) const
	{
		return _root.get_value(key);
	}

	bool document::contains_table(std::string_view name) const noexcept
	{
		return try_get_table(name) != nullptr;
	}

	table* document::try_get_table(std::string_view name) noexcept
	{
		const auto iter = find_table(_tables, name);
		if (iter == end(_tables))
			return nullptr;
		return &*iter;
	}

	const table* document::try_get_table(std::string_view name) const noexcept
	{
		const auto iter = find_table(_tables, name);
		if (iter == end(_tables))
			return nullptr;
		return &*iter;
	}

	table& document::get_table(std::string_view name)
	{
		if (const auto t = try_get_table(name); t)
			return *t;
		throw missing_table{ "Table not found: "s + std::string{ name } };
	}

	const table& document::get_table(std::string_view name) const
	{
		if (const auto t = try_get_table(name); t)
			return *t;
		throw missing_table{ "Table not found: "s + std::string{ name } };
	}

	void document::write(std::ostream& out, const writer_options& options) const
	{
		if (options.utf8_bom)
			out << utf8_bom;

		for (const auto& kv : _root.key_values())
		{
			kv.write(out, options);
			out << '\n';
		}

		for (const auto& t : _tables)
			t.write(out, options);
		return;
	}

	std::string document::to_string(const writer_options& options) const
	{
		auto out = std::ostringstream{};
		write(out, options);
		return out.str();
	}

	std::ostream& operator<<(std::ostream& out, const document& d)
	{
		d.write(out);
		return out;
	}
}
