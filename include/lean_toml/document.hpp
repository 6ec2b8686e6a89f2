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

#ifndef LEAN_TOML_DOCUMENT_HPP
#define LEAN_TOML_DOCUMENT_HPP

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lean_toml/key_value.hpp"
#include "lean_toml/table.hpp"
#include "lean_toml/types.hpp"
#include "lean_toml/value.hpp"

namespace lean_toml
{
	// Root of a TOML tree.
	// Top level key_values followed by a list of tables.
	class document
	{
	public:
		// Empty document for building programmatically
		static document create();

		// Throws parsing_error or one of its subclasses for malformed toml,
		// unicode_error if toml isn't valid utf-8
		static document parse(std::string_view toml, const parser_options& = {});
		static document parse(const std::string& toml, const parser_options& = {});
		static document parse(const char* toml, const parser_options& = {});
		static document parse(std::istream&, const parser_options& = {});
		// Throws toml_error if the file cannot be opened
		static document parse(const std::filesystem::path& filename, const parser_options& = {});

		// As above, but errors are reported to std::cerr and an empty optional returned
		static std::optional<document> try_parse(std::string_view toml, const parser_options& = {});
		static std::optional<document> try_parse(const std::string& toml, const parser_options& = {});
		static std::optional<document> try_parse(const char* toml, const parser_options& = {});

		void add(key_value);
		void add(std::string key, value v);
		void add(table);

		bool contains_key(std::string_view key) const noexcept;
		// Returns nullptr if the key isn't present
		value* try_get_value(std::string_view key) noexcept;
		const value* try_get_value(std::string_view key) const noexcept;
		// Throws missing_key
		value& get_value(std::string_view key);
		const value& get_value(std::string_view key) const;

		// Returns def if the key isn't present
		template<typename T>
		T get_value(std::string_view key, T def) const
		{
			return _root.get_value(key, std::move(def));
		}

		bool contains_table(std::string_view name) const noexcept;
		// Returns nullptr if there is no table with this name
		table* try_get_table(std::string_view name) noexcept;
		const table* try_get_table(std::string_view name) const noexcept;
		// Throws missing_table
		table& get_table(std::string_view name);
		const table& get_table(std::string_view name) const;

		const std::vector<key_value>& key_values() const noexcept
		{
			return _root.key_values();
		}

		const std::vector<table>& tables() const noexcept
		{
			return _tables;
		}

		void write(std::ostream&, const writer_options& = {}) const;
		std::string to_string(const writer_options& = {}) const;

	private:
		document() = default;

		// top level key_values, the name is never written
		table _root{ std::string{} };
		std::vector<table> _tables;
	};

	std::ostream& operator<<(std::ostream&, const document&);
}

#endif // !LEAN_TOML_DOCUMENT_HPP
