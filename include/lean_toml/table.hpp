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

#ifndef LEAN_TOML_TABLE_HPP
#define LEAN_TOML_TABLE_HPP

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "lean_toml/key_value.hpp"
#include "lean_toml/types.hpp"
#include "lean_toml/value.hpp"

namespace lean_toml
{
	class token_reader;

	// A named list of key_values
	// Lookups are exact and case sensitive, returning the first match
	class table
	{
	public:
		explicit table(std::string name);

		const std::string& name() const noexcept
		{
			return _name;
		}

		void add(key_value);
		void add(std::string key, value v);

		bool contains_key(std::string_view key) const noexcept;

		// Returns nullptr if the key isn't in this table
		value* try_get_value(std::string_view key) noexcept;
		const value* try_get_value(std::string_view key) const noexcept;

		// Throws missing_key if the key isn't in this table
		value& get_value(std::string_view key);
		const value& get_value(std::string_view key) const;

		// Returns def if the key isn't in this table
		// Throws wrong_type if the key is present with a different type
		template<typename T>
		T get_value(std::string_view key, T def) const;

		const std::vector<key_value>& key_values() const noexcept
		{
			return _key_values;
		}

		std::vector<key_value>& key_values() noexcept
		{
			return _key_values;
		}

		// Reads one key_value and appends it.
		// Throws duplicate_element if the key is already present
		// and parser_options::allow_duplicate_keys is false.
		void read_key_value(token_reader&, const parser_options&);

		// Reads a [name] header and every key_value up to the next header.
		static table read(token_reader&, const parser_options&);
		// Reads { key = value, ... }
		static table read_inline(token_reader&, const parser_options&, std::string name);

		// [name]
		// key = value
		void write(std::ostream&, const writer_options& = {}) const;
		// { key = value, key2 = value }
		void write_inline(std::ostream&, const writer_options& = {}) const;
		std::string to_string(const writer_options& = {}) const;

	private:
		std::string _name;
		std::vector<key_value> _key_values;
	};

	std::ostream& operator<<(std::ostream&, const table&);
}

#include "lean_toml/table.inl"

#endif // !LEAN_TOML_TABLE_HPP
