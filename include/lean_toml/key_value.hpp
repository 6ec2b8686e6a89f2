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

#ifndef LEAN_TOML_KEY_VALUE_HPP
#define LEAN_TOML_KEY_VALUE_HPP

#include <iosfwd>
#include <string>

#include "lean_toml/types.hpp"
#include "lean_toml/value.hpp"

namespace lean_toml
{
	class token_reader;

	// key = value
	class key_value
	{
	public:
		// Throws toml_error if key is empty
		key_value(std::string key, value v);

		const std::string& key() const noexcept
		{
			return _key;
		}

		value& get() noexcept
		{
			return _value;
		}

		const value& get() const noexcept
		{
			return _value;
		}

		static key_value read(token_reader&, const parser_options&);

		void write(std::ostream&, const writer_options& = {}) const;
		std::string to_string(const writer_options& = {}) const;

	private:
		std::string _key;
		value _value;
	};

	std::ostream& operator<<(std::ostream&, const key_value&);
}

#endif // !LEAN_TOML_KEY_VALUE_HPP
