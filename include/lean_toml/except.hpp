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

#ifndef LEAN_TOML_EXCEPT_HPP
#define LEAN_TOML_EXCEPT_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace lean_toml
{
	// base class for all exceptions thrown by lean_toml
	class toml_error : public std::runtime_error
	{
	public:
		using std::runtime_error::runtime_error;
	};

	// thrown by any of the parse functions
	// line and column are 1-based, column counts graphemes
	class parsing_error : public toml_error
	{
	public:
		parsing_error(const std::string& what, std::size_t line, std::size_t column)
			: toml_error{ what }, _line{ line }, _column{ column }
		{}

		std::size_t line() const noexcept
		{
			return _line;
		}

		std::size_t column() const noexcept
		{
			return _column;
		}

	private:
		std::size_t _line;
		std::size_t _column;
	};

	// thrown if eof is encountered before a quoted string is closed
	class unterminated_string : public parsing_error
	{
	public:
		using parsing_error::parsing_error;
	};

	// thrown when the next token isn't one the grammar allows here
	// (no '=' after a key, no ']' or '}' closing a container, etc.)
	class unexpected_token : public parsing_error
	{
	public:
		using parsing_error::parsing_error;
	};

	// thrown if the toml text contains duplicate table or key declarations
	// only when parser_options::allow_duplicate_keys == false
	class duplicate_element : public parsing_error
	{
	public:
		using parsing_error::parsing_error;
	};

	// thrown by value accessors when the value has been moved from
	class bad_value : public toml_error
	{
	public:
		using toml_error::toml_error;
	};

	// thrown when calling value::as_text... if the type
	// stored doesn't match the function return type
	class wrong_type : public toml_error
	{
	public:
		using toml_error::toml_error;
	};

	// thrown by the strict lookup functions
	class node_not_found : public toml_error
	{
	public:
		using toml_error::toml_error;
	};

	class missing_key : public node_not_found
	{
	public:
		using node_not_found::node_not_found;
	};

	class missing_table : public node_not_found
	{
	public:
		using node_not_found::node_not_found;
	};

	// thrown if the input isn't valid utf-8
	class unicode_error : public toml_error
	{
	public:
		using toml_error::toml_error;
	};
}

#endif
