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

#ifndef LEAN_TOML_READER_HPP
#define LEAN_TOML_READER_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lean_toml
{
	enum class token_type : std::uint8_t
	{
		text,
		comment_prefix,		// #
		equals,				// =
		comma,				// ,
		start_array,		// [
		end_array,			// ]
		start_inline_table,	// {
		end_inline_table	// }
	};

	// A token is a view into the source text.
	// For quoted text the range excludes the quote characters.
	struct token
	{
		std::size_t position = {};
		std::size_t length = {};
		token_type type = token_type::text;
		bool quoted = false;
	};

	// 1-based line and column(in graphemes) of a byte offset
	struct source_location
	{
		std::size_t line = 1;
		std::size_t column = 1;
	};

	// Splits utf-8 TOML text into tokens on demand.
	// The only state is the cursor position, peek() never moves it
	// and read() moves it past exactly the token peek() would return.
	class token_reader
	{
	public:
		// toml must outlive the reader
		explicit token_reader(std::string_view toml) noexcept;

		// Returns the next token, or nullopt if only whitespace remains.
		// Throws: unterminated_string
		std::optional<token> peek() const;
		// As above, but advances past the returned token.
		std::optional<token> read();

		// Reads the next token, throws unexpected_token
		// if there isn't one or it isn't of type `t`.
		token expect(token_type t, std::string_view what);

		// Skips the rest of the current line.
		void skip_line() noexcept;

		// The text covered by the token.
		// Punctuation tokens return their single character.
		std::string_view text(const token&) const noexcept;

		std::size_t position() const noexcept
		{
			return _position;
		}

		// length of the whole input in bytes
		std::size_t input_size() const noexcept
		{
			return _toml.size();
		}

		source_location location(std::size_t offset) const;

		// Formats a diagnostic for offset:
		//	<msg>
		//	3> title = "abc
		//	           ^
		std::string error_string(std::string_view msg, std::size_t offset) const;

		// Throws Error{ error_string(msg, offset), line, column }
		template<typename Error>
		[[noreturn]] void error(std::string_view msg, std::size_t offset) const;

	private:
		// token and the offset just past it
		std::optional<std::pair<token, std::size_t>> next_token() const;

		std::string_view _toml;
		std::size_t _position = {};
	};

	template<typename Error>
	void token_reader::error(std::string_view msg, std::size_t offset) const
	{
		const auto loc = location(offset);
		throw Error{ error_string(msg, offset), loc.line, loc.column };
	}

	// Name of a token type for error messages eg. "'='" or "text"
	std::string_view to_string(token_type) noexcept;
}

#endif
