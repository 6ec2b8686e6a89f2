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

#include "lean_toml/reader.hpp"

#include <algorithm>
#include <sstream>

#include "uni_algo/break_grapheme.h"

#include "lean_toml/except.hpp"

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace lean_toml
{
	namespace
	{
		// byte order mark for utf-8, optionally included at the beginning of utf8 text documents
		constexpr auto utf8_bom = "\xEF\xBB\xBF"sv;

		constexpr bool whitespace(char ch) noexcept
		{
			return ch == ' ' || ch == '\t';
		}

		constexpr bool newline(char ch) noexcept
		{
			return ch == '\n' || ch == '\r';
		}

		constexpr std::optional<token_type> punctuation(char ch) noexcept
		{
			switch (ch)
			{
			case '#':
				return token_type::comment_prefix;
			case '=':
				return token_type::equals;
			case ',':
				return token_type::comma;
			case '[':
				return token_type::start_array;
			case ']':
				return token_type::end_array;
			case '{':
				return token_type::start_inline_table;
			case '}':
				return token_type::end_inline_table;
			default:
				return {};
			}
		}

		constexpr bool quote(char ch) noexcept
		{
			return ch == '\"' || ch == '\'';
		}
	}

	std::string_view to_string(token_type t) noexcept
	{
		switch (t)
		{
		case token_type::text:
			return "text"sv;
		case token_type::comment_prefix:
			return "'#'"sv;
		case token_type::equals:
			return "'='"sv;
		case token_type::comma:
			return "','"sv;
		case token_type::start_array:
			return "'['"sv;
		case token_type::end_array:
			return "']'"sv;
		case token_type::start_inline_table:
			return "'{'"sv;
		case token_type::end_inline_table:
			return "'}'"sv;
		}

		return "error type"sv;
	}

	token_reader::token_reader(std::string_view toml) noexcept
		: _toml{ toml }
	{
		// consume the BOM if it is present
		if (_toml.substr(0, size(utf8_bom)) == utf8_bom)
			_position = size(utf8_bom);
	}

	std::optional<std::pair<token, std::size_t>> token_reader::next_token() const
	{
		const auto length = size(_toml);
		auto pos = _position;
		while (pos < length && (whitespace(_toml[pos]) || newline(_toml[pos])))
			++pos;

		if (pos == length)
			return {};

		const auto ch = _toml[pos];
		if (const auto punc = punctuation(ch); punc)
			return std::pair{ token{ pos, 1, *punc }, pos + 1 };

		if (quote(ch))
		{
			const auto start = pos + 1;
			const auto end = _toml.find(ch, start);
			if (end == std::string_view::npos)
				error<unterminated_string>("Quoted string missing end quote"sv, pos);

			return std::pair{ token{ start, end - start, token_type::text, true }, end + 1 };
		}

		// bare text runs until the end of the line or the next punctuation
		const auto start = pos;
		while (pos < length && !newline(_toml[pos]) && !punctuation(_toml[pos]))
			++pos;

		auto end = pos;
		// key names don't include the whitespace before '='
		if (pos < length && _toml[pos] == '=')
		{
			while (end > start && whitespace(_toml[end - 1]))
				--end;
		}

		return std::pair{ token{ start, end - start, token_type::text }, pos };
	}

	std::optional<token> token_reader::peek() const
	{
		if (const auto next = next_token(); next)
			return next->first;
		return {};
	}

	std::optional<token> token_reader::read()
	{
		const auto next = next_token();
		if (!next)
		{
			_position = size(_toml);
			return {};
		}

		_position = next->second;
		return next->first;
	}

	token token_reader::expect(token_type t, std::string_view what)
	{
		const auto next = read();
		if (!next)
		{
			error<unexpected_token>("Unexpected end of input, expected "s +
				std::string{ what }, input_size());
		}

		if (next->type != t)
		{
			auto msg = "Expected "s + std::string{ what } + ", found "s +
				std::string{ to_string(next->type) };
			// point at the opening quote
			const auto pos = next->quoted ? next->position - 1 : next->position;
			error<unexpected_token>(msg, pos);
		}

		return *next;
	}

	void token_reader::skip_line() noexcept
	{
		const auto end = _toml.find('\n', _position);
		_position = end == std::string_view::npos ? size(_toml) : end;
		return;
	}

	std::string_view token_reader::text(const token& t) const noexcept
	{
		if (t.type == token_type::text)
			return _toml.substr(t.position, t.length);
		return _toml.substr(t.position, 1);
	}

	// start of the line containing offset, and the line's text up to offset
	static std::pair<std::size_t, std::string_view> line_prefix(std::string_view toml, std::size_t offset) noexcept
	{
		offset = std::min(offset, size(toml));
		const auto before = toml.substr(0, offset);
		const auto newline = before.find_last_of('\n');
		const auto line_start = newline == std::string_view::npos ? std::size_t{} : newline + 1;
		return { line_start, before.substr(line_start) };
	}

	source_location token_reader::location(std::size_t offset) const
	{
		offset = std::min(offset, size(_toml));
		auto loc = source_location{};
		loc.line += static_cast<std::size_t>(std::count(begin(_toml), begin(_toml) + offset, '\n'));

		const auto prefix = line_prefix(_toml, offset).second;
		auto view = uni::ranges::grapheme::utf8_view{ prefix };
		for ([[maybe_unused]] auto&& grapheme : view)
			++loc.column;

		return loc;
	}

	std::string token_reader::error_string(std::string_view msg, std::size_t offset) const
	{
		const auto loc = location(offset);
		const auto [line_start, prefix] = line_prefix(_toml, offset);

		auto line_end = _toml.find('\n', line_start);
		if (line_end == std::string_view::npos)
			line_end = size(_toml);
		auto line = _toml.substr(line_start, line_end - line_start);
		if (!empty(line) && line.back() == '\r')
			line.remove_suffix(1);

		auto strm = std::ostringstream{};
		strm << msg << '\n';
		const auto line_display = std::to_string(loc.line) + '>';
		strm << line_display << line << '\n';
		for (auto i = std::size_t{}; i < size(line_display); ++i)
			strm.put(' ');

		// keep tabs so the caret lines up
		auto view = uni::ranges::grapheme::utf8_view{ prefix };
		for (auto&& grapheme : view)
			strm.put(grapheme == "\t"sv ? '\t' : ' ');

		strm << '^';
		return strm.str();
	}
}
