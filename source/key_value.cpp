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

#include "lean_toml/key_value.hpp"

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
	key_value::key_value(std::string key, value v)
		: _key{ std::move(key) }, _value{ std::move(v) }
	{
		if (_key.empty())
			throw toml_error{ "Keys cannot be empty"s };
	}

	key_value key_value::read(token_reader& reader, const parser_options& options)
	{
		const auto key = reader.expect(token_type::text, "a key"sv);
		if (key.length == 0)
			reader.error<parsing_error>("Keys cannot be empty"sv, key.quoted ? key.position - 1 : key.position);

		reader.expect(token_type::equals, "'='"sv);
		auto name = std::string{ reader.text(key) };
		auto v = value::read(reader, options, name);
		return key_value{ std::move(name), std::move(v) };
	}

	void key_value::write(std::ostream& out, const writer_options& options) const
	{
		out << quote_toml_name(_key) << (options.compact_spacing ? "="sv : " = "sv);
		_value.write(out, options);
		return;
	}

	std::string key_value::to_string(const writer_options& options) const
	{
		auto out = std::ostringstream{};
		write(out, options);
		return out.str();
	}

	std::ostream& operator<<(std::ostream& out, const key_value& kv)
	{
		kv.write(out);
		return out;
	}
}
