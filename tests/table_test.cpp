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

#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "gtest/gtest.h"

#include "lean_toml.hpp"
#include "lean_toml/reader.hpp"

using namespace lean_toml;
using namespace std::string_literals;
using namespace std::string_view_literals;

namespace
{
	table read_table(std::string_view toml, const parser_options& options = {})
	{
		auto reader = token_reader{ toml };
		return table::read(reader, options);
	}

	table read_inline_table(std::string_view toml, std::string name = {})
	{
		auto reader = token_reader{ toml };
		return table::read_inline(reader, parser_options{}, std::move(name));
	}
}

TEST(TableTest, ReadStopsAtNextHeader)
{
	auto reader = token_reader{ "[owner]\nname = \"Tom\"\ndob = 1979-05-27T07:32:00-08:00\n\n[database]\n"sv };
	const auto t = table::read(reader, parser_options{});

	EXPECT_EQ(t.name(), "owner"s);
	ASSERT_EQ(t.key_values().size(), 2u);
	EXPECT_EQ(t.key_values()[0].key(), "name"s);
	EXPECT_EQ(t.get_value("name").as_text(), "Tom"s);
	EXPECT_EQ(t.get_value("dob").type(), value_type::date_time);

	const auto next = reader.peek();
	ASSERT_TRUE(next);
	EXPECT_EQ(next->type, token_type::start_array);
}

TEST(TableTest, Names)
{
	EXPECT_EQ(read_table("[ owner ]"sv).name(), "owner"s);
	EXPECT_EQ(read_table(R"(["my table"])"sv).name(), "my table"s);
	EXPECT_EQ(read_table("[servers.alpha]"sv).name(), "servers.alpha"s);
	EXPECT_TRUE(read_table("[empty]"sv).key_values().empty());
}

TEST(TableTest, BadHeader)
{
	EXPECT_THROW(read_table("[]"sv), unexpected_token);
	EXPECT_THROW(read_table("[owner"sv), unexpected_token);
	EXPECT_THROW(read_table("[owner = 1]"sv), unexpected_token);
	EXPECT_THROW(read_table("owner]"sv), unexpected_token);
}

TEST(TableTest, Comments)
{
	const auto t = read_table("[t] # header\n# comment = [x, y]\na = 1 # trailing\n# b = 2\n"sv);
	ASSERT_EQ(t.key_values().size(), 1u);
	EXPECT_EQ(t.get_value("a").as_number(), 1.0);
	EXPECT_FALSE(t.contains_key("b"));
}

TEST(TableTest, StrayPunctuation)
{
	EXPECT_THROW(read_table("[t]\n= 1"sv), unexpected_token);
}

TEST(TableTest, Lookup)
{
	auto t = table{ "owner" };
	t.add("name", "Tom");
	t.add(key_value{ "age", 42 });

	EXPECT_TRUE(t.contains_key("name"));
	EXPECT_FALSE(t.contains_key("Name"));

	ASSERT_NE(t.try_get_value("age"), nullptr);
	EXPECT_EQ(t.try_get_value("age")->as_number(), 42.0);
	EXPECT_EQ(t.try_get_value("missing"), nullptr);

	EXPECT_EQ(t.get_value("name").as_text(), "Tom"s);
	EXPECT_THROW(t.get_value("missing"), missing_key);
	EXPECT_THROW(t.get_value("missing"), node_not_found);

	t.get_value("age") = value{ 43 };
	EXPECT_EQ(t.get_value("age").as_number(), 43.0);
}

TEST(TableTest, DefaultedLookup)
{
	auto t = table{ "t" };
	t.add("port", 8080);
	t.add("name", "server");

	EXPECT_EQ(t.get_value("port", 80), 8080);
	EXPECT_EQ(t.get_value("missing", 80), 80);
	EXPECT_EQ(t.get_value<std::string>("missing", "none"), "none"s);
	EXPECT_THROW(t.get_value("name", 0.0), wrong_type);
}

TEST(TableTest, DuplicateKeys)
{
	const auto permissive = read_table("[t]\na = 1\na = 2"sv);
	EXPECT_EQ(permissive.key_values().size(), 2u);
	EXPECT_EQ(permissive.get_value("a").as_number(), 1.0);
	EXPECT_EQ(permissive.key_values()[1].get().as_number(), 2.0);

	auto strict = parser_options{};
	strict.allow_duplicate_keys = false;
	EXPECT_NO_THROW(read_table("[t]\na = 1\nb = 2"sv, strict));

	try
	{
		read_table("[t]\na = 1\na = 2"sv, strict);
		FAIL() << "expected duplicate_element";
	}
	catch (const duplicate_element& e)
	{
		EXPECT_EQ(e.line(), 3u);
		EXPECT_EQ(e.column(), 1u);
	}
}

TEST(TableTest, ReadInline)
{
	const auto t = read_inline_table(R"({ x = 1, y = "two" })"sv, "point");
	EXPECT_EQ(t.name(), "point"s);
	ASSERT_EQ(t.key_values().size(), 2u);
	EXPECT_EQ(t.get_value("x").as_number(), 1.0);
	EXPECT_EQ(t.get_value("y").as_text(), "two"s);

	EXPECT_TRUE(read_inline_table("{}"sv).key_values().empty());
	EXPECT_EQ(read_inline_table("{ a = 1, }"sv).key_values().size(), 1u);
}

TEST(TableTest, ReadNestedInline)
{
	const auto t = read_inline_table("{ a = { b = [ 1, { c = 2 } ] } }"sv);
	const auto& a = t.get_value("a").as_table();
	EXPECT_EQ(a.name(), "a"s);

	const auto& b = a.get_value("b").as_array();
	ASSERT_EQ(b.size(), 2u);
	EXPECT_EQ(b[1].as_table().get_value("c").as_number(), 2.0);
}

TEST(TableTest, ReadInlineErrors)
{
	EXPECT_THROW(read_inline_table("{ x = 1"sv), unexpected_token);
	EXPECT_THROW(read_inline_table("{ x }"sv), unexpected_token);
	EXPECT_THROW(read_inline_table("{ = 1 }"sv), unexpected_token);
}

TEST(TableTest, Write)
{
	auto t = table{ "owner" };
	t.add("name", "Tom Preston-Werner");
	t.add("age", 42);
	EXPECT_EQ(t.to_string(), "\n[owner]\nname = \"Tom Preston-Werner\"\nage = 42\n"s);

	auto options = writer_options{};
	options.compact_spacing = true;
	EXPECT_EQ(t.to_string(options), "[owner]\nname=\"Tom Preston-Werner\"\nage=42\n"s);

	EXPECT_EQ(table{ "my table" }.to_string(), "\n[\"my table\"]\n"s);
}

TEST(TableTest, WriteInline)
{
	auto t = table{ "point" };
	t.add("x", 1);
	t.add("y", 2);

	auto strm = std::ostringstream{};
	t.write_inline(strm);
	EXPECT_EQ(strm.str(), "{ x = 1, y = 2 }"s);

	auto options = writer_options{};
	options.compact_spacing = true;
	auto compact = std::ostringstream{};
	t.write_inline(compact, options);
	EXPECT_EQ(compact.str(), "{x=1,y=2}"s);

	auto empty = std::ostringstream{};
	table{ "e" }.write_inline(empty);
	EXPECT_EQ(empty.str(), "{}"s);
}
