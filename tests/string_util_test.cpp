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

#include <chrono>
#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <variant>

#include "gtest/gtest.h"

#include "lean_toml/except.hpp"
#include "lean_toml/string_util.hpp"

using namespace lean_toml;
using namespace std::chrono_literals;
using namespace std::string_literals;
using namespace std::string_view_literals;

TEST(NumberTest, Parse)
{
	EXPECT_EQ(parse_number("8000"sv), 8000.0);
	EXPECT_EQ(parse_number("0"sv), 0.0);
	EXPECT_EQ(parse_number("-3213.777"sv), -3213.777);
	EXPECT_EQ(parse_number("+1_000"sv), 1000.0);
	EXPECT_EQ(parse_number("1e3"sv), 1000.0);
	EXPECT_EQ(parse_number("6.626e-34"sv), 6.626e-34);
	EXPECT_EQ(parse_number("224_617.445_991"sv), 224617.445991);
}

TEST(NumberTest, SpecialValues)
{
	EXPECT_EQ(parse_number("inf"sv), std::numeric_limits<double>::infinity());
	EXPECT_EQ(parse_number("+inf"sv), std::numeric_limits<double>::infinity());
	EXPECT_EQ(parse_number("-inf"sv), -std::numeric_limits<double>::infinity());

	const auto nan = parse_number("nan"sv);
	ASSERT_TRUE(nan);
	EXPECT_TRUE(std::isnan(*nan));
	EXPECT_TRUE(parse_number("-nan"sv));
}

TEST(NumberTest, Rejects)
{
	EXPECT_FALSE(parse_number(""sv));
	EXPECT_FALSE(parse_number("07"sv));
	EXPECT_FALSE(parse_number("1__0"sv));
	EXPECT_FALSE(parse_number("_1"sv));
	EXPECT_FALSE(parse_number("1_"sv));
	EXPECT_FALSE(parse_number("1."sv));
	EXPECT_FALSE(parse_number(".5"sv));
	EXPECT_FALSE(parse_number("1e"sv));
	EXPECT_FALSE(parse_number("abc"sv));
	EXPECT_FALSE(parse_number("Inf"sv));
	EXPECT_FALSE(parse_number("0_1"sv));
	EXPECT_FALSE(parse_number("1e5.0"sv));
}

TEST(NumberTest, LongDigitRuns)
{
	// too large for a double
	const auto ones = std::string(100'000, '1');
	EXPECT_FALSE(parse_number(ones));
	EXPECT_TRUE(std::holds_alternative<std::monostate>(parse_scalar(ones)));

	const auto small = "0."s + std::string(100'000, '0') + "1"s;
	EXPECT_FALSE(parse_number("0."s + std::string(100'000, '_')));
	EXPECT_NO_THROW(parse_number(small));
}

TEST(BooleanTest, Parse)
{
	EXPECT_EQ(parse_boolean("true"sv), true);
	EXPECT_EQ(parse_boolean("false"sv), false);
	EXPECT_FALSE(parse_boolean("True"sv));
	EXPECT_FALSE(parse_boolean("1"sv));
}

TEST(TimeSpanTest, Parse)
{
	EXPECT_EQ(parse_time_span("07:32:00"sv), 7h + 32min);
	EXPECT_EQ(parse_time_span("07:32"sv), 7h + 32min);
	EXPECT_EQ(parse_time_span("1:05"sv), 1h + 5min);
	EXPECT_EQ(parse_time_span("00:32:00.999999"sv), 32min + 999999us);
	EXPECT_EQ(parse_time_span("00:00:01.5"sv), 1500ms);
	EXPECT_EQ(parse_time_span("-1.12:30:00"sv), -(24h + 12h + 30min));
	EXPECT_EQ(parse_time_span("3.00:00"sv), 72h);
	EXPECT_EQ(parse_time_span("-00:00"sv), time_span::zero());
}

TEST(TimeSpanTest, Limits)
{
	EXPECT_EQ(parse_time_span("106751.00:00:00"sv), time_span{ 106751 * 24h });
	EXPECT_EQ(parse_time_span("106751.23:47:16.854775807"sv), time_span::max());
	EXPECT_EQ(parse_time_span("-106751.23:47:16.854775808"sv), time_span::min());
	EXPECT_FALSE(parse_time_span("106751.23:47:16.854775808"sv));
	EXPECT_FALSE(parse_time_span("-106751.23:47:16.854775809"sv));
	EXPECT_FALSE(parse_time_span("106752.00:00:00"sv));
	EXPECT_FALSE(parse_time_span(std::string(100'000, '1') + ".00:00"s));

	for (const auto span : { time_span::max(), time_span::min(), time_span{ 106751 * 24h } })
		EXPECT_EQ(parse_time_span(to_string(span)), span);
}

TEST(TimeSpanTest, Rejects)
{
	EXPECT_FALSE(parse_time_span("24:00:00"sv));
	EXPECT_FALSE(parse_time_span("12:60"sv));
	EXPECT_FALSE(parse_time_span("12:00:60"sv));
	EXPECT_FALSE(parse_time_span("123:00"sv));
	EXPECT_FALSE(parse_time_span("12:00:00.1234567890"sv));
	EXPECT_FALSE(parse_time_span("99999999999.00:00"sv));
	EXPECT_FALSE(parse_time_span("12"sv));
}

TEST(DateTimeTest, OffsetConvertedToUtc)
{
	const auto utc = date_time{ { 1979, 5, 27 }, { 7, 32, 0, 0 }, time_kind::utc };
	EXPECT_EQ(parse_offset_date_time("1979-05-27T07:32:00Z"sv), utc);
	EXPECT_EQ(parse_offset_date_time("1979-05-27 07:32:00z"sv), utc);
	EXPECT_EQ(parse_offset_date_time("1979-05-27T00:32:00-07:00"sv), utc);
	EXPECT_EQ(parse_offset_date_time("1979-05-27t09:02:00+01:30"sv), utc);

	const auto fraction = date_time{ { 1979, 5, 27 }, { 7, 32, 0, 999999000 }, time_kind::utc };
	EXPECT_EQ(parse_offset_date_time("1979-05-27T00:32:00.999999-07:00"sv), fraction);
}

TEST(DateTimeTest, OffsetCarriesAcrossDays)
{
	EXPECT_EQ(parse_offset_date_time("2000-02-28T23:30:00-01:00"sv),
		(date_time{ { 2000, 2, 29 }, { 0, 30, 0, 0 }, time_kind::utc }));
	EXPECT_EQ(parse_offset_date_time("2001-02-28T23:30:00-01:00"sv),
		(date_time{ { 2001, 3, 1 }, { 0, 30, 0, 0 }, time_kind::utc }));
	EXPECT_EQ(parse_offset_date_time("2000-01-01T00:30:00+01:00"sv),
		(date_time{ { 1999, 12, 31 }, { 23, 30, 0, 0 }, time_kind::utc }));
}

TEST(DateTimeTest, Local)
{
	EXPECT_EQ(parse_local_date_time("1979-05-27T07:32:00"sv),
		(date_time{ { 1979, 5, 27 }, { 7, 32, 0, 0 }, time_kind::local }));
	EXPECT_EQ(parse_local_date_time("1979-05-27T00:32:00.999999"sv),
		(date_time{ { 1979, 5, 27 }, { 0, 32, 0, 999999000 }, time_kind::local }));
	EXPECT_EQ(parse_local_date_time("1979-05-27"sv),
		(date_time{ { 1979, 5, 27 }, {}, time_kind::local }));
	EXPECT_EQ(parse_local_date_time("2000-02-29"sv),
		(date_time{ { 2000, 2, 29 }, {}, time_kind::local }));
}

TEST(DateTimeTest, Rejects)
{
	EXPECT_FALSE(parse_local_date_time("1979-05-27T07:32:00Z"sv));
	EXPECT_FALSE(parse_offset_date_time("1979-05-27T07:32:00"sv));
	EXPECT_FALSE(parse_offset_date_time("1979-05-27"sv));
	EXPECT_FALSE(parse_local_date_time("1979-13-01"sv));
	EXPECT_FALSE(parse_local_date_time("1979-02-30"sv));
	EXPECT_FALSE(parse_local_date_time("2001-02-29"sv));
	EXPECT_FALSE(parse_local_date_time("1979-05-27T25:00:00"sv));
	EXPECT_FALSE(parse_local_date_time("1979-05-27T07:32"sv));
	EXPECT_FALSE(parse_offset_date_time("1979-05-27T07:32:00+24:00"sv));
	EXPECT_FALSE(parse_local_date_time("79-05-27"sv));
}

TEST(DateTimeTest, LongFraction)
{
	const auto digits = std::string(200'000, '1');
	EXPECT_EQ(parse_local_date_time("1979-05-27T07:32:00."s + digits),
		(date_time{ { 1979, 5, 27 }, { 7, 32, 0, 111111111 }, time_kind::local }));
	EXPECT_EQ(parse_offset_date_time("1979-05-27T07:32:00."s + digits + "Z"s),
		(date_time{ { 1979, 5, 27 }, { 7, 32, 0, 111111111 }, time_kind::utc }));
	EXPECT_TRUE(std::holds_alternative<std::monostate>(
		parse_scalar("1979-05-27T07:32:00."s + digits + "x"s)));
}

TEST(ScalarTest, InferenceOrder)
{
	EXPECT_TRUE(std::holds_alternative<double>(parse_scalar("1979"sv)));
	EXPECT_TRUE(std::holds_alternative<bool>(parse_scalar("false"sv)));
	EXPECT_TRUE(std::holds_alternative<time_span>(parse_scalar("07:32"sv)));
	EXPECT_TRUE(std::holds_alternative<date_time>(parse_scalar("1979-05-27"sv)));
	EXPECT_TRUE(std::holds_alternative<date_time>(parse_scalar("1979-05-27T07:32:00-08:00"sv)));
	EXPECT_TRUE(std::holds_alternative<std::monostate>(parse_scalar("hello"sv)));
	EXPECT_TRUE(std::holds_alternative<std::monostate>(parse_scalar("10.0.0.1"sv)));
}

TEST(StringUtilTest, Trim)
{
	EXPECT_EQ(trim("  a b \t"sv), "a b"sv);
	EXPECT_EQ(trim("abc"sv), "abc"sv);
	EXPECT_EQ(trim(" \t "sv), ""sv);
}

TEST(WriteTest, Numbers)
{
	EXPECT_EQ(to_string(8000.0), "8000"s);
	EXPECT_EQ(to_string(-3213.777), "-3213.777"s);
	EXPECT_EQ(to_string(0.1), "0.1"s);
	EXPECT_EQ(to_string(std::numeric_limits<double>::infinity()), "inf"s);
	EXPECT_EQ(to_string(-std::numeric_limits<double>::infinity()), "-inf"s);
	EXPECT_EQ(to_string(std::numeric_limits<double>::quiet_NaN()), "nan"s);
}

TEST(WriteTest, Booleans)
{
	EXPECT_EQ(to_string(true), "true"s);
	EXPECT_EQ(to_string(false), "false"s);
}

TEST(WriteTest, DateTimes)
{
	const auto utc = date_time{ { 1979, 5, 27 }, { 7, 32, 0, 0 }, time_kind::utc };
	EXPECT_EQ(to_string(utc), "1979-05-27T07:32:00Z"s);

	const auto local = date_time{ { 1979, 5, 27 }, { 0, 32, 0, 999999000 }, time_kind::local };
	EXPECT_EQ(to_string(local, writer_options::date_time_separator_t::whitespace),
		"1979-05-27 00:32:00.999999"s);
}

TEST(WriteTest, InvalidDateTimes)
{
	const auto valid = date_time{ { 1979, 5, 27 }, { 7, 32, 0, 0 }, time_kind::utc };

	auto dt = valid;
	dt.date.year = 10000;
	EXPECT_THROW(to_string(dt), toml_error);

	dt = valid;
	dt.date.month = 13;
	EXPECT_THROW(to_string(dt), toml_error);

	dt = valid;
	dt.date.month = 2;
	dt.date.day = 30;
	EXPECT_THROW(to_string(dt), toml_error);

	dt = valid;
	dt.time.hours = 24;
	EXPECT_THROW(to_string(dt), toml_error);

	dt = valid;
	dt.time.nanoseconds = 1'000'000'000;
	EXPECT_THROW(to_string(dt), toml_error);
}

TEST(WriteTest, TimeSpans)
{
	EXPECT_EQ(to_string(time_span{ 7h + 32min }), "07:32:00"s);
	EXPECT_EQ(to_string(time_span{ -(24h + 12h + 30min) }), "-1.12:30:00"s);
	EXPECT_EQ(to_string(time_span{ 32min + 999999us }), "00:32:00.999999"s);
	EXPECT_EQ(to_string(time_span{}), "00:00:00"s);
	EXPECT_EQ(to_string(time_span::min()), "-106751.23:47:16.854775808"s);
}

TEST(WriteTest, LongDigitText)
{
	const auto ones = std::string(100'000, '1');
	EXPECT_EQ(quote_toml_text(ones), ones);
}

TEST(WriteTest, Names)
{
	EXPECT_EQ(quote_toml_name("title"sv), "title"s);
	EXPECT_EQ(quote_toml_name("8000"sv), "8000"s);
	EXPECT_EQ(quote_toml_name("my key"sv), "\"my key\""s);
	EXPECT_EQ(quote_toml_name(""sv), "\"\""s);
	EXPECT_EQ(quote_toml_name("a=b"sv), "\"a=b\""s);
	EXPECT_EQ(quote_toml_name("servers.alpha"sv), "servers.alpha"s);
}

TEST(WriteTest, Text)
{
	EXPECT_EQ(quote_toml_text("red"sv), "red"s);
	EXPECT_EQ(quote_toml_text("TOML Example"sv), "\"TOML Example\""s);
	EXPECT_EQ(quote_toml_text("true"sv), "\"true\""s);
	EXPECT_EQ(quote_toml_text("8000"sv), "\"8000\""s);
	EXPECT_EQ(quote_toml_text("07:32"sv), "\"07:32\""s);
	EXPECT_EQ(quote_toml_text("a,b"sv), "\"a,b\""s);
	EXPECT_EQ(quote_toml_text(R"(say "hi")"sv), R"('say "hi"')"s);
	EXPECT_THROW(quote_toml_text(R"(it's "quoted")"sv), toml_error);
}
