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

#include "lean_toml/string_util.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>

#include "lean_toml/except.hpp"

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace lean_toml
{
	namespace
	{
		enum class match_index
		{
			date = 1,
			year,
			month,
			day,
			time_part,
			time,
			hours,
			minutes,
			seconds,
			seconds_frac,
			offset,
			off_z,
			off_sign,
			off_hours,
			off_minutes
		};

		enum class span_index
		{
			sign = 1,
			days,
			hours,
			minutes,
			seconds,
			seconds_frac
		};

		using reg_matches = std::match_results<std::string_view::iterator>;
		using sub_match = reg_matches::value_type;

		constexpr auto nanoseconds_per_second = std::uint64_t{ 1'000'000'000 };
		constexpr auto nanoseconds_per_minute = nanoseconds_per_second * 60;
		constexpr auto nanoseconds_per_hour = nanoseconds_per_minute * 60;
		constexpr auto nanoseconds_per_day = nanoseconds_per_hour * 24;
		constexpr auto minutes_per_day = std::int64_t{ 24 * 60 };
		// magnitude of time_span::max(), time_span::min() reaches one further
		constexpr auto max_span_nanoseconds = static_cast<std::uint64_t>(
			std::numeric_limits<time_span::rep>::max());
		constexpr auto max_span_days = max_span_nanoseconds / nanoseconds_per_day;
		// YYYY-MM-DDTHH:MM:SS.
		constexpr auto fraction_start = std::size_t{ 20 };
		constexpr auto max_fraction_digits = std::size_t{ 9 };

		const auto date_time_reg = std::regex{
			R"(^((\d{4})-(\d{2})-(\d{2}))([Tt ]((\d{2}):(\d{2}):(\d{2})(?:\.(\d{1,9}))?)(([Zz])|([\+\-])(\d{2}):(\d{2}))?)?$)" };
		const auto time_span_reg = std::regex{
			R"(^(\-)?(?:(\d{1,6})\.)?(\d{1,2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?$)" };

		template<typename Index>
		const sub_match& get_match(const reg_matches& matches, Index i)
		{
			return matches[static_cast<std::size_t>(i)];
		}

		template<typename Integer>
		bool read_integer(const sub_match& match, Integer& out) noexcept
		{
			if (!match.matched || match.length() == 0)
				return false;
			const auto first = &*match.first;
			const auto last = first + match.length();
			const auto ret = std::from_chars(first, last, out);
			return ret.ec == std::errc{} && ret.ptr == last;
		}

		constexpr bool digit(char ch) noexcept
		{
			return ch >= '0' && ch <= '9';
		}

		// consumes \d(_?\d)* from the front of str
		bool consume_digits(std::string_view& str) noexcept
		{
			if (empty(str) || !digit(str.front()))
				return false;

			auto i = std::size_t{ 1 };
			while (i < size(str))
			{
				if (digit(str[i]))
					++i;
				else if (str[i] == '_' && i + 1 < size(str) && digit(str[i + 1]))
					i += 2;
				else
					break;
			}

			str.remove_prefix(i);
			return true;
		}

		// [+-]?(0|[1-9](_?\d)*)(\.\d(_?\d)*)?([eE][+-]?\d(_?\d)*)?
		bool number_string(std::string_view str) noexcept
		{
			if (!empty(str) && (str.front() == '+' || str.front() == '-'))
				str.remove_prefix(1);

			// no leading zeros
			if (!empty(str) && str.front() == '0')
				str.remove_prefix(1);
			else if (!consume_digits(str))
				return false;

			if (!empty(str) && str.front() == '.')
			{
				str.remove_prefix(1);
				if (!consume_digits(str))
					return false;
			}

			if (!empty(str) && (str.front() == 'e' || str.front() == 'E'))
			{
				str.remove_prefix(1);
				if (!empty(str) && (str.front() == '+' || str.front() == '-'))
					str.remove_prefix(1);
				if (!consume_digits(str))
					return false;
			}

			return empty(str);
		}

		// drops fractional second digits past the ninth,
		// date_time_reg only accepts nine
		std::string truncate_fraction(std::string_view str)
		{
			auto out = std::string{ str };
			if (size(str) <= fraction_start + max_fraction_digits || str[fraction_start - 1] != '.')
				return out;

			auto last = fraction_start;
			while (last < size(str) && digit(str[last]))
				++last;

			if (last - fraction_start > max_fraction_digits)
			{
				const auto first_dropped = fraction_start + max_fraction_digits;
				out.erase(first_dropped, last - first_dropped);
			}
			return out;
		}

		// digits past the ninth are truncated
		std::uint32_t read_fraction(const sub_match& match) noexcept
		{
			if (!match.matched)
				return {};

			auto out = std::uint32_t{};
			auto scale = std::uint32_t{ 100'000'000 };
			const auto digits = std::min<std::ptrdiff_t>(match.length(), 9);
			for (auto iter = match.first; iter != match.first + digits; ++iter)
			{
				out += static_cast<std::uint32_t>(*iter - '0') * scale;
				scale /= 10;
			}
			return out;
		}

		constexpr bool is_leap_year(std::int64_t y) noexcept
		{
			return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
		}

		constexpr unsigned days_in_month(std::int64_t y, unsigned m) noexcept
		{
			constexpr auto days = std::array<unsigned, 12>{ 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
			if (m == 2 && is_leap_year(y))
				return 29;
			return days[m - 1];
		}

		struct civil
		{
			std::int64_t year;
			unsigned month, day;
		};

		// days since 1970-01-01 in the proleptic gregorian calendar
		// see: http://howardhinnant.github.io/date_algorithms.html
		constexpr std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) noexcept
		{
			y -= m <= 2;
			const auto era = (y >= 0 ? y : y - 399) / 400;
			const auto yoe = static_cast<unsigned>(y - era * 400);
			const auto doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
			const auto doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
			return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
		}

		constexpr civil civil_from_days(std::int64_t z) noexcept
		{
			z += 719468;
			const auto era = (z >= 0 ? z : z - 146096) / 146097;
			const auto doe = static_cast<unsigned>(z - era * 146097);
			const auto yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
			const auto y = static_cast<std::int64_t>(yoe) + era * 400;
			const auto doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
			const auto mp = (5 * doy + 2) / 153;
			const auto d = doy - (153 * mp + 2) / 5 + 1;
			const auto m = mp < 10 ? mp + 3 : mp - 9;
			return civil{ y + (m <= 2), m, d };
		}

		static_assert(days_from_civil(1970, 1, 1) == 0);
		static_assert(days_from_civil(2000, 3, 1) == 11017);

		std::optional<date> fill_date(const reg_matches& matches) noexcept
		{
			auto out = date{};
			if (!read_integer(get_match(matches, match_index::year), out.year) ||
				!read_integer(get_match(matches, match_index::month), out.month) ||
				!read_integer(get_match(matches, match_index::day), out.day))
				return {};

			if (out.month < 1 || out.month > 12)
				return {};
			if (out.day < 1 || out.day > days_in_month(out.year, out.month))
				return {};
			return out;
		}

		std::optional<time> fill_time(const reg_matches& matches) noexcept
		{
			auto out = time{};
			if (!get_match(matches, match_index::time).matched)
				return out;

			if (!read_integer(get_match(matches, match_index::hours), out.hours) ||
				!read_integer(get_match(matches, match_index::minutes), out.minutes) ||
				!read_integer(get_match(matches, match_index::seconds), out.seconds))
				return {};

			if (out.hours > 23 || out.minutes > 59 || out.seconds > 59)
				return {};

			out.nanoseconds = read_fraction(get_match(matches, match_index::seconds_frac));
			return out;
		}

		// removes underscores and leading positive signs from sv
		std::string remove_underscores(std::string_view sv)
		{
			auto str = std::string{ sv };
			str.erase(std::remove(begin(str), end(str), '_'), end(str));
			if (!empty(str) && str.front() == '+')
				str.erase(begin(str));
			return str;
		}

		std::string fraction_string(std::uint64_t nanoseconds)
		{
			nanoseconds = std::min(nanoseconds, nanoseconds_per_second - 1);
			if (nanoseconds == 0)
				return {};

			auto digits = std::to_string(nanoseconds);
			digits.insert(0, 9 - size(digits), '0');
			digits.erase(digits.find_last_not_of('0') + 1);
			return "."s + digits;
		}

		bool needs_quotes(std::string_view str) noexcept
		{
			if (empty(str))
				return true;

			constexpr auto special_chars = " \t\r\n#=,[]{}\"'"sv;
			return str.find_first_of(special_chars) != std::string_view::npos;
		}

		std::string add_quotes(std::string_view str)
		{
			if (str.find('"') == std::string_view::npos)
				return "\""s + std::string{ str } + "\""s;
			if (str.find('\'') == std::string_view::npos)
				return "'"s + std::string{ str } + "'"s;

			throw toml_error{ "Cannot write text containing both ' and \" characters: "s + std::string{ str } };
		}
	}

	std::optional<double> parse_number(std::string_view str)
	{
		//	inf, +inf, -inf
		if (str == "inf"sv || str == "+inf"sv)
			return std::numeric_limits<double>::infinity();
		if (str == "-inf"sv)
			return -std::numeric_limits<double>::infinity();
		//	nan, +nan, -nan
		if (str == "nan"sv || str == "+nan"sv || str == "-nan"sv)
			return std::numeric_limits<double>::quiet_NaN();

		if (!number_string(str))
			return {};

		const auto string = remove_underscores(str);
		auto value = double{};
		const auto string_end = string.data() + size(string);
		const auto ret = std::from_chars(string.data(), string_end, value);
		if (ret.ec == std::errc{} && ret.ptr == string_end)
			return value;

		// out of range values are left as text
		return {};
	}

	std::optional<bool> parse_boolean(std::string_view str) noexcept
	{
		if (str == "true"sv)
			return true;
		if (str == "false"sv)
			return false;
		return {};
	}

	std::optional<time_span> parse_time_span(std::string_view str)
	{
		auto matches = reg_matches{};
		if (!std::regex_match(begin(str), end(str), matches, time_span_reg))
			return {};

		auto days = std::uint64_t{};
		const auto& days_match = get_match(matches, span_index::days);
		if (days_match.matched && !read_integer(days_match, days))
			return {};
		if (days > max_span_days)
			return {};

		auto hours = std::uint64_t{},
			minutes = std::uint64_t{},
			seconds = std::uint64_t{};

		if (!read_integer(get_match(matches, span_index::hours), hours) ||
			!read_integer(get_match(matches, span_index::minutes), minutes))
			return {};

		const auto& seconds_match = get_match(matches, span_index::seconds);
		if (seconds_match.matched && !read_integer(seconds_match, seconds))
			return {};

		if (hours > 23 || minutes > 59 || seconds > 59)
			return {};

		// cannot overflow, max_span_days plus a day is still below 2^64 nanoseconds
		const auto total = days * nanoseconds_per_day +
			hours * nanoseconds_per_hour +
			minutes * nanoseconds_per_minute +
			seconds * nanoseconds_per_second +
			read_fraction(get_match(matches, span_index::seconds_frac));

		const auto negative = get_match(matches, span_index::sign).matched;
		if (total > max_span_nanoseconds + (negative ? 1 : 0))
			return {};

		if (!negative)
			return time_span{ static_cast<time_span::rep>(total) };
		if (total == 0)
			return time_span::zero();
		// time_span::min() has no positive counterpart
		return time_span{ -static_cast<time_span::rep>(total - 1) - 1 };
	}

	std::optional<date_time> parse_offset_date_time(std::string_view str)
	{
		const auto shortened = truncate_fraction(str);
		const auto text = std::string_view{ shortened };
		auto matches = reg_matches{};
		if (!std::regex_match(begin(text), end(text), matches, date_time_reg) ||
			!get_match(matches, match_index::offset).matched)
			return {};

		const auto d = fill_date(matches);
		const auto t = fill_time(matches);
		if (!d || !t)
			return {};

		auto offset_minutes = std::int64_t{};
		if (!get_match(matches, match_index::off_z).matched)
		{
			auto off_hours = unsigned{},
				off_minutes = unsigned{};
			if (!read_integer(get_match(matches, match_index::off_hours), off_hours) ||
				!read_integer(get_match(matches, match_index::off_minutes), off_minutes))
				return {};

			if (off_hours > 23 || off_minutes > 59)
				return {};

			offset_minutes = off_hours * 60 + off_minutes;
			if (*get_match(matches, match_index::off_sign).first == '-')
				offset_minutes = -offset_minutes;
		}

		// shift into utc, the offset is always less than a day
		auto minutes = std::int64_t{ t->hours } * 60 + t->minutes - offset_minutes;
		auto days = days_from_civil(d->year, d->month, d->day);
		if (minutes < 0)
		{
			minutes += minutes_per_day;
			--days;
		}
		else if (minutes >= minutes_per_day)
		{
			minutes -= minutes_per_day;
			++days;
		}

		const auto utc_date = civil_from_days(days);
		if (utc_date.year < 0 || utc_date.year > 9999)
			return {};

		auto out = date_time{};
		out.date = date{
			static_cast<std::uint16_t>(utc_date.year),
			static_cast<std::uint8_t>(utc_date.month),
			static_cast<std::uint8_t>(utc_date.day)
		};
		out.time = *t;
		out.time.hours = static_cast<std::uint8_t>(minutes / 60);
		out.time.minutes = static_cast<std::uint8_t>(minutes % 60);
		out.kind = time_kind::utc;
		return out;
	}

	std::optional<date_time> parse_local_date_time(std::string_view str)
	{
		const auto shortened = truncate_fraction(str);
		const auto text = std::string_view{ shortened };
		auto matches = reg_matches{};
		if (!std::regex_match(begin(text), end(text), matches, date_time_reg) ||
			get_match(matches, match_index::offset).matched)
			return {};

		const auto d = fill_date(matches);
		const auto t = fill_time(matches);
		if (!d || !t)
			return {};

		return date_time{ *d, *t, time_kind::local };
	}

	scalar_t parse_scalar(std::string_view str)
	{
		if (const auto number = parse_number(str))
			return scalar_t{ std::in_place_type<double>, *number };
		if (const auto boolean = parse_boolean(str))
			return scalar_t{ std::in_place_type<bool>, *boolean };
		if (const auto span = parse_time_span(str))
			return scalar_t{ std::in_place_type<time_span>, *span };
		if (const auto dt = parse_offset_date_time(str))
			return scalar_t{ std::in_place_type<date_time>, *dt };
		if (const auto dt = parse_local_date_time(str))
			return scalar_t{ std::in_place_type<date_time>, *dt };
		return {};
	}

	std::string_view trim(std::string_view str) noexcept
	{
		constexpr auto whitespace = " \t"sv;
		const auto first = str.find_first_not_of(whitespace);
		if (first == std::string_view::npos)
			return {};
		const auto last = str.find_last_not_of(whitespace);
		return str.substr(first, last - first + 1);
	}

	std::string to_string(double d)
	{
		if (std::isnan(d))
			return "nan"s;
		if (std::isinf(d))
			return d < 0 ? "-inf"s : "inf"s;

		auto buffer = std::array<char, 32>{};
		const auto ret = std::to_chars(buffer.data(), buffer.data() + size(buffer), d);
		if (ret.ec != std::errc{})
			throw toml_error{ "Unable to convert number to string"s };
		return std::string(buffer.data(), ret.ptr);
	}

	std::string to_string(bool b)
	{
		return b ? "true"s : "false"s;
	}

	std::string to_string(const date_time& dt, writer_options::date_time_separator_t sep)
	{
		const auto& d = dt.date;
		const auto& t = dt.time;
		if (d.year > 9999 || d.month < 1 || d.month > 12 ||
			d.day < 1 || d.day > days_in_month(d.year, d.month) ||
			t.hours > 23 || t.minutes > 59 || t.seconds > 59 ||
			t.nanoseconds >= nanoseconds_per_second)
			throw toml_error{ "Cannot write an invalid date-time"s };

		auto out = std::ostringstream{};
		out << std::setfill('0')
			<< std::setw(4) << dt.date.year << '-'
			<< std::setw(2) << static_cast<unsigned>(dt.date.month) << '-'
			<< std::setw(2) << static_cast<unsigned>(dt.date.day);

		out << (sep == writer_options::date_time_separator_t::big_t ? 'T' : ' ');

		out << std::setw(2) << static_cast<unsigned>(dt.time.hours) << ':'
			<< std::setw(2) << static_cast<unsigned>(dt.time.minutes) << ':'
			<< std::setw(2) << static_cast<unsigned>(dt.time.seconds)
			<< fraction_string(dt.time.nanoseconds);

		if (dt.kind == time_kind::utc)
			out << 'Z';
		return out.str();
	}

	std::string to_string(time_span span)
	{
		const auto count = span.count();
		auto out = std::ostringstream{};
		auto ns = static_cast<std::uint64_t>(count);
		if (count < 0)
		{
			out << '-';
			ns = 0 - ns;
		}

		const auto days = ns / nanoseconds_per_day;
		ns %= nanoseconds_per_day;
		if (days != 0)
			out << days << '.';

		const auto hours = ns / nanoseconds_per_hour;
		ns %= nanoseconds_per_hour;
		const auto minutes = ns / nanoseconds_per_minute;
		ns %= nanoseconds_per_minute;
		const auto seconds = ns / nanoseconds_per_second;
		ns %= nanoseconds_per_second;

		out << std::setfill('0')
			<< std::setw(2) << hours << ':'
			<< std::setw(2) << minutes << ':'
			<< std::setw(2) << seconds
			<< fraction_string(ns);
		return out.str();
	}

	std::string quote_toml_name(std::string_view str)
	{
		if (needs_quotes(str))
			return add_quotes(str);
		return std::string{ str };
	}

	std::string quote_toml_text(std::string_view str)
	{
		if (needs_quotes(str) || parse_scalar(str).index() != 0)
			return add_quotes(str);
		return std::string{ str };
	}
}
