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

#ifndef LEAN_TOML_INTERNAL_HPP
#define LEAN_TOML_INTERNAL_HPP

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "lean_toml/types.hpp"

namespace lean_toml
{
	namespace detail
	{
		// Trait for iterable ranges (excluding string).
		template<typename Range, typename = void>
		constexpr auto is_range_v = false;
		template<typename Range>
		constexpr auto is_range_v<Range,
			std::void_t<
			decltype(std::declval<Range>().begin()),
			decltype(std::declval<Range>().end())
			>
		> = !std::is_same_v<std::decay_t<Range>, std::string> &&
			!std::is_same_v<std::decay_t<Range>, std::string_view>;

		// Trait for arithmetic types, exluding bool.
		template<typename Number>
		constexpr auto is_number_v = std::is_arithmetic_v<Number> &&
			!std::is_same_v<Number, bool>;

		// Trait for ranges of numbers
		template<typename Range, typename = void>
		constexpr auto is_number_range_v = false;
		template<typename Range>
		constexpr auto is_number_range_v<Range,
			std::enable_if_t<is_range_v<Range>>
		> = is_number_v<std::decay_t<decltype(*std::declval<Range>().begin())>>;

		// Scalar types that a value can be extracted as
		template<typename T>
		constexpr auto is_toml_type = std::is_same_v<T, double> ||
			std::is_same_v<T, bool> ||
			std::is_same_v<T, std::string> ||
			std::is_same_v<T, date_time> ||
			std::is_same_v<T, time_span>;
	}
}

#endif
