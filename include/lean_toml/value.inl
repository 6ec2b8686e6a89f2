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

#include "lean_toml/value.hpp"

#include <type_traits>

#include "lean_toml/except.hpp"

namespace lean_toml
{
	template<typename T>
	T value::as_type() const
	{
		static_assert(detail::is_toml_type<T> || detail::is_number_v<T>,
			"as_type can only be used for scalar toml types");

		if constexpr (std::is_same_v<T, std::string>)
			return as_text();
		else if constexpr (std::is_same_v<T, bool>)
			return as_boolean();
		else if constexpr (std::is_same_v<T, date_time>)
			return as_date_time();
		else if constexpr (std::is_same_v<T, time_span>)
			return as_time_span();
		else
			return static_cast<T>(as_number());
	}
}
