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

#ifndef LEAN_TOML_ARRAY_HPP
#define LEAN_TOML_ARRAY_HPP

#include <cstddef>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "lean_toml/internal.hpp"
#include "lean_toml/types.hpp"
#include "lean_toml/value.hpp"

namespace lean_toml
{
	class token_reader;

	// Ordered sequence of values, elements can be of mixed types.
	class array
	{
	public:
		using container_t = std::vector<value>;
		using iterator = container_t::iterator;
		using const_iterator = container_t::const_iterator;

		array();
		explicit array(container_t values);
		array(std::initializer_list<double> numbers);

		template<typename Range, std::enable_if_t<detail::is_number_range_v<Range>, int> = 0>
		explicit array(const Range& numbers) : array{}
		{
			for (const auto& n : numbers)
				_values.emplace_back(static_cast<double>(n));
			return;
		}

		void push_back(value v);

		template<typename... Args>
		value& emplace_back(Args&&... args)
		{
			return _values.emplace_back(std::forward<Args>(args)...);
		}

		value& operator[](std::size_t i) noexcept
		{
			return _values[i];
		}

		const value& operator[](std::size_t i) const noexcept
		{
			return _values[i];
		}

		// throws std::out_of_range
		value& at(std::size_t);
		const value& at(std::size_t) const;

		std::size_t size() const noexcept
		{
			return _values.size();
		}

		bool empty() const noexcept
		{
			return _values.empty();
		}

		iterator begin() noexcept
		{
			return _values.begin();
		}

		iterator end() noexcept
		{
			return _values.end();
		}

		const_iterator begin() const noexcept
		{
			return _values.begin();
		}

		const_iterator end() const noexcept
		{
			return _values.end();
		}

		// Reads [ value, value, ... ]
		// trailing and repeated commas are accepted
		static array read(token_reader&, const parser_options&);

		// [ a, b, c ]
		void write(std::ostream&, const writer_options& = {}) const;
		std::string to_string(const writer_options& = {}) const;

	private:
		container_t _values;
	};

	std::ostream& operator<<(std::ostream&, const array&);
}

#endif // !LEAN_TOML_ARRAY_HPP
