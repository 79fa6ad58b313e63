// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <iterator>
#include <string_view>

/**
 * Split a string at a certain separator character into sub strings
 * and allow iterating over the segments.
 *
 * Two consecutive separator characters result in an empty string.
 *
 * An empty input results in no segments at all, and a trailing
 * separator does not produce a trailing empty segment.
 *
 * This class has no dynamic allocations; the segments are views into
 * the input string.
 */
template<typename T>
class BasicIterableSplitString {
	using string_view = std::basic_string_view<T>;
	using value_type = typename string_view::value_type;

	string_view s;
	value_type separator;

public:
	constexpr BasicIterableSplitString(string_view _s,
					   value_type _separator) noexcept
		:s(_s), separator(_separator) {}

	class Iterator final {
		friend class BasicIterableSplitString;

		string_view current, rest;

		T separator;

		constexpr Iterator(string_view _s, T _separator) noexcept
			:rest(_s.empty() ? string_view{} : _s),
			 separator(_separator)
		{
			Next();
		}

		constexpr Iterator(std::nullptr_t) noexcept
			:separator(0) {}

		constexpr void Next() noexcept {
			if (rest.data() == nullptr) {
				/* end of string */
				current = {};
				return;
			}

			const auto i = rest.find(separator);
			if (i == string_view::npos) {
				current = rest;
				rest = {};
			} else {
				current = rest.substr(0, i);
				rest = rest.substr(i + 1);

				/* a trailing separator does not
				   start another (empty) segment */
				if (rest.empty())
					rest = {};
			}
		}

	public:
		using iterator_category = std::forward_iterator_tag;
		using value_type = string_view;
		using difference_type = std::ptrdiff_t;
		using pointer = const value_type *;
		using reference = const value_type &;

		constexpr Iterator &operator++() noexcept {
			Next();
			return *this;
		}

		constexpr bool operator==(const Iterator &other) const noexcept {
			return current.data() == other.current.data() &&
				current.size() == other.current.size();
		}

		constexpr bool operator!=(const Iterator &other) const noexcept {
			return !(*this == other);
		}

		constexpr reference operator*() const noexcept {
			return current;
		}

		constexpr pointer operator->() const noexcept {
			return &current;
		}
	};

	using iterator = Iterator;
	using const_iterator = Iterator;

	constexpr const_iterator begin() const noexcept {
		return {s, separator};
	}

	constexpr const_iterator end() const noexcept {
		return {nullptr};
	}
};

using IterableSplitString = BasicIterableSplitString<char>;
