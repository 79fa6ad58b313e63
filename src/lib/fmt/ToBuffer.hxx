// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <fmt/core.h>

#include <cstddef>

/**
 * A fixed-size buffer holding a null-terminated string formatted by
 * {fmt}.  Output which does not fit is truncated.
 */
template<std::size_t size>
class StringBuffer {
	char buffer[size];

public:
	using value_type = char;
	using pointer = char *;
	using const_pointer = const char *;

	constexpr pointer data() noexcept {
		return buffer;
	}

	constexpr const_pointer c_str() const noexcept {
		return buffer;
	}

	static constexpr std::size_t capacity() noexcept {
		return size;
	}
};

template<std::size_t size>
[[nodiscard]] [[gnu::pure]]
auto
VFmtBuffer(fmt::string_view format_str, fmt::format_args args) noexcept
{
	StringBuffer<size> buffer;
	const auto result = fmt::vformat_to_n(buffer.data(),
					      buffer.capacity() - 1,
					      format_str, args);
	*result.out = 0;
	return buffer;
}

template<std::size_t size, typename S, typename... Args>
[[nodiscard]] [[gnu::pure]]
auto
FmtBuffer(const S &format_str, Args&&... args) noexcept
{
	return VFmtBuffer<size>(format_str, fmt::make_format_args(args...));
}
