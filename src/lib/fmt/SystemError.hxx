// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <fmt/core.h>

#include <system_error> // IWYU pragma: export

#include <errno.h>

[[nodiscard]] [[gnu::pure]]
std::system_error
VFmtSystemError(std::error_code code,
		fmt::string_view format_str, fmt::format_args args) noexcept;

/**
 * Returns a std::system_error for the given "errno" value, with a
 * message formatted by {fmt}.  Throw the return value.
 */
template<typename S, typename... Args>
[[nodiscard]]
std::system_error
FmtErrno(int code, const S &format_str, Args&&... args) noexcept
{
	return VFmtSystemError(std::error_code(code, std::system_category()),
			       format_str, fmt::make_format_args(args...));
}

/**
 * Like the other FmtErrno() overload, but uses the current "errno"
 * value.
 */
template<typename S, typename... Args>
[[nodiscard]]
std::system_error
FmtErrno(const S &format_str, Args&&... args) noexcept
{
	return FmtErrno(errno, format_str, args...);
}
