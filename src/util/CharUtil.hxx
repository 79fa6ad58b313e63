// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

/**
 * Is this an ASCII whitespace character (space, horizontal tab, line
 * feed, vertical tab, form feed or carriage return)?
 */
constexpr bool
IsWhitespaceNotNull(const char ch) noexcept
{
	return ch == ' ' || (ch >= '\t' && ch <= '\r');
}
