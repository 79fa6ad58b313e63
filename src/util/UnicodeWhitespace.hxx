// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <string_view>

/**
 * Does this code point have the Unicode "White_Space" property?
 */
constexpr bool
IsUnicodeWhitespace(char32_t ch) noexcept
{
	switch (ch) {
	case 0x09: case 0x0a: case 0x0b: case 0x0c: case 0x0d:
	case 0x20:
	case 0x85:
	case 0xa0:
	case 0x1680:
	case 0x2028: case 0x2029:
	case 0x202f:
	case 0x205f:
	case 0x3000:
		return true;

	default:
		return ch >= 0x2000 && ch <= 0x200a;
	}
}

/**
 * If the UTF-8 string begins with a whitespace character (see
 * IsUnicodeWhitespace()), return its length in bytes, otherwise 0.
 * Malformed sequences are never whitespace.
 */
[[gnu::pure]]
std::size_t
WhitespacePrefixUTF8(std::string_view s) noexcept;

/**
 * Like WhitespacePrefixUTF8(), but check the last character.
 */
[[gnu::pure]]
std::size_t
WhitespaceSuffixUTF8(std::string_view s) noexcept;
