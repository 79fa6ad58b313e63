// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "StringStrip.hxx"
#include "UnicodeWhitespace.hxx"

std::string_view
StripLeft(std::string_view s) noexcept
{
	while (const std::size_t n = WhitespacePrefixUTF8(s))
		s.remove_prefix(n);

	return s;
}

std::string_view
StripRight(std::string_view s) noexcept
{
	while (const std::size_t n = WhitespaceSuffixUTF8(s))
		s.remove_suffix(n);

	return s;
}

std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}
