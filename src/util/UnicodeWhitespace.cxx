// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "UnicodeWhitespace.hxx"
#include "CharUtil.hxx"

static constexpr bool
IsContinuation(unsigned char ch) noexcept
{
	return (ch & 0xc0) == 0x80;
}

/**
 * Decode the first character of a UTF-8 string.
 *
 * @param length_r on success, receives the length of the sequence
 * @return the code point or 0 if the sequence is malformed
 */
static char32_t
DecodeUTF8(std::string_view s, std::size_t &length_r) noexcept
{
	const auto *p = reinterpret_cast<const unsigned char *>(s.data());

	if (s.size() >= 2 && (p[0] & 0xe0) == 0xc0 && IsContinuation(p[1])) {
		const char32_t ch = ((p[0] & 0x1f) << 6) | (p[1] & 0x3f);
		if (ch < 0x80)
			/* overlong */
			return 0;

		length_r = 2;
		return ch;
	}

	if (s.size() >= 3 && (p[0] & 0xf0) == 0xe0 &&
	    IsContinuation(p[1]) && IsContinuation(p[2])) {
		const char32_t ch = ((p[0] & 0x0f) << 12) |
			((p[1] & 0x3f) << 6) | (p[2] & 0x3f);
		if (ch < 0x800)
			/* overlong */
			return 0;

		length_r = 3;
		return ch;
	}

	/* no whitespace needs four bytes */
	return 0;
}

std::size_t
WhitespacePrefixUTF8(std::string_view s) noexcept
{
	if (s.empty())
		return 0;

	if ((s.front() & 0x80) == 0)
		return IsWhitespaceNotNull(s.front()) ? 1 : 0;

	std::size_t length;
	const char32_t ch = DecodeUTF8(s, length);
	return ch != 0 && IsUnicodeWhitespace(ch) ? length : 0;
}

std::size_t
WhitespaceSuffixUTF8(std::string_view s) noexcept
{
	if (s.empty())
		return 0;

	if ((s.back() & 0x80) == 0)
		return IsWhitespaceNotNull(s.back()) ? 1 : 0;

	/* find the lead byte of the last sequence */
	std::size_t start = s.size() - 1;
	while (start > 0 && s.size() - start < 3 &&
	       IsContinuation(s[start]))
		--start;

	const auto tail = s.substr(start);
	return WhitespacePrefixUTF8(tail) == tail.size() ? tail.size() : 0;
}
