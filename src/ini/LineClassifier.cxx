// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LineClassifier.hxx"
#include "Error.hxx"
#include "util/StringStrip.hxx"
#include "util/UnicodeWhitespace.hxx"

namespace Ini {

/**
 * Consume the longest run of characters other than '=' and
 * whitespace at the beginning of the given string.
 */
static std::string_view
NextToken(std::string_view &s) noexcept
{
	std::size_t n = 0;
	while (n < s.size() && s[n] != '=' &&
	       WhitespacePrefixUTF8(s.substr(n)) == 0)
		++n;

	const auto token = s.substr(0, n);
	s.remove_prefix(n);
	return token;
}

Entry
MatchProperty(std::string_view line) noexcept
{
	line = StripLeft(line);

	const auto key = NextToken(line);
	if (key.empty())
		return {};

	line = StripLeft(line);
	if (line.empty() || line.front() != '=')
		return {};

	line.remove_prefix(1);
	line = StripLeft(line);

	const auto value = NextToken(line);
	if (value.empty() || !StripLeft(line).empty())
		return {};

	return {key, value};
}

std::string_view
MatchSectionHeader(std::string_view line) noexcept
{
	if (line.size() < 3 || line.front() != '[' || line.back() != ']')
		return {};

	return line.substr(1, line.size() - 2);
}

Line
ClassifyLine(std::string_view line) noexcept
{
	if (line.empty())
		return {.type = Line::Type::BLANK};

	if (const auto entry = MatchProperty(line); entry.key.data() != nullptr)
		return {
			.type = Line::Type::PROPERTY,
			.key = entry.key,
			.value = entry.value,
		};

	if (const auto name = MatchSectionHeader(line); name.data() != nullptr)
		return {
			.type = Line::Type::SECTION,
			.name = name,
		};

	return {.type = Line::Type::UNPARSABLE};
}

Entry
Line::GetEntry() const
{
	if (key.empty())
		throw GrammarError{"key"};

	if (value.empty())
		throw GrammarError{"value"};

	return {key, value};
}

std::string_view
Line::GetSectionName() const
{
	if (name.empty())
		throw GrammarError{"section_name"};

	return name;
}

} // namespace Ini
