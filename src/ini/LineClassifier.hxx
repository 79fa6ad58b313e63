// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Entry.hxx"

#include <cstdint>
#include <string_view>

namespace Ini {

/**
 * The result of ClassifyLine().
 */
struct Line {
	enum class Type : uint8_t {
		/**
		 * The line is empty.
		 */
		BLANK,

		/**
		 * A "key = value" line; #key and #value are set.
		 */
		PROPERTY,

		/**
		 * A "[name]" line; #name is set.
		 */
		SECTION,

		/**
		 * None of the above.  This is not an error; such
		 * lines are skipped.
		 */
		UNPARSABLE,
	};

	Type type;

	std::string_view key, value;

	std::string_view name;

	/**
	 * Obtain the #Entry of a #PROPERTY line.
	 *
	 * Throws #GrammarError if the key or the value is missing.
	 */
	Entry GetEntry() const;

	/**
	 * Obtain the name of a #SECTION line.
	 *
	 * Throws #GrammarError if the name is missing.
	 */
	std::string_view GetSectionName() const;
};

/**
 * Does the line have the form "key = value"?  Both the key and the
 * value are a non-empty run of characters other than '=' and
 * whitespace; whitespace is allowed around the '=' and at both ends.
 *
 * @return the entry; both strings are nullptr if the line does not
 * match
 */
[[gnu::pure]]
Entry
MatchProperty(std::string_view line) noexcept;

/**
 * Does the line have the form "[name]"?  The line must begin with
 * '[' and end with ']'; everything in between is the name, which may
 * itself contain brackets.
 *
 * @return the name or a nullptr string_view if the line does not
 * match
 */
[[gnu::pure]]
std::string_view
MatchSectionHeader(std::string_view line) noexcept;

/**
 * Classify one line of an INI file.  The line must already be
 * stripped of leading and trailing whitespace.  The "key = value"
 * form takes precedence over the section header.
 */
[[gnu::pure]]
Line
ClassifyLine(std::string_view line) noexcept;

} // namespace Ini
