// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <string_view>

namespace Ini {

/**
 * Look up one value in INI text without building a #File.
 *
 * If a section name is given, only the first section with that name
 * is searched; the search stops at the next section header.  If no
 * section name is given (nullptr string_view), section headers are
 * ignored and the first entry with the given key anywhere in the
 * text wins.
 *
 * Throws #GrammarError on internal error.
 *
 * @param section the section name or a nullptr string_view
 * @return the value (pointing into the given text) or a nullptr
 * string_view if it was not found
 */
std::string_view
Find(std::string_view text, std::string_view key,
     std::string_view section={});

} // namespace Ini
