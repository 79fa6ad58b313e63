// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "File.hxx"

#include <string_view>

namespace Ini {

/**
 * Parse INI text into a #File.  Lines which cannot be parsed are
 * skipped (with a warning being logged).  If a section name appears
 * more than once, the last one wins.
 *
 * The returned object points into the given text, which must remain
 * valid as long as the #File is used.
 *
 * Throws #GrammarError on internal error.
 */
File
Parse(std::string_view text);

} // namespace Ini
