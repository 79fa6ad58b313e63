// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <string_view>

namespace Ini {

/**
 * One "key = value" pair.  Both strings point into the text which
 * was parsed; they are never empty and contain neither '=' nor
 * whitespace.
 */
struct Entry {
	std::string_view key, value;
};

} // namespace Ini
