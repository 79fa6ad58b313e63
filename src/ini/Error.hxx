// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <stdexcept>
#include <string>

namespace Ini {

/**
 * A line was classified as a match, but one of the strings the match
 * is supposed to provide is missing.  This is a bug in the grammar
 * implementation, not a problem with the input; it is never retried.
 */
class GrammarError final : public std::logic_error {
	const char *capture;

public:
	explicit GrammarError(const char *_capture)
		:std::logic_error(std::string{"Line was matched, but its \""} +
				  _capture + "\" was not captured"),
		 capture(_capture) {}

	/**
	 * The name of the missing capture, e.g. "key".
	 */
	const char *GetCapture() const noexcept {
		return capture;
	}
};

} // namespace Ini
