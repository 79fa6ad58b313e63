// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Entry.hxx"

#include <cstddef>
#include <string_view>
#include <vector>

namespace Ini {

/**
 * An ordered list of #Entry instances.  Duplicate keys are allowed;
 * GetValue() returns the first one, later duplicates can only be
 * seen by iterating.
 *
 * Instances are created by #SectionBuilder and are read-only after
 * that.
 */
class Section {
	friend class SectionBuilder;

	std::vector<Entry> entries;

public:
	Section() = default;

	Section(Section &&) noexcept = default;
	Section &operator=(Section &&) noexcept = default;

	Section(const Section &) = delete;
	Section &operator=(const Section &) = delete;

	bool empty() const noexcept {
		return entries.empty();
	}

	std::size_t size() const noexcept {
		return entries.size();
	}

	auto begin() const noexcept {
		return entries.begin();
	}

	auto end() const noexcept {
		return entries.end();
	}

	/**
	 * Look up the value of the first entry with the given key.
	 *
	 * @return the value or a nullptr string_view if there is no
	 * such key
	 */
	[[gnu::pure]]
	std::string_view GetValue(std::string_view key) const noexcept;
};

} // namespace Ini
