// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "SectionId.hxx"
#include "Section.hxx"

#include <utility>

namespace Ini {

/**
 * Collects the entries of one section.  The builder is consumed by
 * Finish(), which hands out the completed #Section together with its
 * #SectionId.
 */
class SectionBuilder {
	SectionId id;

	Section section;

public:
	explicit SectionBuilder(SectionId _id=SectionId::Global()) noexcept
		:id(_id) {}

	SectionBuilder(SectionBuilder &&) noexcept = default;
	SectionBuilder &operator=(SectionBuilder &&) noexcept = default;

	const SectionId &GetId() const noexcept {
		return id;
	}

	SectionBuilder &AddEntry(Entry entry) {
		section.entries.push_back(entry);
		return *this;
	}

	SectionBuilder &AddKeyValuePair(std::string_view key,
					std::string_view value) {
		return AddEntry({key, value});
	}

	std::pair<SectionId, Section> Finish() && noexcept {
		return {id, std::move(section)};
	}
};

} // namespace Ini
