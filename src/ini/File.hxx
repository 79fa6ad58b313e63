// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Section.hxx"

#include <functional>
#include <map>
#include <optional>
#include <string_view>

namespace Ini {

/**
 * The parsed representation of an INI file: an optional global
 * section (the entries before the first section header) and all
 * named sections.
 *
 * All strings point into the text which was parsed, which must
 * therefore outlive this object.
 */
class File {
	friend class FileBuilder;

public:
	using SectionMap = std::map<std::string_view, Section, std::less<>>;

private:
	std::optional<Section> global_section;

	SectionMap sections;

public:
	File() = default;

	File(File &&) noexcept = default;
	File &operator=(File &&) noexcept = default;

	/**
	 * @return the global section or nullptr if the file does not
	 * have one
	 */
	const Section *GetGlobalSection() const noexcept {
		return global_section ? &*global_section : nullptr;
	}

	/**
	 * @return the section with the given name or nullptr if there
	 * is no such section
	 */
	[[gnu::pure]]
	const Section *GetSection(std::string_view name) const noexcept;

	/**
	 * All named sections, ordered by name.
	 */
	const SectionMap &GetSections() const noexcept {
		return sections;
	}
};

} // namespace Ini
