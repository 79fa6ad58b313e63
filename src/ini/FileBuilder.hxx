// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "File.hxx"

#include <utility>

namespace Ini {

class SectionBuilder;

/**
 * Collects the sections of one #File.
 */
class FileBuilder {
	File file;

public:
	FileBuilder &SetGlobalSection(Section &&section) noexcept {
		file.global_section = std::move(section);
		return *this;
	}

	/**
	 * Add a named section.  An existing section with the same name
	 * is replaced.
	 */
	FileBuilder &AddSection(std::string_view name, Section &&section) {
		file.sections.insert_or_assign(name, std::move(section));
		return *this;
	}

	/**
	 * Finish the given #SectionBuilder and add its section to the
	 * file.  A named section is always added, even if it is
	 * empty.  The global section is only added if it has entries,
	 * because every file implicitly begins with one.
	 */
	void Flush(SectionBuilder &&builder);

	File Finish() && noexcept {
		return std::move(file);
	}
};

} // namespace Ini
