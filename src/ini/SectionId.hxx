// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cassert>
#include <string_view>

namespace Ini {

/**
 * Identifies the section a #SectionBuilder is collecting: either the
 * implicit global section at the top of the file or a section with a
 * header.
 */
class SectionId {
	/**
	 * The section name; a nullptr string_view means "global".
	 */
	std::string_view name;

	constexpr explicit SectionId(std::string_view _name) noexcept
		:name(_name) {}

public:
	static constexpr SectionId Global() noexcept {
		return SectionId{std::string_view{}};
	}

	static constexpr SectionId Named(std::string_view _name) noexcept {
		assert(_name.data() != nullptr);

		return SectionId{_name};
	}

	constexpr bool IsGlobal() const noexcept {
		return name.data() == nullptr;
	}

	/**
	 * Returns the section name.  Must not be called on the global
	 * section.
	 */
	constexpr std::string_view GetName() const noexcept {
		assert(!IsGlobal());

		return name;
	}
};

} // namespace Ini
