// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * {fmt} support for the INI model.  Formatting a #Ini::File produces
 * INI text which parses to an equivalent #Ini::File.
 */

#pragma once

#include "SectionId.hxx"
#include "File.hxx"

#include <fmt/format.h>

template<>
struct fmt::formatter<Ini::Entry> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(const Ini::Entry &entry, FormatContext &ctx) const {
		return fmt::format_to(ctx.out(), "{} = {}",
				      entry.key, entry.value);
	}
};

template<>
struct fmt::formatter<Ini::Section> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(const Ini::Section &section, FormatContext &ctx) const {
		auto out = ctx.out();
		for (const auto &entry : section)
			out = fmt::format_to(out, "{}\n", entry);
		return out;
	}
};

template<>
struct fmt::formatter<Ini::File> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(const Ini::File &file, FormatContext &ctx) const {
		auto out = ctx.out();

		if (const auto *global = file.GetGlobalSection())
			out = fmt::format_to(out, "{}\n", *global);

		for (const auto &[name, section] : file.GetSections())
			out = fmt::format_to(out, "[{}]\n{}", name, section);

		return out;
	}
};

/**
 * Formats the global section as "(global)" and named sections as
 * "[name]"; used in log messages.
 */
template<>
struct fmt::formatter<Ini::SectionId> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(const Ini::SectionId &id, FormatContext &ctx) const {
		if (id.IsGlobal())
			return formatter<string_view>::format("(global)", ctx);

		return fmt::format_to(ctx.out(), "[{}]", id.GetName());
	}
};
