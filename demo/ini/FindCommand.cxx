// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FindCommand.hxx"
#include "ini/Find.hxx"
#include "io/TextFile.hxx"
#include "io/Logger.hxx"

#include <fmt/core.h>

#include <filesystem>
#include <stdexcept>

static const LLogger logger("IniFind");

void
FindAndPrint(const char *path, std::string_view key,
	     std::string_view section, FILE *out)
{
	if (std::filesystem::path{path}.extension() != ".ini")
		logger(1, "Specified file does not have an .ini extension!");

	const auto contents = LoadTextFile(path);

	const auto value = Ini::Find(contents, key, section);
	if (value.data() == nullptr)
		throw std::runtime_error("The given section did not contain the specified key");

	fmt::print(out, "{}", value);
}
