// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Parse an INI file and print it in normalized form.
 */

#include "CommandLine.hxx"
#include "ini/Parser.hxx"
#include "ini/Formatter.hxx"
#include "io/TextFile.hxx"
#include "util/PrintException.hxx"

#include <fmt/format.h>

#include <cstdlib>

int
main(int argc, char **argv) noexcept
try {
	const auto args = ParseCommonOptions(argc, argv);
	if (args.size() != 1) {
		fmt::print(stderr, "Usage: {} [--quiet|--verbose] PATH\n",
			   argv[0]);
		return EXIT_FAILURE;
	}

	const auto contents = LoadTextFile(args[0]);
	const auto file = Ini::Parse(contents);

	fmt::print("{}", file);
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
