// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Print the value of one key of an INI file.
 */

#include "CommandLine.hxx"
#include "FindCommand.hxx"
#include "util/PrintException.hxx"

#include <fmt/core.h>

#include <cstdlib>
#include <string_view>

int
main(int argc, char **argv) noexcept
try {
	const auto args = ParseCommonOptions(argc, argv);
	if (args.size() < 2 || args.size() > 3) {
		fmt::print(stderr, "Usage: {} [--quiet|--verbose] PATH KEY [SECTION]\n",
			   argv[0]);
		return EXIT_FAILURE;
	}

	const std::string_view section = args.size() > 2
		? std::string_view{args[2]}
		: std::string_view{};

	FindAndPrint(args[0], args[1], section, stdout);
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
