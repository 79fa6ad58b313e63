// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CommandLine.hxx"
#include "io/Logger.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <string_view>

using std::string_view_literals::operator""sv;

std::span<char *const>
ParseCommonOptions(int argc, char **argv)
{
	int i = 1;

	for (; i < argc && argv[i][0] == '-'; ++i) {
		const std::string_view option = argv[i];

		if (option == "--quiet"sv || option == "-q"sv)
			SetLogLevel(0);
		else if (option == "--verbose"sv || option == "-v"sv)
			SetLogLevel(5);
		else if (option == "--"sv) {
			++i;
			break;
		} else
			throw FmtRuntimeError("Unknown option: {}", option);
	}

	return {argv + i, static_cast<std::size_t>(argc - i)};
}
