// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <string_view>

#include <stdio.h>

/**
 * Look up a key in the INI file at the given path and write its
 * value (without a trailing newline) to the given stream.  A path
 * without ".ini" extension is accepted, but a warning is logged.
 *
 * Throws on I/O error and std::runtime_error if the key was not
 * found.
 *
 * @param section the section to search in; a nullptr
 * std::string_view searches the whole file
 */
void
FindAndPrint(const char *path, std::string_view key,
	     std::string_view section, FILE *out);
