// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <string>

/**
 * Load the whole contents of a regular file into a std::string.  No
 * character set conversion or line ending translation is done.
 *
 * Throws std::system_error on I/O error and std::runtime_error if
 * the path does not refer to a regular file.
 */
std::string
LoadTextFile(const char *path);
