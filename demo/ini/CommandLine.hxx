// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <span>

/**
 * Apply the options shared by all INI tools ("--quiet", "--verbose")
 * and return the remaining positional arguments.
 *
 * Throws std::runtime_error on unknown options.
 */
std::span<char *const>
ParseCommonOptions(int argc, char **argv);
