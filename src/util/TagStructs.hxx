// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

/**
 * Tag for constructors which take over ownership of a raw resource.
 */
struct AdoptTag {};
