// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Open.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"

#include <fcntl.h>

UniqueFileDescriptor
OpenReadOnly(const char *path, int flags)
{
	const int fd = open(path, O_RDONLY|O_NOCTTY|O_CLOEXEC|flags);
	if (fd < 0)
		throw FmtErrno("Failed to open {}", path);

	return UniqueFileDescriptor{AdoptTag{}, fd};
}
