// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "TextFile.hxx"
#include "Open.hxx"
#include "UniqueFileDescriptor.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "lib/fmt/SystemError.hxx"

#include <sys/stat.h>

std::string
LoadTextFile(const char *path)
{
	const auto fd = OpenReadOnly(path);

	struct stat st;
	if (fstat(fd.Get(), &st) < 0)
		throw FmtErrno("Failed to stat {}", path);

	if (!S_ISREG(st.st_mode))
		throw FmtRuntimeError("Not a regular file: {}", path);

	std::string result;
	result.reserve(st.st_size);

	std::byte buffer[16384];
	while (true) {
		ssize_t nbytes = fd.Read(buffer);
		if (nbytes < 0)
			throw FmtErrno("Failed to read {}", path);

		if (nbytes == 0)
			break;

		result.append(reinterpret_cast<const char *>(buffer), nbytes);
	}

	return result;
}
