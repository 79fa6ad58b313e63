// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <cstddef>
#include <span>

#include <sys/types.h>
#include <unistd.h>

/**
 * An OO wrapper for a UNIX file descriptor.  It does not own the
 * descriptor; see #UniqueFileDescriptor.
 */
class FileDescriptor {
protected:
	int fd;

public:
	FileDescriptor() = default;
	explicit constexpr FileDescriptor(int _fd) noexcept:fd(_fd) {}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	constexpr int Get() const noexcept {
		return fd;
	}

	static constexpr FileDescriptor Undefined() noexcept {
		return FileDescriptor(-1);
	}

	/**
	 * Close the file descriptor.  It is legal to call it on an
	 * undefined object.
	 */
	void Close() noexcept {
		if (IsDefined()) {
			::close(fd);
			fd = -1;
		}
	}

	ssize_t Read(std::span<std::byte> dest) const noexcept {
		return ::read(fd, dest.data(), dest.size());
	}
};
