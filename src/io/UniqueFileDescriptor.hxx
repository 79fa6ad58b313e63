// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "FileDescriptor.hxx"
#include "util/TagStructs.hxx"

#include <utility>

/**
 * An OO wrapper for a UNIX file descriptor.  The descriptor is
 * closed by the destructor.
 */
class UniqueFileDescriptor : public FileDescriptor {
public:
	UniqueFileDescriptor() noexcept
		:FileDescriptor(FileDescriptor::Undefined()) {}

	explicit UniqueFileDescriptor(AdoptTag, int _fd) noexcept
		:FileDescriptor(_fd) {}

	UniqueFileDescriptor(UniqueFileDescriptor &&other) noexcept
		:FileDescriptor(std::exchange(other.fd, -1)) {}

	~UniqueFileDescriptor() noexcept {
		Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	/**
	 * Give up ownership and return the descriptor.
	 */
	FileDescriptor Release() noexcept {
		return FileDescriptor{std::exchange(fd, -1)};
	}
};
