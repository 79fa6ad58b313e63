// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Exception.hxx"

static std::string
GetFullMessage(const std::exception &e, const char *fallback,
	       const char *separator) noexcept
{
	try {
		std::rethrow_if_nested(e);
		return e.what();
	} catch (...) {
		return std::string{e.what()} + separator +
			GetFullMessage(std::current_exception(),
				       fallback, separator);
	}
}

std::string
GetFullMessage(std::exception_ptr ep,
	       const char *fallback, const char *separator) noexcept
{
	try {
		std::rethrow_exception(ep);
	} catch (const std::exception &e) {
		return GetFullMessage(e, fallback, separator);
	} catch (const char *s) {
		return s;
	} catch (...) {
		return fallback;
	}
}
