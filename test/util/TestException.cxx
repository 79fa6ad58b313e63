// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "util/Exception.hxx"
#include "ini/Error.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(ExceptionTest, RuntimeError)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(std::runtime_error("Foo"))), "Foo");
}

TEST(ExceptionTest, DerivedError)
{
	class DerivedError : public std::runtime_error {
	public:
		explicit DerivedError(const char *_msg)
			:std::runtime_error(_msg) {}
	};

	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(DerivedError("Foo"))), "Foo");
}

TEST(ExceptionTest, GrammarError)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(Ini::GrammarError("key"))),
		  "Line was matched, but its \"key\" was not captured");
}

TEST(ExceptionTest, Nested)
{
	std::exception_ptr ep;

	try {
		try {
			throw std::runtime_error("Inner");
		} catch (...) {
			std::throw_with_nested(std::runtime_error("Outer"));
		}
	} catch (...) {
		ep = std::current_exception();
	}

	ASSERT_EQ(GetFullMessage(ep), "Outer; Inner");
}

TEST(ExceptionTest, Unknown)
{
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(42)), "Unknown exception");
	ASSERT_EQ(GetFullMessage(std::make_exception_ptr(42), "x"), "x");
}
