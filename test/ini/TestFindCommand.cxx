// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CaptureLog.hxx"
#include "FindCommand.hxx"
#include "CommandLine.hxx"
#include "util/ScopeExit.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <system_error>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

namespace {

/**
 * A temporary file which is deleted by the destructor.
 */
class TempIniFile {
	std::string path;

public:
	TempIniFile(const char *suffix, std::string_view contents) {
		path = "/tmp/TestFindCommand.XXXXXX";
		path += suffix;

		const int fd = mkstemps(path.data(), strlen(suffix));
		if (fd < 0)
			throw std::system_error(errno, std::system_category(),
						"mkstemps() failed");

		AtScopeExit(fd) { close(fd); };

		if (write(fd, contents.data(), contents.size()) != ssize_t(contents.size()))
			throw std::runtime_error("Short write");
	}

	~TempIniFile() noexcept {
		unlink(path.c_str());
	}

	TempIniFile(const TempIniFile &) = delete;
	TempIniFile &operator=(const TempIniFile &) = delete;

	const char *c_str() const noexcept {
		return path.c_str();
	}
};

/**
 * Run FindAndPrint() and return what it printed.
 */
std::string
RunFind(const char *path, std::string_view key,
	std::string_view section={})
{
	FILE *out = tmpfile();
	if (out == nullptr)
		throw std::system_error(errno, std::system_category(),
					"tmpfile() failed");

	AtScopeExit(out) { fclose(out); };

	FindAndPrint(path, key, section, out);

	fflush(out);
	rewind(out);

	std::string result;
	char buffer[256];
	size_t nbytes;
	while ((nbytes = fread(buffer, 1, sizeof(buffer), out)) > 0)
		result.append(buffer, nbytes);
	return result;
}

constexpr auto sample = "g=0\n[a]\nk = 1\n[b]\nk = 2\n"sv;

} // anonymous namespace

TEST(IniFindCommand, Found)
{
	const TempIniFile file{".ini", sample};
	CaptureLog log;

	/* no trailing newline */
	EXPECT_EQ(RunFind(file.c_str(), "k"sv, "b"sv), "2");
	EXPECT_EQ(RunFind(file.c_str(), "k"sv), "1");
	EXPECT_EQ(RunFind(file.c_str(), "g"sv), "0");

	EXPECT_TRUE(log.messages.empty());
}

TEST(IniFindCommand, NotFound)
{
	const TempIniFile file{".ini", sample};

	try {
		RunFind(file.c_str(), "x"sv, "a"sv);
		FAIL();
	} catch (const std::runtime_error &e) {
		EXPECT_STREQ(e.what(),
			     "The given section did not contain the specified key");
	}

	/* the global key is not visible in a section */
	EXPECT_THROW(RunFind(file.c_str(), "g"sv, "a"sv), std::runtime_error);
	EXPECT_THROW(RunFind(file.c_str(), "k"sv, "c"sv), std::runtime_error);
}

TEST(IniFindCommand, NoIniExtension)
{
	const TempIniFile file{".conf", sample};
	CaptureLog log;

	EXPECT_EQ(RunFind(file.c_str(), "k"sv, "a"sv), "1");

	ASSERT_EQ(log.messages.size(), 1U);
	EXPECT_EQ(log.messages.front(),
		  "Specified file does not have an .ini extension!");
}

TEST(IniFindCommand, FileNotFound)
{
	CaptureLog log;

	EXPECT_THROW(RunFind("/does/not/exist.ini", "k"sv), std::system_error);
	EXPECT_TRUE(log.messages.empty());
}

TEST(IniFindCommand, CommonOptions)
{
	CaptureLog log;

	char arg0[] = "IniFind", arg1[] = "--quiet", arg2[] = "path";
	char *argv[] = {arg0, arg1, arg2, nullptr};

	const auto args = ParseCommonOptions(3, argv);
	ASSERT_EQ(args.size(), 1U);
	EXPECT_STREQ(args[0], "path");
	EXPECT_EQ(LoggerDetail::max_level, 0U);

	char arg3[] = "--bogus";
	char *argv2[] = {arg0, arg3, nullptr};
	EXPECT_THROW(ParseCommonOptions(2, argv2), std::runtime_error);
}
