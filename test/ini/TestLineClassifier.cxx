// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ini/LineClassifier.hxx"
#include "ini/Error.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;
using Type = Ini::Line::Type;

TEST(IniLineClassifier, Blank)
{
	EXPECT_EQ(Ini::ClassifyLine(""sv).type, Type::BLANK);
	EXPECT_EQ(Ini::ClassifyLine(std::string_view{}).type, Type::BLANK);
}

TEST(IniLineClassifier, Property)
{
	auto l = Ini::ClassifyLine("key=value"sv);
	EXPECT_EQ(l.type, Type::PROPERTY);
	EXPECT_EQ(l.key, "key"sv);
	EXPECT_EQ(l.value, "value"sv);

	l = Ini::ClassifyLine("key = value"sv);
	EXPECT_EQ(l.type, Type::PROPERTY);
	EXPECT_EQ(l.key, "key"sv);
	EXPECT_EQ(l.value, "value"sv);

	l = Ini::ClassifyLine("key\t=\t\tvalue"sv);
	EXPECT_EQ(l.type, Type::PROPERTY);
	EXPECT_EQ(l.key, "key"sv);
	EXPECT_EQ(l.value, "value"sv);

	l = Ini::ClassifyLine("a.b-c:d=/usr/bin/x,y;z"sv);
	EXPECT_EQ(l.type, Type::PROPERTY);
	EXPECT_EQ(l.key, "a.b-c:d"sv);
	EXPECT_EQ(l.value, "/usr/bin/x,y;z"sv);

	/* the strings point into the line */
	const auto line = "k=v"sv;
	l = Ini::ClassifyLine(line);
	EXPECT_EQ(l.key.data(), line.data());
	EXPECT_EQ(l.value.data(), line.data() + 2);
}

TEST(IniLineClassifier, MatchPropertyStripsItself)
{
	const auto entry = Ini::MatchProperty("  key = value  "sv);
	EXPECT_EQ(entry.key, "key"sv);
	EXPECT_EQ(entry.value, "value"sv);
}

TEST(IniLineClassifier, NotAProperty)
{
	EXPECT_EQ(Ini::ClassifyLine("key"sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("key="sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("=value"sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("="sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("a==b"sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("a=b=c"sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("key = two words"sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("two words = value"sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("garbage"sv).type, Type::UNPARSABLE);

	EXPECT_EQ(Ini::MatchProperty("key"sv).key.data(), nullptr);
	EXPECT_EQ(Ini::MatchProperty("key = "sv).value.data(), nullptr);
}

TEST(IniLineClassifier, UnicodeWhitespace)
{
	/* U+2003 EM SPACE around '=' */
	auto l = Ini::ClassifyLine("key\u2003=\u2003value"sv);
	EXPECT_EQ(l.type, Type::PROPERTY);
	EXPECT_EQ(l.key, "key"sv);
	EXPECT_EQ(l.value, "value"sv);

	/* U+00A0 NO-BREAK SPACE inside a token splits it */
	EXPECT_EQ(Ini::ClassifyLine("a\u00A0b=c"sv).type, Type::UNPARSABLE);

	/* other non-ASCII characters are part of the token */
	l = Ini::ClassifyLine("\u00E4=\u00F6"sv);
	EXPECT_EQ(l.type, Type::PROPERTY);
	EXPECT_EQ(l.key, "\u00E4"sv);
	EXPECT_EQ(l.value, "\u00F6"sv);
}

TEST(IniLineClassifier, Section)
{
	auto l = Ini::ClassifyLine("[foo]"sv);
	EXPECT_EQ(l.type, Type::SECTION);
	EXPECT_EQ(l.name, "foo"sv);

	l = Ini::ClassifyLine("[a]"sv);
	EXPECT_EQ(l.type, Type::SECTION);
	EXPECT_EQ(l.name, "a"sv);

	/* whitespace inside the brackets is part of the name */
	l = Ini::ClassifyLine("[ foo bar ]"sv);
	EXPECT_EQ(l.type, Type::SECTION);
	EXPECT_EQ(l.name, " foo bar "sv);

	/* only the last ']' closes the header */
	l = Ini::ClassifyLine("[a]b]"sv);
	EXPECT_EQ(l.type, Type::SECTION);
	EXPECT_EQ(l.name, "a]b"sv);

	l = Ini::ClassifyLine("[[x]]"sv);
	EXPECT_EQ(l.type, Type::SECTION);
	EXPECT_EQ(l.name, "[x]"sv);
}

TEST(IniLineClassifier, NotASection)
{
	EXPECT_EQ(Ini::ClassifyLine("[]"sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("["sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("]"sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("[foo"sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("foo]"sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("[foo] x"sv).type, Type::UNPARSABLE);
	EXPECT_EQ(Ini::ClassifyLine("x [foo]"sv).type, Type::UNPARSABLE);

	EXPECT_EQ(Ini::MatchSectionHeader("[]"sv).data(), nullptr);
}

/**
 * A line which looks like both forms is a property, because that
 * form is tried first.
 */
TEST(IniLineClassifier, PropertyBeforeSection)
{
	const auto l = Ini::ClassifyLine("[a=b]"sv);
	EXPECT_EQ(l.type, Type::PROPERTY);
	EXPECT_EQ(l.key, "[a"sv);
	EXPECT_EQ(l.value, "b]"sv);

	EXPECT_EQ(Ini::MatchSectionHeader("[a=b]"sv), "a=b"sv);
}

TEST(IniLineClassifier, GrammarError)
{
	Ini::Line l{.type = Type::PROPERTY};
	EXPECT_THROW(l.GetEntry(), Ini::GrammarError);

	l.key = "k"sv;
	try {
		l.GetEntry();
		FAIL();
	} catch (const Ini::GrammarError &e) {
		EXPECT_STREQ(e.GetCapture(), "value");
	}

	l = {.type = Type::SECTION};
	EXPECT_THROW(l.GetSectionName(), Ini::GrammarError);

	l.name = "s"sv;
	EXPECT_EQ(l.GetSectionName(), "s"sv);
}
