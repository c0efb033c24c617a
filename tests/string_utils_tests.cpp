// SPDX-FileCopyrightText:  2020-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "utils/string_utils.h"

#include <gtest/gtest.h>

#include <string>

namespace {

TEST(CaseInsensitiveCompare, Chars)
{
	constexpr const char a[]     = "123";
	constexpr const char not_a[] = "321";

	EXPECT_TRUE(iequals(a, a));
	EXPECT_FALSE(iequals(a, not_a));
}

TEST(CaseInsensitiveCompare, StringViews)
{
	constexpr std::string_view a     = "fd_1440kb";
	constexpr std::string_view not_a = "fd_1200kb";

	EXPECT_TRUE(iequals(a, a));
	EXPECT_FALSE(iequals(a, not_a));
}

TEST(CaseInsensitiveCompare, MixedTypes)
{
	const std::string a = "-Label";

	EXPECT_TRUE(iequals(a, "-LABEL"));
	EXPECT_TRUE(iequals("-label", a));
	EXPECT_TRUE(iequals(a, std::string_view("-label")));
	EXPECT_FALSE(iequals(a, "-labels"));
	EXPECT_FALSE(iequals(a, "-labe"));
}

TEST(Trim, Whitespace)
{
	std::string str = "  MY DISK \t\r\n";
	trim(str);
	EXPECT_EQ(str, "MY DISK");

	std::string only_spaces = "    ";
	trim(only_spaces);
	EXPECT_EQ(only_spaces, "");

	std::string nothing_to_trim = "A B";
	trim(nothing_to_trim);
	EXPECT_EQ(nothing_to_trim, "A B");
}

TEST(Trim, CustomCharacters)
{
	std::string str = "__NAME__";
	trim(str, "_");
	EXPECT_EQ(str, "NAME");
}

TEST(LetterCase, InPlace)
{
	std::string str = "Long File Name.txt";
	upcase(str);
	EXPECT_EQ(str, "LONG FILE NAME.TXT");

	std::string mixed = "readme.1st";
	upcase(mixed);
	EXPECT_EQ(mixed, "README.1ST");
}

TEST(RightPad, PadsAndTruncates)
{
	EXPECT_EQ(right_pad("FAT12", 8, ' '), "FAT12   ");
	EXPECT_EQ(right_pad("", 3, ' '), "   ");
	EXPECT_EQ(right_pad("ABCDEFGHIJKL", 11, ' '), "ABCDEFGHIJK");
	EXPECT_EQ(right_pad("NO NAME", 11, ' '), "NO NAME    ");
}

TEST(ParseInt, Valid)
{
	// negatives
	EXPECT_EQ(*parse_int("-10000"), -10000);
	EXPECT_EQ(*parse_int("-1"), -1);

	// positives
	EXPECT_EQ(*parse_int("10000"), 10000);
	EXPECT_EQ(*parse_int("0"), 0);
	EXPECT_EQ(*parse_int("2"), 2);
}

TEST(ParseInt, Hexadecimal)
{
	EXPECT_EQ(*parse_int("ff", 16), 255);
	EXPECT_EQ(*parse_int("1A2B", 16), 0x1a2b);
}

TEST(ParseInt, Invalid)
{
	std::optional<int> empty = {};
	EXPECT_EQ(parse_int("100a"), empty);
	EXPECT_EQ(parse_int("sfafsd"), empty);
	EXPECT_EQ(parse_int(""), empty);
	EXPECT_EQ(parse_int(" "), empty);
	EXPECT_EQ(parse_int("ff"), empty);
	EXPECT_EQ(parse_int("99999999999999"), empty);
}

TEST(FormatString, Valid)
{
	EXPECT_EQ(format_str(""), "");
	EXPECT_EQ(format_str("abcd"), "abcd");
	EXPECT_EQ(format_str("%d", 42), "42");
	EXPECT_EQ(format_str("%s%d%s", "abcd", 42, "xyz"), "abcd42xyz");
	EXPECT_EQ(format_str("\\%s\\%s", "DOCUME~1", "README.TXT"), "\\DOCUME~1\\README.TXT");
}

} // namespace
