// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "dos/dos_names.h"

#include <gtest/gtest.h>

#include <string>

namespace {

std::string to_string(const std::array<uint8_t, ShortNameLength>& dir_name)
{
	return std::string(dir_name.begin(), dir_name.end());
}

TEST(NeedsLfn, PlainShortNames)
{
	EXPECT_FALSE(needs_lfn("FILE.TXT"));
	EXPECT_FALSE(needs_lfn("SHORT.DAT"));
	EXPECT_FALSE(needs_lfn("NOEXT"));
	EXPECT_FALSE(needs_lfn("12345678.123"));
	EXPECT_FALSE(needs_lfn("FILE~1.TXT"));
	EXPECT_FALSE(needs_lfn("A"));
}

TEST(NeedsLfn, DotEntries)
{
	EXPECT_FALSE(needs_lfn("."));
	EXPECT_FALSE(needs_lfn(".."));
}

TEST(NeedsLfn, LowerCase)
{
	EXPECT_TRUE(needs_lfn("Test.txt"));
	EXPECT_TRUE(needs_lfn("file.TXT"));
	EXPECT_TRUE(needs_lfn("FILE.txt"));
}

TEST(NeedsLfn, TooLong)
{
	EXPECT_TRUE(needs_lfn("longfilename.txt"));
	EXPECT_TRUE(needs_lfn("LONGFILENAME"));
	EXPECT_TRUE(needs_lfn("FILE.TEXT"));
}

TEST(NeedsLfn, InvalidCharacters)
{
	EXPECT_TRUE(needs_lfn("My Document.doc"));
	EXPECT_TRUE(needs_lfn("MY DOC.DOC"));
	EXPECT_TRUE(needs_lfn("A+B.TXT"));
	EXPECT_TRUE(needs_lfn("A[1].TXT"));
	EXPECT_TRUE(needs_lfn("CAF\xC3\x89.TXT"));
}

TEST(NeedsLfn, PathSeparators)
{
	EXPECT_TRUE(needs_lfn("A\\B.TXT"));
	EXPECT_TRUE(needs_lfn("A/B.TXT"));
	EXPECT_TRUE(needs_lfn("README.\\"));
}

TEST(NeedsLfn, DotPlacement)
{
	EXPECT_TRUE(needs_lfn("A.B.C"));
	EXPECT_TRUE(needs_lfn("FILE."));
	EXPECT_TRUE(needs_lfn(".PROFILE"));
	EXPECT_TRUE(needs_lfn(""));
}

TEST(GenerateShortName, PreservesNamesDifferingOnlyInCase)
{
	EXPECT_EQ(generate_short_name("Test.txt", {}), "TEST.TXT");
	EXPECT_EQ(generate_short_name("readme", {}), "README");
}

TEST(GenerateShortName, LossyNamesGetNumericTail)
{
	EXPECT_EQ(generate_short_name("longfilename.txt", {}), "LONGFI~1.TXT");
	EXPECT_EQ(generate_short_name("My Document.doc", {}), "MYDOCU~1.DOC");
	EXPECT_EQ(generate_short_name("A Tale of Two Cities.txt", {}), "ATALEO~1.TXT");
	EXPECT_EQ(generate_short_name("file.jpeg", {}), "FILE~1.JPE");
}

TEST(GenerateShortName, ReplacesInvalidCharacters)
{
	EXPECT_EQ(generate_short_name("a+b.txt", {}), "A_B~1.TXT");
	EXPECT_EQ(generate_short_name("caf\xC3\xA9.txt", {}), "CAF_~1.TXT");
}

TEST(GenerateShortName, ReplacesPathSeparators)
{
	EXPECT_EQ(generate_short_name("A\\B.TXT", {}), "A_B~1.TXT");
	EXPECT_EQ(generate_short_name("a\\b.txt", {}), "A_B~1.TXT");
	EXPECT_EQ(generate_short_name("a\\b.txt", {"A_B~1.TXT"}), "A_B~2.TXT");
}

TEST(GenerateShortName, OneReplacementPerCharacterOutsideBmp)
{
	// U+1F600 takes two UTF-16 code units
	EXPECT_EQ(generate_short_name("\xF0\x9F\x98\x80.txt", {}), "_~1.TXT");
	EXPECT_EQ(generate_short_name("x\xF0\x9F\x98\x80y.txt", {}), "X_Y~1.TXT");
}

TEST(GenerateShortName, DropsSuperfluousDots)
{
	EXPECT_EQ(generate_short_name("archive.tar.gz", {}), "ARCHIV~1.GZ");
	EXPECT_EQ(generate_short_name("..hidden", {}), "HIDDEN~1");
	EXPECT_EQ(generate_short_name("trailing.", {}), "TRAILI~1");
}

TEST(GenerateShortName, NothingLeft)
{
	EXPECT_EQ(generate_short_name("   ", {}), "_~1");
}

TEST(GenerateShortName, LowestFreeTail)
{
	const ShortNameSet used_names = {"LONGFI~1.TXT", "LONGFI~3.TXT"};
	EXPECT_EQ(generate_short_name("longfilename.txt", used_names), "LONGFI~2.TXT");
}

TEST(GenerateShortName, CollisionWithoutLoss)
{
	const ShortNameSet used_names = {"README.TXT"};
	EXPECT_EQ(generate_short_name("readme.txt", used_names), "README~1.TXT");
}

TEST(GenerateShortName, LongerTailShortensBase)
{
	ShortNameSet used_names = {};
	for (int i = 1; i <= 9; ++i) {
		used_names.insert("LONGFI~" + std::to_string(i) + ".TXT");
	}
	EXPECT_EQ(generate_short_name("longfilename.txt", used_names), "LONGF~10.TXT");

	for (int i = 10; i <= 99; ++i) {
		used_names.insert("LONGF~" + std::to_string(i) + ".TXT");
	}
	EXPECT_EQ(generate_short_name("longfilename.txt", used_names), "LONG~100.TXT");
}

TEST(GenerateShortName, TailsExhausted)
{
	ShortNameSet used_names = {};
	for (int i = 1; i <= MaxNumericTail; ++i) {
		const auto tail = "~" + std::to_string(i);
		used_names.insert(std::string("LONGFILE").substr(0, 8 - tail.size()) +
		                  tail + ".TXT");
	}
	EXPECT_FALSE(generate_short_name("longfilename.txt", used_names));
}

TEST(GenerateShortName, DotEntries)
{
	EXPECT_EQ(generate_short_name(".", {}), ".");
	EXPECT_EQ(generate_short_name("..", {}), "..");
}

TEST(ToDirName, PadsBaseAndExtension)
{
	EXPECT_EQ(to_string(to_dir_name("A TALE O.TXT")), "A TALE OTXT");
	EXPECT_EQ(to_string(to_dir_name("README")), "README     ");
	EXPECT_EQ(to_string(to_dir_name("A.B")), "A       B  ");
	EXPECT_EQ(to_string(to_dir_name("LONGFI~1.TXT")), "LONGFI~1TXT");
}

TEST(ToDirName, DotEntries)
{
	EXPECT_EQ(to_string(to_dir_name(".")), ".          ");
	EXPECT_EQ(to_string(to_dir_name("..")), "..         ");
}

TEST(DirNameToString, TrimsPadding)
{
	const auto dir_name = to_dir_name("README.MD");
	EXPECT_EQ(dir_name_to_string(dir_name.data()), "README.MD");

	const auto no_ext = to_dir_name("COMMAND");
	EXPECT_EQ(dir_name_to_string(no_ext.data()), "COMMAND");
}

} // namespace
