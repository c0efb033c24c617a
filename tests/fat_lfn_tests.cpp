// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "dos/fat_lfn.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "dos/dos_names.h"
#include "utils/byteorder.h"

namespace {

uint16_t read_char(const std::vector<uint8_t>& buffer, const size_t offset)
{
	return host_readw(&buffer[offset]);
}

TEST(LfnEntryCount, ShortNamesNeedNone)
{
	EXPECT_EQ(get_lfn_entry_count("FILE.TXT"), 0);
	EXPECT_EQ(get_lfn_entry_count("SHORT.DAT"), 0);
	EXPECT_EQ(get_lfn_entry_count("."), 0);
}

TEST(LfnEntryCount, ThirteenCharactersPerEntry)
{
	EXPECT_EQ(get_lfn_entry_count("Test.txt"), 1);
	EXPECT_EQ(get_lfn_entry_count("abcdefghi.txt"), 1);
	EXPECT_EQ(get_lfn_entry_count("abcdefghij.txt"), 2);
	EXPECT_EQ(get_lfn_entry_count("longfilename.txt"), 2);
	EXPECT_EQ(get_lfn_entry_count("abcdefghijklmnopqrstuvwxyz"), 2);
	EXPECT_EQ(get_lfn_entry_count("abcdefghijklmnopqrstuvwxyz0"), 3);
}

TEST(LfnEntryCount, CountsUcs2Characters)
{
	// 13 characters, 14 bytes in UTF-8
	EXPECT_EQ(get_lfn_entry_count("caf\xC3\xA9_menu.txt"), 1);
}

TEST(DirEntryCount, IncludesShortNameEntry)
{
	EXPECT_EQ(get_dir_entry_count("FILE.TXT", FatAttributeFlags::Archive), 1);
	EXPECT_EQ(get_dir_entry_count("longfilename.txt", FatAttributeFlags::Archive), 3);
	EXPECT_EQ(get_dir_entry_count("My Documents", FatAttributeFlags::Directory), 2);
}

TEST(DirEntryCount, VolumeLabelHasNoLongName)
{
	EXPECT_EQ(get_dir_entry_count("My Disk Label", FatAttributeFlags::Volume), 1);
}

TEST(LfnChecksum, KnownValue)
{
	EXPECT_EQ(build_lfn_checksum("A TALE O.TXT"), 127);
	EXPECT_EQ(build_lfn_checksum(to_dir_name("A TALE O.TXT")), 127);
	EXPECT_EQ(build_lfn_checksum("TEST.TXT"), 143);
}

TEST(LfnChecksum, DependsOnEveryByte)
{
	EXPECT_NE(build_lfn_checksum("LONGFI~1.TXT"), build_lfn_checksum("LONGFI~2.TXT"));
	EXPECT_NE(build_lfn_checksum("ABC.TXT"), build_lfn_checksum("ABC.TXU"));
}

TEST(BuildLfnEntries, SingleEntryLayout)
{
	std::vector<uint8_t> buffer(64, 0xaa);

	const auto written = build_lfn_entries(buffer, 0, "Test.txt", "TEST.TXT");
	ASSERT_EQ(written, 32u);

	EXPECT_EQ(buffer[0], 0x41);
	EXPECT_EQ(buffer[11], 0x0f);
	EXPECT_EQ(buffer[12], 0x00);
	EXPECT_EQ(buffer[13], build_lfn_checksum("TEST.TXT"));
	EXPECT_EQ(read_char(buffer, 26), 0x0000);

	// Characters 1 to 5
	EXPECT_EQ(read_char(buffer, 1), u'T');
	EXPECT_EQ(read_char(buffer, 3), u'e');
	EXPECT_EQ(read_char(buffer, 5), u's');
	EXPECT_EQ(read_char(buffer, 7), u't');
	EXPECT_EQ(read_char(buffer, 9), u'.');

	// Characters 6 to 11, the name ends after the 8th one
	EXPECT_EQ(read_char(buffer, 14), u't');
	EXPECT_EQ(read_char(buffer, 16), u'x');
	EXPECT_EQ(read_char(buffer, 18), u't');
	EXPECT_EQ(read_char(buffer, 20), 0x0000);
	EXPECT_EQ(read_char(buffer, 22), 0xffff);
	EXPECT_EQ(read_char(buffer, 24), 0xffff);

	// Characters 12 and 13
	EXPECT_EQ(read_char(buffer, 28), 0xffff);
	EXPECT_EQ(read_char(buffer, 30), 0xffff);

	// Nothing written past the entry
	EXPECT_TRUE(std::all_of(buffer.begin() + 32, buffer.end(), [](const uint8_t b) {
		return b == 0xaa;
	}));
}

TEST(BuildLfnEntries, ExactMultipleHasNoPadding)
{
	std::vector<uint8_t> buffer(32, 0);

	ASSERT_EQ(build_lfn_entries(buffer, 0, "abcdefghi.txt", "ABCDEF~1.TXT"), 32u);

	EXPECT_EQ(buffer[0], 0x41);
	EXPECT_EQ(read_char(buffer, 22), u'.');
	EXPECT_EQ(read_char(buffer, 24), u't');
	EXPECT_EQ(read_char(buffer, 28), u'x');
	EXPECT_EQ(read_char(buffer, 30), u't');
}

TEST(BuildLfnEntries, HighestOrdinalFirst)
{
	const std::string long_name = "abcdefghijklmnopqrstuvwxyz0";
	const std::string short_name = "ABCDEF~1";
	std::vector<uint8_t> buffer(96, 0);

	ASSERT_EQ(build_lfn_entries(buffer, 0, long_name, short_name), 96u);

	EXPECT_EQ(buffer[0], 0x43);
	EXPECT_EQ(buffer[32], 0x02);
	EXPECT_EQ(buffer[64], 0x01);

	const auto checksum = build_lfn_checksum(short_name);
	EXPECT_EQ(buffer[13], checksum);
	EXPECT_EQ(buffer[32 + 13], checksum);
	EXPECT_EQ(buffer[64 + 13], checksum);

	// The last entry in the directory holds the start of the name
	EXPECT_EQ(read_char(buffer, 64 + 1), u'a');
	EXPECT_EQ(read_char(buffer, 32 + 1), u'n');

	// The first entry holds the 27th character, the terminator and padding
	EXPECT_EQ(read_char(buffer, 1), u'0');
	EXPECT_EQ(read_char(buffer, 3), 0x0000);
	EXPECT_EQ(read_char(buffer, 5), 0xffff);
	EXPECT_EQ(read_char(buffer, 30), 0xffff);
}

TEST(BuildLfnEntries, WritesAtOffset)
{
	std::vector<uint8_t> buffer(128, 0);

	ASSERT_EQ(build_lfn_entries(buffer, 64, "Test.txt", "TEST.TXT"), 32u);
	EXPECT_EQ(buffer[0], 0x00);
	EXPECT_EQ(buffer[64], 0x41);
	EXPECT_EQ(buffer[64 + 11], 0x0f);
}

TEST(BuildLfnEntries, NonAsciiCharacters)
{
	std::vector<uint8_t> buffer(32, 0);

	ASSERT_EQ(build_lfn_entries(buffer, 0, "\xC3\xA9t\xC3\xA9", "ETE~1"), 32u);
	EXPECT_EQ(read_char(buffer, 1), 0x00e9);
	EXPECT_EQ(read_char(buffer, 3), u't');
	EXPECT_EQ(read_char(buffer, 5), 0x00e9);
	EXPECT_EQ(read_char(buffer, 7), 0x0000);
}

TEST(BuildLfnEntries, RejectsEmptyName)
{
	std::vector<uint8_t> buffer(32, 0);
	EXPECT_EQ(build_lfn_entries(buffer, 0, "", "A"), 0u);
}

TEST(BuildLfnEntries, RejectsTooLongName)
{
	std::vector<uint8_t> buffer(32 * 21, 0);

	EXPECT_EQ(build_lfn_entries(buffer, 0, std::string(256, 'a'), "AAAAAA~1"), 0u);
	EXPECT_TRUE(std::all_of(buffer.begin(), buffer.end(), [](const uint8_t b) {
		return b == 0;
	}));

	EXPECT_EQ(build_lfn_entries(buffer, 0, std::string(255, 'a'), "AAAAAA~1"),
	          32u * LfnMaxEntries);
}

TEST(BuildLfnEntries, RejectsSmallBuffer)
{
	std::vector<uint8_t> buffer(48, 0);

	EXPECT_EQ(build_lfn_entries(buffer, 0, "longfilename.txt", "LONGFI~1.TXT"), 0u);
	EXPECT_EQ(build_lfn_entries(buffer, 32, "Test.txt", "TEST.TXT"), 0u);
	EXPECT_EQ(build_lfn_entries(buffer, 64, "Test.txt", "TEST.TXT"), 0u);
	EXPECT_TRUE(std::all_of(buffer.begin(), buffer.end(), [](const uint8_t b) {
		return b == 0;
	}));
}

TEST(TotalDirEntries, MixedNames)
{
	const std::vector<DirectoryRecord> records = {
	        {"FILE.TXT", FatAttributeFlags::Archive},
	        {"longfilename.txt", FatAttributeFlags::Archive},
	        {"SHORT.DAT", FatAttributeFlags::Archive},
	        {"My Document.doc", FatAttributeFlags::Archive},
	};
	EXPECT_EQ(get_total_dir_entries(records), 8);
}

TEST(TotalDirEntries, VolumeLabelCountsOnce)
{
	const std::vector<DirectoryRecord> records = {
	        {"My Volume Label", FatAttributeFlags::Volume},
	        {"A.TXT", FatAttributeFlags::Archive},
	        {"B.TXT", FatAttributeFlags::Archive},
	};
	EXPECT_EQ(get_total_dir_entries(records), 3);
}

TEST(TotalDirEntries, SingleLongName)
{
	const std::vector<DirectoryRecord> records = {
	        {"longfilename.txt", FatAttributeFlags::Archive},
	};
	EXPECT_EQ(get_total_dir_entries(records), 3);
}

TEST(TotalDirEntries, Empty)
{
	EXPECT_EQ(get_total_dir_entries({}), 0);
}

} // namespace
