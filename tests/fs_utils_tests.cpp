// SPDX-FileCopyrightText:  2020-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "utils/fs_utils.h"

#include <gtest/gtest.h>

#include <ctime>
#include <string>
#include <vector>

#include <unistd.h>
#include <utime.h>

#include "temp_directory.h"

namespace {

TEST(DosPackTime, Values)
{
	static_assert(DOS_PackTime(0, 0, 0) == 0);
	static_assert(DOS_PackTime(12, 34, 56) == ((12 << 11) | (34 << 5) | 28));
	static_assert(DOS_PackTime(23, 59, 59) == ((23 << 11) | (59 << 5) | 29));
	EXPECT_EQ(DOS_PackTime(1, 2, 3), (1 << 11) | (2 << 5) | 1);
}

TEST(DosPackDate, Values)
{
	static_assert(DOS_PackDate(1980, 1, 1) == ((0 << 9) | (1 << 5) | 1));
	static_assert(DOS_PackDate(2020, 6, 15) == ((40 << 9) | (6 << 5) | 15));
	EXPECT_EQ(DOS_PackDate(2107, 12, 31), (127 << 9) | (12 << 5) | 31);
}

TEST(DosPackDate, ClampedToDosEpoch)
{
	EXPECT_EQ(DOS_PackDate(1970, 1, 1), DOS_PackDate(1980, 1, 1));
	EXPECT_EQ(DOS_PackDate(2200, 1, 1), DOS_PackDate(2107, 1, 1));
}

std::time_t make_local_time(const int year, const int month, const int day,
                            const int hour, const int min, const int sec)
{
	struct tm local_time = {};
	local_time.tm_year   = year - 1900;
	local_time.tm_mon    = month - 1;
	local_time.tm_mday   = day;
	local_time.tm_hour   = hour;
	local_time.tm_min    = min;
	local_time.tm_sec    = sec;
	local_time.tm_isdst  = -1;
	return mktime(&local_time);
}

TEST(ToDosDateTime, LocalTime)
{
	const auto result = to_dos_date_time(make_local_time(1999, 12, 31, 23, 59, 58));
	EXPECT_EQ(result.date, DOS_PackDate(1999, 12, 31));
	EXPECT_EQ(result.time, DOS_PackTime(23, 59, 58));
}

TEST(ToDosDateTime, BeforeDosEpoch)
{
	const auto result = to_dos_date_time(make_local_time(1975, 5, 5, 10, 0, 0));
	EXPECT_EQ(result.date, DOS_PackDate(1980, 1, 1));
	EXPECT_EQ(result.time, 0);
}

TEST(IsHiddenByHost, DotFiles)
{
	EXPECT_TRUE(is_hidden_by_host(".profile"));
	EXPECT_TRUE(is_hidden_by_host("dir/.git"));
	EXPECT_FALSE(is_hidden_by_host("README.TXT"));
	EXPECT_FALSE(is_hidden_by_host("dir/file.txt"));
	EXPECT_FALSE(is_hidden_by_host("."));
	EXPECT_FALSE(is_hidden_by_host(".."));
}

class HostFilesTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		ASSERT_TRUE(temp_dir.IsValid());
	}

	TempDirectory temp_dir;
};

TEST_F(HostFilesTest, PathExists)
{
	const auto file_path = temp_dir.WriteFile("FILE.TXT", "data");

	EXPECT_TRUE(path_exists(temp_dir.GetPath()));
	EXPECT_TRUE(path_exists(file_path));
	EXPECT_FALSE(path_exists(temp_dir.GetPath() / "missing"));
}

TEST_F(HostFilesTest, ReadFile)
{
	const auto path = temp_dir.WriteFile("FILE.TXT", "Content of FILE.TXT\n");

	const auto content = read_host_file(path);
	ASSERT_TRUE(content);
	EXPECT_EQ(std::string(content->begin(), content->end()), "Content of FILE.TXT\n");
}

TEST_F(HostFilesTest, ReadLargeFile)
{
	std::vector<uint8_t> data(200 * 1024 + 17);
	for (size_t i = 0; i < data.size(); ++i) {
		data[i] = static_cast<uint8_t>(i * 7);
	}
	const auto path = temp_dir.WriteFile("LARGE.BIN", data);

	const auto content = read_host_file(path);
	ASSERT_TRUE(content);
	EXPECT_EQ(*content, data);
}

TEST_F(HostFilesTest, ReadEmptyFile)
{
	const auto path = temp_dir.WriteFile("EMPTY.TXT", "");

	const auto content = read_host_file(path);
	ASSERT_TRUE(content);
	EXPECT_TRUE(content->empty());
}

TEST_F(HostFilesTest, ReadMissingFile)
{
	EXPECT_FALSE(read_host_file(temp_dir.GetPath() / "missing.txt"));
}

TEST_F(HostFilesTest, FileTime)
{
	const auto path      = temp_dir.WriteFile("OLD.TXT", "old");
	const auto timestamp = make_local_time(2001, 9, 8, 7, 6, 5);

	const struct utimbuf times = {timestamp, timestamp};
	ASSERT_EQ(utime(path.c_str(), &times), 0);

	const auto file_time = get_dos_file_time(path);
	ASSERT_TRUE(file_time);
	EXPECT_EQ(file_time->date, DOS_PackDate(2001, 9, 8));
	EXPECT_EQ(file_time->time, DOS_PackTime(7, 6, 4));

	EXPECT_FALSE(get_dos_file_time(temp_dir.GetPath() / "missing.txt"));
}

TEST_F(HostFilesTest, ListDirectorySorted)
{
	temp_dir.WriteFile("b.txt", "bb");
	temp_dir.WriteFile("A.TXT", "a");
	temp_dir.WriteFile(".hidden", "h");
	temp_dir.CreateDirectory("Sub Dir");
	temp_dir.WriteFile("Sub Dir/inner.txt", "inner");

	const auto entries = list_host_directory(temp_dir.GetPath());
	ASSERT_TRUE(entries);
	ASSERT_EQ(entries->size(), 4u);

	EXPECT_EQ((*entries)[0].name, ".hidden");
	EXPECT_TRUE((*entries)[0].is_hidden);
	EXPECT_FALSE((*entries)[0].is_directory);

	EXPECT_EQ((*entries)[1].name, "A.TXT");
	EXPECT_EQ((*entries)[1].size, 1u);
	EXPECT_FALSE((*entries)[1].is_hidden);

	EXPECT_EQ((*entries)[2].name, "Sub Dir");
	EXPECT_TRUE((*entries)[2].is_directory);
	EXPECT_EQ((*entries)[2].path, temp_dir.GetPath() / "Sub Dir");

	EXPECT_EQ((*entries)[3].name, "b.txt");
	EXPECT_EQ((*entries)[3].size, 2u);
}

TEST_F(HostFilesTest, ListSkipsDirectoryLinks)
{
	temp_dir.WriteFile("target/file.txt", "data");
	temp_dir.WriteFile("file.txt", "data");
	ASSERT_EQ(symlink((temp_dir.GetPath() / "target").c_str(),
	                  (temp_dir.GetPath() / "link").c_str()),
	          0);
	ASSERT_EQ(symlink((temp_dir.GetPath() / "file.txt").c_str(),
	                  (temp_dir.GetPath() / "file_link.txt").c_str()),
	          0);

	const auto entries = list_host_directory(temp_dir.GetPath());
	ASSERT_TRUE(entries);
	ASSERT_EQ(entries->size(), 3u);
	EXPECT_EQ((*entries)[0].name, "file.txt");
	EXPECT_EQ((*entries)[1].name, "file_link.txt");
	EXPECT_EQ((*entries)[1].size, 4u);
	EXPECT_EQ((*entries)[2].name, "target");
}

TEST_F(HostFilesTest, ListMissingDirectory)
{
	EXPECT_FALSE(list_host_directory(temp_dir.GetPath() / "missing"));

	const auto path = temp_dir.WriteFile("FILE.TXT", "data");
	EXPECT_FALSE(list_host_directory(path));
}

} // namespace
