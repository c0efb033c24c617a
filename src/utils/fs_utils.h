// SPDX-FileCopyrightText:  2020-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_FS_UTILS_H
#define FATIMG_FS_UTILS_H

#include <algorithm>
#include <cinttypes>
#include <cstdio>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "misc/std_filesystem.h"

struct DosDateTime {
	uint16_t date = 0;
	uint16_t time = 0;
};

struct FileCloser {
	void operator()(FILE* fp) const
	{
		if (fp) {
			fclose(fp);
		}
	}
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

// A single entry of a host directory listing
struct HostDirEntry {
	std_fs::path path  = {};
	std::string name   = {};
	bool is_directory  = false;
	bool is_hidden     = false;
	bool is_read_only  = false;
	uint64_t size      = 0;
	DosDateTime time   = {};
};

constexpr uint16_t DOS_PackTime(const uint16_t hour,
                                const uint16_t min,
                                const uint16_t sec) noexcept
{
	const auto h_bits = 0b1111100000000000 & (hour << 11);
	const auto m_bits = 0b0000011111100000 & (min << 5);
	const auto s_bits = 0b0000000000011111 & (sec / 2);
	const auto packed = h_bits | m_bits | s_bits;
	return static_cast<uint16_t>(packed);
}

constexpr uint16_t DOS_PackDate(const uint16_t year,
                                const uint16_t mon,
                                const uint16_t day) noexcept
{
	const int delta_year = year - 1980;

	constexpr int delta_year_min = 0;
	constexpr int delta_year_max = 127;
	const auto years_after_1980  = static_cast<uint16_t>(
                std::clamp(delta_year, delta_year_min, delta_year_max));

	const auto y_bits = 0b1111111000000000 & (years_after_1980 << 9);
	const auto m_bits = 0b0000000111100000 & (mon << 5);
	const auto d_bits = 0b0000000000011111 & day;
	const auto packed = y_bits | m_bits | d_bits;
	return static_cast<uint16_t>(packed);
}

// Pack the local time representation of the given time_t value. Times before
// 1980 are clamped to the start of the DOS epoch.
DosDateTime to_dos_date_time(const std::time_t time);

// Check if the given path corresponds to an existing file or directory.
bool path_exists(const std_fs::path& path) noexcept;

// Is the file hidden according to the host conventions (dot files)?
bool is_hidden_by_host(const std_fs::path& pathname);

// Convert a filesystem time to a raw time_t value
std::time_t to_time_t(const std_fs::file_time_type& fs_time);

// Returns the modification time of the host file as DOS date and time
std::optional<DosDateTime> get_dos_file_time(const std_fs::path& path);

// Reads the whole host file, returns an empty optional on failure
std::optional<std::vector<uint8_t>> read_host_file(const std_fs::path& path);

// Lists the files and directories inside the host directory, sorted by name.
// Entries that are neither regular files nor directories are skipped, as are
// symbolic links to directories. Returns an empty optional if the directory
// can't be read.
std::optional<std::vector<HostDirEntry>> list_host_directory(const std_fs::path& path);

#endif
