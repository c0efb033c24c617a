// SPDX-FileCopyrightText:  2020-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "utils/fs_utils.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>

#include <unistd.h>

#include "misc/logging.h"

DosDateTime to_dos_date_time(const std::time_t time)
{
	struct tm datetime = {};
	if (!localtime_r(&time, &datetime)) {
		return {DOS_PackDate(1980, 1, 1), DOS_PackTime(0, 0, 0)};
	}

	constexpr int DosEpochYear = 1980;
	if (datetime.tm_year + 1900 < DosEpochYear) {
		return {DOS_PackDate(1980, 1, 1), DOS_PackTime(0, 0, 0)};
	}

	DosDateTime result = {};
	result.date = DOS_PackDate(static_cast<uint16_t>(datetime.tm_year + 1900),
	                           static_cast<uint16_t>(datetime.tm_mon + 1),
	                           static_cast<uint16_t>(datetime.tm_mday));
	result.time = DOS_PackTime(static_cast<uint16_t>(datetime.tm_hour),
	                           static_cast<uint16_t>(datetime.tm_min),
	                           static_cast<uint16_t>(datetime.tm_sec));
	return result;
}

bool path_exists(const std_fs::path& path) noexcept
{
	return (access(path.c_str(), F_OK) == 0);
}

bool is_hidden_by_host(const std_fs::path& pathname)
{
	const auto filename = pathname.filename().string();
	return filename.starts_with('.') && filename != "." && filename != "..";
}

std::time_t to_time_t(const std_fs::file_time_type& fs_time)
{
	using namespace std::chrono;
	constexpr auto fs_datum = std_fs::file_time_type{};

	// Subtracting file_time_type's default() and now() values gives us a
	// unitless scalar. which is then added-to by the system time - which
	// transforms the value into a system-time type.
	static auto fs_to_sys_delta = fs_datum -
	                              std_fs::file_time_type::clock::now() +
	                              system_clock::now();

	// Again, we subtract file_time_type's default() from the actual time
	// giving us another unitless scalar, and then add the previous system
	// time delta to transform it to a system-time type.
	const auto sys_time = time_point_cast<system_clock::duration>(
	        fs_time - fs_datum + fs_to_sys_delta);

	return system_clock::to_time_t(sys_time);
}

std::optional<DosDateTime> get_dos_file_time(const std_fs::path& path)
{
	std::error_code ec = {};
	const auto fs_time = std_fs::last_write_time(path, ec);
	if (ec) {
		LOG_WARNING("HOSTFS: Can't get modification time of '%s': %s",
		            path.string().c_str(),
		            ec.message().c_str());
		return {};
	}
	return to_dos_date_time(to_time_t(fs_time));
}

std::optional<std::vector<uint8_t>> read_host_file(const std_fs::path& path)
{
	FilePtr file(fopen(path.c_str(), "rb"));
	if (!file) {
		LOG_WARNING("HOSTFS: Can't open file '%s': %s",
		            path.string().c_str(),
		            strerror(errno));
		return {};
	}

	std::vector<uint8_t> content = {};

	constexpr size_t ChunkSize = 64 * 1024;
	size_t total_read          = 0;
	while (true) {
		content.resize(total_read + ChunkSize);
		const auto num_read = fread(content.data() + total_read,
		                            1,
		                            ChunkSize,
		                            file.get());
		total_read += num_read;
		if (num_read < ChunkSize) {
			break;
		}
	}
	content.resize(total_read);

	if (ferror(file.get())) {
		LOG_WARNING("HOSTFS: Error reading file '%s'", path.string().c_str());
		return {};
	}

	return content;
}

static bool is_read_only_by_host(const std_fs::path& path)
{
	return access(path.c_str(), W_OK) != 0;
}

std::optional<std::vector<HostDirEntry>> list_host_directory(const std_fs::path& path)
{
	std::error_code ec = {};
	if (!std_fs::is_directory(path, ec)) {
		LOG_WARNING("HOSTFS: '%s' is not a readable directory",
		            path.string().c_str());
		return {};
	}

	std::vector<HostDirEntry> entries = {};

	auto it = std_fs::directory_iterator(path, ec);
	for (; !ec && it != std_fs::directory_iterator(); it.increment(ec)) {
		const auto& entry_path = it->path();

		std::error_code entry_ec = {};
		const auto link_status   = it->symlink_status(entry_ec);
		if (entry_ec) {
			LOG_WARNING("HOSTFS: Can't get status of '%s': %s",
			            entry_path.string().c_str(),
			            entry_ec.message().c_str());
			return {};
		}

		HostDirEntry entry = {};
		entry.path         = entry_path;
		entry.name         = entry_path.filename().string();
		entry.is_hidden    = is_hidden_by_host(entry_path);

		if (std_fs::is_directory(link_status)) {
			entry.is_directory = true;
		} else if (std_fs::is_symlink(link_status) &&
		           std_fs::is_directory(entry_path, entry_ec)) {
			LOG(LOG_HOSTFS, LOG_NORMAL)("HOSTFS: Skipping symbolic link to directory '%s'",
			                            entry_path.string().c_str());
			continue;
		} else if (!std_fs::is_regular_file(entry_path, entry_ec)) {
			LOG(LOG_HOSTFS, LOG_NORMAL)("HOSTFS: Skipping '%s', not a regular file",
			                            entry_path.string().c_str());
			continue;
		} else {
			entry.size = std_fs::file_size(entry_path, entry_ec);
			if (entry_ec) {
				LOG_WARNING("HOSTFS: Can't get size of '%s': %s",
				            entry_path.string().c_str(),
				            entry_ec.message().c_str());
				return {};
			}
			entry.is_read_only = is_read_only_by_host(entry_path);
		}

		const auto time = get_dos_file_time(entry_path);
		if (!time) {
			return {};
		}
		entry.time = *time;

		entries.emplace_back(std::move(entry));
	}

	if (ec) {
		LOG_WARNING("HOSTFS: Can't read directory '%s': %s",
		            path.string().c_str(),
		            ec.message().c_str());
		return {};
	}

	std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
		return a.name < b.name;
	});

	return entries;
}
