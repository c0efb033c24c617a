// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "dos/fat_image_builder.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <ctime>
#include <system_error>
#include <type_traits>
#include <utility>

#include "dos/dos_names.h"
#include "dos/fat_lfn.h"
#include "dos/fat_table.h"
#include "misc/logging.h"
#include "misc/unicode.h"
#include "utils/byteorder.h"
#include "utils/math_utils.h"
#include "utils/string_utils.h"

namespace {

// Generate a Volume Serial Number based on the current date/time.
// High Word = (Seconds << 8) + Minutes + Hours
// Low Word  = (Year) + (Month << 8) + Day
// Result    = (High Word << 16) + Low Word
uint32_t generate_volume_serial()
{
	auto now = std::time(nullptr);

	struct tm local_time = {};
	// Fallback
	if (!localtime_r(&now, &local_time)) {
		return 0xDEADBEEF;
	}

	// tm_year is years since 1900.
	auto year  = static_cast<uint32_t>(local_time.tm_year + 1900);
	auto month = static_cast<uint32_t>(local_time.tm_mon + 1);
	auto day   = static_cast<uint32_t>(local_time.tm_mday);
	auto hour  = static_cast<uint32_t>(local_time.tm_hour);
	auto min   = static_cast<uint32_t>(local_time.tm_min);
	auto sec   = static_cast<uint32_t>(local_time.tm_sec);

	// DOS Algorithm
	auto lo = static_cast<uint32_t>(year + (month << 8) + day);
	auto hi = static_cast<uint32_t>((sec << 8) + min + hour);

	return (hi << 16) + lo;
}

// Write a little-endian value to a destination pointer
template <typename PtrT, typename ValT>
inline void write_le(PtrT* dest, ValT value)
{
	static_assert(std::is_integral_v<PtrT>, "Destination must be an integer type");

	auto* raw_dest = reinterpret_cast<uint8_t*>(dest);

	if constexpr (sizeof(PtrT) == 2) {
		host_writew(raw_dest, static_cast<uint16_t>(value));

	} else if constexpr (sizeof(PtrT) == 4) {
		host_writed(raw_dest, static_cast<uint32_t>(value));

	} else {
		static_assert(sizeof(PtrT) == 2 || sizeof(PtrT) == 4,
		              "write_le only supports 16-bit and 32-bit destinations");
	}
}

// Volume labels are upper case, up to 11 characters; spaces are allowed
std::string make_volume_label(const std::string& input)
{
	std::string label = {};
	for (const auto c : input) {
		if (label.size() >= ShortNameLength) {
			break;
		}
		const auto uc = static_cast<uint8_t>(c);
		if (uc < 32 || uc >= 127 || c == '.' || is_special_character(c)) {
			label += '_';
		} else {
			label += c;
		}
	}
	trim(label);
	upcase(label);
	return label;
}

uint32_t get_directory_clusters(const int num_entries, const uint32_t cluster_size)
{
	const auto size_bytes = static_cast<uint32_t>(num_entries) * DirEntrySizeBytes;
	return std::max(ceil_udivide(size_bytes, cluster_size), 1u);
}

uint32_t get_file_clusters(const size_t file_size, const uint32_t cluster_size)
{
	return static_cast<uint32_t>(ceil_udivide(file_size, static_cast<size_t>(cluster_size)));
}

// FAT directories can't hold more entries than this
constexpr int MaxDirectoryEntries = 65536;

constexpr uint64_t MaxFileSize = UINT32_MAX;

} // namespace

std::string to_string(const BuildError error)
{
	switch (error) {
	case BuildError::None: return "no error";
	case BuildError::NameTooLong: return "file name is too long";
	case BuildError::ShortNameCollisionExhausted:
		return "no unique short name available";
	case BuildError::DirectoryFull: return "too many entries in directory";
	case BuildError::ImageCapacityExceeded:
		return "files do not fit into the disk image";
	case BuildError::HostReadFailure: return "could not read host file";
	case BuildError::UnknownDiskType: return "unknown disk type";
	}
	return "unknown error";
}

bool FatImageBuilder::Fail(const BuildError error, const std::string& context)
{
	LOG_WARNING("FAT: Can't build image, %s: '%s'",
	            to_string(error).c_str(),
	            context.c_str());
	last_error = error;
	return false;
}

std::optional<DiskImage> FatImageBuilder::BuildDiskFromFiles(const std_fs::path& directory,
                                                             const BuildSettings& _settings)
{
	settings   = _settings;
	label      = make_volume_label(settings.label);
	last_error = BuildError::None;
	file_table.clear();
	directories.clear();

	constexpr uint8_t MaxFatCopies = 2;
	if (settings.fat_copies == 0 || settings.fat_copies > MaxFatCopies) {
		LOG_WARNING("FAT: Invalid number of FAT copies %u, using %u",
		            static_cast<unsigned int>(settings.fat_copies),
		            static_cast<unsigned int>(MaxFatCopies));
		settings.fat_copies = MaxFatCopies;
	}

	std::error_code ec = {};
	if (!std_fs::is_directory(directory, ec)) {
		Fail(BuildError::HostReadFailure, directory.string());
		return {};
	}

	// Root directory
	directories.emplace_back();

	if (!ScanDirectory(directory, "", 0) || !CountDirectoryEntries() ||
	    !SelectGeometry(directory.string())) {
		return {};
	}

	std::vector<uint8_t> raw(static_cast<size_t>(geometry.GetTotalSectors()) *
	                                 SectorSizeBytes,
	                         0);

	const auto volume = std::span<uint8_t>(raw).subspan(
	        static_cast<size_t>(layout.hidden_sectors) * SectorSizeBytes,
	        static_cast<size_t>(layout.volume_sectors) * SectorSizeBytes);

	WriteMbr(raw);
	WriteBootSector(volume);

	FatTable fat(layout.fat_bits, layout.total_clusters, layout.sectors_per_fat);
	fat.SetMediaDescriptor(geometry.media_descriptor);
	if (!AllocateClusters(fat)) {
		return {};
	}

	for (const auto& node : directories) {
		std::span<uint8_t> buffer = {};
		if (node.record) {
			const auto& record = file_table[*node.record];
			buffer = GetClusterSpan(volume, record.first_cluster, record.num_clusters);
		} else {
			buffer = volume.subspan(static_cast<size_t>(layout.GetFirstRootDirSector()) *
			                                SectorSizeBytes,
			                        static_cast<size_t>(layout.root_dir_sectors) *
			                                SectorSizeBytes);
		}
		if (!WriteDirectory(node, buffer)) {
			return {};
		}
	}

	for (const auto& record : file_table) {
		if (record.IsDirectory() || record.content.empty()) {
			continue;
		}
		auto destination = GetClusterSpan(volume, record.first_cluster, record.num_clusters);
		std::copy(record.content.begin(), record.content.end(), destination.begin());
	}

	const auto& fat_data = fat.GetData();
	for (uint32_t i = 0; i < layout.fat_copies; ++i) {
		const auto fat_sector = layout.GetFirstFatSector() + i * layout.sectors_per_fat;
		std::copy(fat_data.begin(),
		          fat_data.end(),
		          volume.begin() + static_cast<std::ptrdiff_t>(fat_sector) * SectorSizeBytes);
	}

	LOG_INFO("FAT: Stored %u entries, %u of %u clusters used",
	         static_cast<unsigned int>(file_table.size()),
	         fat.GetTotalClusters() - fat.GetFreeClusters(),
	         fat.GetTotalClusters());

	return DiskImage(geometry, raw);
}

bool FatImageBuilder::ScanDirectory(const std_fs::path& host_path,
                                    const std::string& dos_path, const size_t node_index)
{
	const auto entries = list_host_directory(host_path);
	if (!entries) {
		return Fail(BuildError::HostReadFailure, host_path.string());
	}

	std::vector<FileRecord> records = {};
	for (const auto& entry : *entries) {
		if (entry.is_hidden && !settings.include_hidden) {
			LOG(LOG_HOSTFS, LOG_NORMAL)("HOSTFS: Skipping hidden '%s'",
			                            entry.path.string().c_str());
			continue;
		}
		if (ucs2_length(entry.name) > LfnMaxLength) {
			return Fail(BuildError::NameTooLong, entry.path.string());
		}
		if (!entry.is_directory && entry.size > MaxFileSize) {
			return Fail(BuildError::ImageCapacityExceeded, entry.path.string());
		}

		FileRecord record = {};
		record.host_path  = entry.path;
		record.long_name  = entry.name;
		record.timestamp  = entry.time;

		uint8_t attributes = entry.is_directory ? FatAttributeFlags::Directory
		                                        : FatAttributeFlags::Archive;
		if (entry.is_hidden) {
			attributes |= FatAttributeFlags::Hidden;
		}
		if (entry.is_read_only) {
			attributes |= FatAttributeFlags::ReadOnly;
		}
		record.attributes = attributes;

		if (!entry.is_directory) {
			auto content = read_host_file(entry.path);
			if (!content) {
				return Fail(BuildError::HostReadFailure, entry.path.string());
			}
			record.content = std::move(*content);
		}
		records.emplace_back(std::move(record));
	}

	// Names which are valid 8.3 names already keep them, the rest get
	// generated names which must not collide with them
	ShortNameSet used_names = {};
	for (auto& record : records) {
		if (!needs_lfn(record.long_name)) {
			record.short_name = record.long_name;
			used_names.insert(record.short_name);
		}
	}
	for (auto& record : records) {
		if (!record.short_name.empty()) {
			continue;
		}
		const auto short_name = generate_short_name(record.long_name, used_names);
		if (!short_name) {
			return Fail(BuildError::ShortNameCollisionExhausted,
			            record.host_path.string());
		}
		record.short_name = *short_name;
		used_names.insert(record.short_name);
	}

	for (auto& record : records) {
		record.dos_path = dos_path + "\\" + record.short_name;
		record.num_dir_entries = get_dir_entry_count(record.long_name,
		                                             record.attributes);

		LOG(LOG_FAT, LOG_NORMAL)("FAT: '%s' stored as '%s'",
		                         record.host_path.string().c_str(),
		                         record.dos_path.c_str());

		const auto record_index = file_table.size();
		const auto is_directory = record.IsDirectory();
		const auto child_host_path = record.host_path;
		const auto child_dos_path  = record.dos_path;

		file_table.emplace_back(std::move(record));
		directories[node_index].children.push_back(record_index);

		if (is_directory) {
			DirectoryNode child = {};
			child.record        = record_index;
			child.parent        = node_index;
			directories.emplace_back(std::move(child));

			if (!ScanDirectory(child_host_path, child_dos_path, directories.size() - 1)) {
				return false;
			}
		}
	}
	return true;
}

bool FatImageBuilder::CountDirectoryEntries()
{
	for (auto& node : directories) {
		std::vector<DirectoryRecord> records = {};
		if (node.record) {
			records.push_back({".", FatAttributeFlags::Directory});
			records.push_back({"..", FatAttributeFlags::Directory});
		} else if (!label.empty()) {
			records.push_back({label, FatAttributeFlags::Volume});
		}
		for (const auto index : node.children) {
			const auto& record = file_table[index];
			records.push_back({record.long_name, record.attributes});
		}

		node.num_dir_entries = get_total_dir_entries(records);

		if (node.record && node.num_dir_entries > MaxDirectoryEntries) {
			return Fail(BuildError::DirectoryFull,
			            file_table[*node.record].host_path.string());
		}
	}
	return true;
}

uint64_t FatImageBuilder::GetRequiredClusters(const VolumeLayout& volume_layout) const
{
	const auto cluster_size = volume_layout.GetClusterSizeBytes();

	uint64_t clusters = 0;
	for (const auto& record : file_table) {
		if (!record.IsDirectory()) {
			clusters += get_file_clusters(record.content.size(), cluster_size);
		}
	}
	for (const auto& node : directories) {
		if (node.record) {
			clusters += get_directory_clusters(node.num_dir_entries, cluster_size);
		}
	}
	return clusters;
}

bool FatImageBuilder::FitsGeometry(const DiskGeometry& candidate,
                                   std::optional<VolumeLayout>& candidate_layout,
                                   BuildError& error) const
{
	const auto& root = directories.front();
	if (root.num_dir_entries > candidate.root_entries) {
		error = BuildError::DirectoryFull;
		return false;
	}

	candidate_layout = compute_volume_layout(candidate, settings.fat_copies);
	if (!candidate_layout ||
	    GetRequiredClusters(*candidate_layout) > candidate_layout->total_clusters) {
		error = BuildError::ImageCapacityExceeded;
		return false;
	}
	return true;
}

bool FatImageBuilder::SelectGeometry(const std::string& source)
{
	std::optional<VolumeLayout> candidate_layout = {};
	auto error = BuildError::None;

	if (!settings.disk_type.empty()) {
		const auto preset = find_geometry_preset(settings.disk_type);
		if (!preset) {
			return Fail(BuildError::UnknownDiskType, settings.disk_type);
		}
		if (!FitsGeometry(*preset, candidate_layout, error)) {
			return Fail(error, source);
		}
		geometry = *preset;
		layout   = *candidate_layout;

	} else {
		bool root_fits = false;
		bool found     = false;
		for (const auto& preset : get_geometry_presets()) {
			if (FitsGeometry(preset, candidate_layout, error)) {
				geometry = preset;
				layout   = *candidate_layout;
				found    = true;
				break;
			}
			root_fits = root_fits || (error != BuildError::DirectoryFull);
		}
		if (!found) {
			return Fail(root_fits ? BuildError::ImageCapacityExceeded
			                      : BuildError::DirectoryFull,
			            source);
		}
	}

	LOG_INFO("FAT: Using geometry '%s' (C:%u H:%u S:%u), FAT%u with %u clusters of %u bytes",
	         geometry.name.c_str(),
	         geometry.cylinders,
	         geometry.heads,
	         geometry.sectors,
	         static_cast<unsigned int>(layout.fat_bits),
	         layout.total_clusters,
	         layout.GetClusterSizeBytes());
	return true;
}

bool FatImageBuilder::AllocateClusters(FatTable& fat)
{
	std::vector<std::optional<size_t>> nodes_by_record(file_table.size());
	for (size_t i = 0; i < directories.size(); ++i) {
		if (directories[i].record) {
			nodes_by_record[*directories[i].record] = i;
		}
	}

	const auto cluster_size = layout.GetClusterSizeBytes();

	for (size_t i = 0; i < file_table.size(); ++i) {
		auto& record = file_table[i];

		const auto node = nodes_by_record[i];
		record.num_clusters = node ? get_directory_clusters(directories[*node].num_dir_entries,
		                                                    cluster_size)
		                           : get_file_clusters(record.content.size(),
		                                               cluster_size);

		const auto first_cluster = fat.AllocateChain(record.num_clusters);
		if (!first_cluster) {
			return Fail(BuildError::ImageCapacityExceeded, record.host_path.string());
		}
		record.first_cluster = *first_cluster;
	}
	return true;
}

std::span<uint8_t> FatImageBuilder::GetClusterSpan(std::span<uint8_t> volume,
                                                   const uint32_t first_cluster,
                                                   const uint32_t num_clusters) const
{
	const auto offset = static_cast<size_t>(layout.GetClusterSector(first_cluster)) *
	                    SectorSizeBytes;
	return volume.subspan(offset,
	                      static_cast<size_t>(num_clusters) * layout.GetClusterSizeBytes());
}

void FatImageBuilder::WriteMbr(std::vector<uint8_t>& raw) const
{
	if (geometry.is_floppy) {
		return;
	}

	auto buffer = raw.data();
	std::copy(std::begin(BootCode::Printer), std::end(BootCode::Printer), buffer);

	// Patch MBR Code
	auto mbr_string_addr = static_cast<uint16_t>(BootCode::PhysicalAddress +
	                                             BootCode::StringOffsetInCode);
	host_writew(buffer + BootCode::PatchOffsetInCode, mbr_string_addr);

	constexpr auto PartitionFlagActive   = 0x80;
	constexpr auto PartitionEntry1Offset = 0x1BE;

	// Partition 1 Entry
	auto* partition = buffer + PartitionEntry1Offset;
	// Mark partition as active
	partition[0] = PartitionFlagActive;

	auto start_chs = lba_to_chs(layout.hidden_sectors,
	                            static_cast<int>(geometry.cylinders),
	                            static_cast<int>(geometry.heads),
	                            static_cast<int>(geometry.sectors));
	std::copy(start_chs.begin(), start_chs.end(), partition + 1);

	constexpr uint64_t BytesPerMegabyte = 1024 * 1024;
	const auto total_size = static_cast<uint64_t>(geometry.GetTotalSectors()) *
	                        SectorSizeBytes;

	auto partition_type = FatPartitionType::Fat12;
	if (layout.fat_bits == 16) {
		if (layout.volume_sectors < 65536) {
			partition_type = FatPartitionType::Fat16_Small;
		} else if (total_size > 528 * BytesPerMegabyte) {
			// 528MB to 2GB: suggest LBA-aware FAT16
			partition_type = FatPartitionType::Fat16_LBA;
		} else {
			partition_type = FatPartitionType::Fat16B;
		}
	}
	partition[4] = static_cast<uint8_t>(partition_type);

	// End CHS
	auto end_chs = lba_to_chs(geometry.GetTotalSectors() - 1,
	                          static_cast<int>(geometry.cylinders),
	                          static_cast<int>(geometry.heads),
	                          static_cast<int>(geometry.sectors));
	std::copy(end_chs.begin(), end_chs.end(), partition + 5);

	// LBA Start & Size
	host_writed(partition + 8, layout.hidden_sectors);
	host_writed(partition + 12, layout.volume_sectors);

	buffer[510] = 0x55;
	buffer[511] = 0xAA;
}

void FatImageBuilder::WriteBootSector(std::span<uint8_t> volume) const
{
	auto* boot_sector = reinterpret_cast<FatBootSector*>(volume.data());

	// JMP Instruction
	boot_sector->jump[0] = 0xEB;
	boot_sector->jump[1] = 0x3C;
	boot_sector->jump[2] = 0x90;

	auto oem_name_str = right_pad(settings.oem_name, 8, ' ');
	std::copy(oem_name_str.begin(), oem_name_str.end(), boot_sector->oem_name);

	write_le(&boot_sector->bytes_per_sector, SectorSizeBytes);
	boot_sector->sectors_per_cluster = static_cast<uint8_t>(layout.sectors_per_cluster);
	write_le(&boot_sector->reserved_sectors, layout.reserved_sectors);
	boot_sector->fat_copies = layout.fat_copies;
	write_le(&boot_sector->root_entries, layout.root_entries);

	if (layout.volume_sectors < 65536) {
		write_le(&boot_sector->total_sectors_16, layout.volume_sectors);
	} else {
		write_le(&boot_sector->total_sectors_16, 0);
	}

	boot_sector->media_descriptor = geometry.media_descriptor;
	write_le(&boot_sector->sectors_per_fat_16, layout.sectors_per_fat);
	write_le(&boot_sector->sectors_per_track, geometry.sectors);
	write_le(&boot_sector->heads, geometry.heads);
	write_le(&boot_sector->hidden_sectors, layout.hidden_sectors);
	write_le(&boot_sector->total_sectors_32,
	         (layout.volume_sectors > UINT16_MAX) ? layout.volume_sectors : 0);

	constexpr auto BootSectorDriveNumberFloppy   = 0x00;
	constexpr auto BootSectorDriveNumberHardDisk = 0x80;
	boot_sector->drive_number   = geometry.is_floppy ? BootSectorDriveNumberFloppy
	                                                 : BootSectorDriveNumberHardDisk;
	boot_sector->boot_signature = 0x29;

	write_le(&boot_sector->serial_number,
	         settings.volume_serial ? *settings.volume_serial
	                                : generate_volume_serial());

	auto label_str = right_pad(label.empty() ? "NO NAME" : label, ShortNameLength, ' ');
	std::copy(label_str.begin(), label_str.end(), boot_sector->label);

	auto fs_type_str = right_pad((layout.fat_bits == 16) ? "FAT16" : "FAT12", 8, ' ');
	std::copy(fs_type_str.begin(), fs_type_str.end(), boot_sector->fs_type);

	// Copy fallback boot code
	std::copy(std::begin(BootCode::Printer),
	          std::end(BootCode::Printer),
	          boot_sector->boot_code);
	// Patch MOV SI address
	auto string_addr = static_cast<uint16_t>(BootCode::PhysicalAddress +
	                                         BootCode::OffsetFat16 +
	                                         BootCode::StringOffsetInCode);
	host_writew(boot_sector->boot_code + BootCode::PatchOffsetInCode, string_addr);

	// Boot Sector Signature
	boot_sector->signature[0] = 0x55;
	boot_sector->signature[1] = 0xAA;
}

void FatImageBuilder::WriteDirectoryEntry(std::span<uint8_t> buffer, const size_t offset,
                                          const std::array<uint8_t, ShortNameLength>& dir_name,
                                          const FatAttributeFlags attributes,
                                          const DosDateTime timestamp,
                                          const uint32_t first_cluster,
                                          const uint32_t file_size) const
{
	DirectoryEntry entry = {};
	std::copy(dir_name.begin(), dir_name.end(), entry.filename);
	entry.attributes = attributes._data;

	write_le(&entry.create_time, timestamp.time);
	write_le(&entry.create_date, timestamp.date);
	write_le(&entry.last_access_date, timestamp.date);
	write_le(&entry.write_time, timestamp.time);
	write_le(&entry.write_date, timestamp.date);
	write_le(&entry.first_cluster_low, first_cluster);
	write_le(&entry.file_size, file_size);

	std::memcpy(buffer.data() + offset, &entry, sizeof(entry));
}

bool FatImageBuilder::WriteDirectory(const DirectoryNode& node, std::span<uint8_t> buffer)
{
	size_t offset = 0;

	if (node.record) {
		const auto& self = file_table[*node.record];

		// The root directory is referred to as cluster 0
		uint32_t parent_cluster = 0;
		const auto& parent      = directories[node.parent.value_or(0)];
		if (parent.record) {
			parent_cluster = file_table[*parent.record].first_cluster;
		}

		WriteDirectoryEntry(buffer,
		                    offset,
		                    to_dir_name("."),
		                    FatAttributeFlags::Directory,
		                    self.timestamp,
		                    self.first_cluster,
		                    0);
		offset += DirEntrySizeBytes;
		WriteDirectoryEntry(buffer,
		                    offset,
		                    to_dir_name(".."),
		                    FatAttributeFlags::Directory,
		                    self.timestamp,
		                    parent_cluster,
		                    0);
		offset += DirEntrySizeBytes;

	} else if (!label.empty()) {
		std::array<uint8_t, ShortNameLength> dir_name = {};
		const auto label_str = right_pad(label, ShortNameLength, ' ');
		std::copy(label_str.begin(), label_str.end(), dir_name.begin());

		WriteDirectoryEntry(buffer,
		                    offset,
		                    dir_name,
		                    FatAttributeFlags::Volume,
		                    to_dos_date_time(std::time(nullptr)),
		                    0,
		                    0);
		offset += DirEntrySizeBytes;
	}

	for (const auto index : node.children) {
		const auto& record = file_table[index];

		if (needs_lfn(record.long_name)) {
			const auto bytes_written = build_lfn_entries(buffer,
			                                             offset,
			                                             record.long_name,
			                                             record.short_name);
			if (bytes_written == 0) {
				return Fail(BuildError::DirectoryFull, record.host_path.string());
			}
			offset += bytes_written;
		}

		if (offset + DirEntrySizeBytes > buffer.size()) {
			return Fail(BuildError::DirectoryFull, record.host_path.string());
		}

		const auto file_size = record.IsDirectory()
		                             ? 0
		                             : static_cast<uint32_t>(record.content.size());
		WriteDirectoryEntry(buffer,
		                    offset,
		                    to_dir_name(record.short_name),
		                    record.attributes,
		                    record.timestamp,
		                    record.first_cluster,
		                    file_size);
		offset += DirEntrySizeBytes;
	}
	return true;
}
