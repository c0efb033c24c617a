// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_FAT_IMAGE_BUILDER_H
#define FATIMG_FAT_IMAGE_BUILDER_H

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "dos/disk_geometry.h"
#include "dos/disk_image.h"
#include "dos/fat_structs.h"
#include "misc/std_filesystem.h"
#include "utils/fs_utils.h"

class FatTable;

enum class BuildError {
	None,
	NameTooLong,
	ShortNameCollisionExhausted,
	DirectoryFull,
	ImageCapacityExceeded,
	HostReadFailure,
	UnknownDiskType,
};

std::string to_string(const BuildError error);

struct BuildSettings {
	// Geometry preset name, e.g. "fd_1440kb"; empty selects the smallest
	// preset which can hold all the files
	std::string disk_type = {};

	// Volume label; empty means no label entry and "NO NAME" in the BPB
	std::string label = {};

	// Include host files and directories starting with a dot
	bool include_hidden = false;

	uint8_t fat_copies = 2;

	// Derived from the current date and time if not set
	std::optional<uint32_t> volume_serial = {};

	std::string oem_name = "FATIMG";
};

// A single file or directory stored in the image
struct FileRecord {
	std_fs::path host_path = {};

	// Full DOS path made of short names, e.g. "\DOCUME~1\README.TXT"
	std::string dos_path = {};

	// Host name, UTF-8
	std::string long_name = {};

	// "NAME.EXT" form
	std::string short_name = {};

	FatAttributeFlags attributes = {};
	std::vector<uint8_t> content = {};
	DosDateTime timestamp        = {};

	// 0 for empty files
	uint32_t first_cluster = 0;
	uint32_t num_clusters  = 0;

	// Slots taken in the parent directory, long file name entries included
	int num_dir_entries = 0;

	bool IsDirectory() const
	{
		return attributes.directory();
	}
};

// Builds a FAT12/16 disk image holding a copy of a host directory tree, with
// VFAT long file names for every name that does not fit the 8.3 scheme.
class FatImageBuilder {
public:
	FatImageBuilder() = default;

	FatImageBuilder(const FatImageBuilder&)            = delete;
	FatImageBuilder& operator=(const FatImageBuilder&) = delete;

	// Returns an empty optional on failure; the reason is available through
	// GetLastError().
	std::optional<DiskImage> BuildDiskFromFiles(const std_fs::path& directory,
	                                            const BuildSettings& settings = {});

	// Files and directories of the last build, in directory tree pre-order
	const std::vector<FileRecord>& GetFileTable() const
	{
		return file_table;
	}

	BuildError GetLastError() const
	{
		return last_error;
	}

private:
	// Directory being stored; the root directory has no file record
	struct DirectoryNode {
		std::optional<size_t> record  = {};
		std::optional<size_t> parent  = {};
		std::vector<size_t> children  = {};
		int num_dir_entries           = 0;
	};

	bool Fail(const BuildError error, const std::string& context);

	bool ScanDirectory(const std_fs::path& host_path,
	                   const std::string& dos_path, const size_t node_index);

	bool CountDirectoryEntries();

	uint64_t GetRequiredClusters(const VolumeLayout& volume_layout) const;

	bool FitsGeometry(const DiskGeometry& candidate,
	                  std::optional<VolumeLayout>& candidate_layout,
	                  BuildError& error) const;

	bool SelectGeometry(const std::string& source);

	bool AllocateClusters(FatTable& fat);

	void WriteMbr(std::vector<uint8_t>& raw) const;
	void WriteBootSector(std::span<uint8_t> volume) const;

	bool WriteDirectory(const DirectoryNode& node, std::span<uint8_t> buffer);
	void WriteDirectoryEntry(std::span<uint8_t> buffer, const size_t offset,
	                         const std::array<uint8_t, ShortNameLength>& dir_name,
	                         const FatAttributeFlags attributes,
	                         const DosDateTime timestamp,
	                         const uint32_t first_cluster,
	                         const uint32_t file_size) const;

	std::span<uint8_t> GetClusterSpan(std::span<uint8_t> volume,
	                                  const uint32_t first_cluster,
	                                  const uint32_t num_clusters) const;

	BuildSettings settings = {};
	std::string label      = {};

	std::vector<FileRecord> file_table     = {};
	std::vector<DirectoryNode> directories = {};

	DiskGeometry geometry = {};
	VolumeLayout layout   = {};

	BuildError last_error = BuildError::None;
};

#endif
