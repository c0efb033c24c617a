// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "dos/disk_geometry.h"

#include <algorithm>

#include "dos/fat_structs.h"
#include "misc/logging.h"
#include "utils/math_utils.h"
#include "utils/string_utils.h"

// clang-format off
static const std::vector<DiskGeometry> GeometryPresets = {
	//   name,        cyl, hds, sec, media_desc, root_entr, sect_per_fat, sect_per_cluster, total_size_kb, is_floppy
	{ "fd_160kb",     40,   1,   8,       0xFE,        64,            1,                1,           160, true},
	{ "fd_180kb",     40,   1,   9,       0xFC,        64,            2,                1,           180, true},
	{ "fd_320kb",     40,   2,   8,       0xFF,       112,            1,                2,           320, true},
	{ "fd_360kb",     40,   2,   9,       0xFD,       112,            2,                2,           360, true},
	{ "fd_720kb",     80,   2,   9,       0xF9,       112,            3,                2,           720, true},
	{"fd_1200kb",     80,   2,  15,       0xF9,       224,            7,                1,          1200, true},
	{"fd_1440kb",     80,   2,  18,       0xF0,       224,            9,                1,          1440, true},
	{"fd_2880kb",     80,   2,  36,       0xF0,       240,            9,                2,          2880, true},
	// HD presets
	{  "hd_20mb",     40,  16,  63,       0xF8,       512,            0,                0,             0, false},
	{  "hd_40mb",     81,  16,  63,       0xF8,       512,            0,                0,             0, false},
	{  "hd_80mb",    162,  16,  63,       0xF8,       512,            0,                0,             0, false},
	{ "hd_120mb",    243,  16,  63,       0xF8,       512,            0,                0,             0, false},
	{ "hd_250mb",    489,  16,  63,       0xF8,       512,            0,                0,             0, false},
	{ "hd_520mb",   1023,  16,  63,       0xF8,       512,            0,                0,             0, false},
	{   "hd_1gb",   1023,  32,  63,       0xF8,       512,            0,                0,             0, false},
	{   "hd_2gb",   1023,  64,  63,       0xF8,       512,            0,                0,             0, false},
};
// clang-format on

const std::vector<DiskGeometry>& get_geometry_presets()
{
	return GeometryPresets;
}

std::optional<DiskGeometry> find_geometry_preset(const std::string& name)
{
	const auto it = std::find_if(GeometryPresets.begin(),
	                             GeometryPresets.end(),
	                             [&name](const DiskGeometry& geometry) {
		                             return iequals(geometry.name, name);
	                             });
	if (it == GeometryPresets.end()) {
		return {};
	}
	return *it;
}

std::array<uint8_t, 3> lba_to_chs(int64_t lba, int max_cylinders, int max_heads,
                                  int max_sectors)
{
	int cylinders = 0, heads = 0, sectors = 0;
	constexpr int MaxLegacyCylinders = 1023;

	if (lba < static_cast<int64_t>(max_cylinders) * max_heads * max_sectors) {
		sectors   = static_cast<int>((lba % max_sectors) + 1);
		auto temp = static_cast<int64_t>(lba / max_sectors);
		heads     = static_cast<int>(temp % max_heads);
		cylinders = static_cast<int>(temp / max_heads);
		// Clamp for legacy CHS
		cylinders = std::min(cylinders, MaxLegacyCylinders);

	} else {
		// Out of range, use the maximum CHS value
		cylinders = MaxLegacyCylinders;
		heads     = max_heads - 1;
		sectors   = max_sectors;
	}

	return {static_cast<uint8_t>(heads),
	        static_cast<uint8_t>(((cylinders >> 2) & 0xC0) | (sectors & 0x3F)),
	        static_cast<uint8_t>(cylinders & 0xFF)};
}

uint32_t VolumeLayout::GetClusterSizeBytes() const
{
	return static_cast<uint32_t>(sectors_per_cluster) * SectorSizeBytes;
}

uint32_t VolumeLayout::GetClusterSector(const uint32_t cluster) const
{
	return GetFirstDataSector() +
	       (cluster - FatMarkers::FirstDataCluster) * sectors_per_cluster;
}

// Number of FAT sectors needed to track the clusters plus the two reserved
// entries at the start (Index 0: Media Descriptor, Index 1: EOC/Flags)
static uint32_t get_fat_size_sectors(const uint8_t fat_bits, const uint32_t clusters)
{
	constexpr uint32_t ReservedFatEntries = 2;
	const uint32_t total_entries          = clusters + ReservedFatEntries;

	// FAT12: 12 bits per entry = 1.5 bytes, FAT16: 2 bytes
	const uint32_t fat_size_bytes = (fat_bits == 12) ? ceil_udivide(total_entries * 3, 2u)
	                                                 : total_entries * 2;

	return ceil_udivide(fat_size_bytes, SectorSizeBytes);
}

// Number of clusters the FAT of the given size can track
static uint32_t get_fat_capacity(const uint8_t fat_bits, const uint32_t sectors_per_fat)
{
	constexpr uint32_t ReservedFatEntries = 2;
	const uint32_t fat_size_bits = sectors_per_fat * SectorSizeBytes * 8;
	const uint32_t entries       = fat_size_bits / fat_bits;
	return (entries > ReservedFatEntries) ? entries - ReservedFatEntries : 0;
}

std::optional<VolumeLayout> compute_volume_layout(const DiskGeometry& geometry,
                                                  const uint8_t fat_copies)
{
	VolumeLayout layout = {};
	layout.fat_copies   = fat_copies;
	layout.root_entries = geometry.root_entries;
	layout.root_dir_sectors = ceil_udivide(static_cast<uint32_t>(geometry.root_entries) *
	                                               DirEntrySizeBytes,
	                                       SectorSizeBytes);

	// Hard disks usually start partition at track 1
	// (head 0, sector 1 is MBR)
	layout.hidden_sectors = geometry.is_floppy ? 0 : geometry.sectors;
	layout.volume_sectors = geometry.GetTotalSectors() - layout.hidden_sectors;

	const auto fixed_sectors = static_cast<uint32_t>(layout.reserved_sectors) +
	                           layout.root_dir_sectors;

	if (geometry.is_floppy) {
		// Floppies use the well-known values of their format
		layout.fat_bits            = 12;
		layout.sectors_per_cluster = geometry.sectors_per_cluster;
		layout.sectors_per_fat     = geometry.sectors_per_fat;

	} else {
		constexpr uint32_t SectorsPerMB = (1024 * 1024) / SectorSizeBytes;

		// Beyond 32,680 sectors (~16MB) we switch from FAT12 to FAT16.
		constexpr uint32_t Fat12LimitSectors = 32680;

		layout.fat_bits = (layout.volume_sectors > Fat12LimitSectors) ? 16 : 12;

		uint32_t sectors_per_cluster = 1;
		if (layout.volume_sectors >= 512 * SectorsPerMB) {
			// Pushing FAT16 limits (32KB)
			sectors_per_cluster = 64;
		} else if (layout.volume_sectors > Fat12LimitSectors) {
			// HD Default (2KB)
			sectors_per_cluster = 4;
		}

		// Increase SPC until the cluster count is safe for the FAT type.
		// Clusters larger than 32KB are not supported by DOS.
		constexpr uint32_t MaxSectorsPerCluster = 64;
		const auto fat_limit = (layout.fat_bits == 12) ? FatMarkers::MaxClustersFat12
		                                               : FatMarkers::MaxClustersFat16;
		while (sectors_per_cluster < MaxSectorsPerCluster) {
			// Rough estimate of data area, the FAT is small compared
			// to the volume
			const auto clusters = (layout.volume_sectors - fixed_sectors) /
			                      sectors_per_cluster;
			if (clusters < fat_limit) {
				break;
			}
			sectors_per_cluster <<= 1;
		}
		layout.sectors_per_cluster = static_cast<uint16_t>(sectors_per_cluster);

		const auto estimated_clusters = (layout.volume_sectors - fixed_sectors) /
		                                sectors_per_cluster;
		layout.sectors_per_fat = get_fat_size_sectors(layout.fat_bits,
		                                              estimated_clusters);
	}

	const auto metadata_sectors = fixed_sectors + fat_copies * layout.sectors_per_fat;
	if (layout.sectors_per_cluster == 0 || metadata_sectors >= layout.volume_sectors) {
		LOG_WARNING("FAT: Geometry '%s' can't hold a file system",
		            geometry.name.c_str());
		return {};
	}

	layout.total_clusters = (layout.volume_sectors - metadata_sectors) /
	                        layout.sectors_per_cluster;
	layout.total_clusters = std::min(layout.total_clusters,
	                                 get_fat_capacity(layout.fat_bits,
	                                                  layout.sectors_per_fat));

	// Readers determine the FAT type from the cluster count alone
	const auto expected_fat_bits = (layout.total_clusters <= FatMarkers::MaxClustersFat12)
	                                     ? 12
	                                     : 16;
	if (expected_fat_bits != layout.fat_bits ||
	    layout.total_clusters > FatMarkers::MaxClustersFat16) {
		LOG_WARNING("FAT: Geometry '%s' results in %u clusters, not valid for FAT%u",
		            geometry.name.c_str(),
		            layout.total_clusters,
		            static_cast<unsigned int>(layout.fat_bits));
		return {};
	}

	return layout;
}
