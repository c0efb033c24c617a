// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_DISK_GEOMETRY_H
#define FATIMG_DISK_GEOMETRY_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct DiskGeometry {
	std::string name             = {};
	uint32_t cylinders           = 0;
	uint32_t heads               = 0;
	uint32_t sectors             = 0;
	uint8_t media_descriptor     = 0;
	uint16_t root_entries        = 0;
	uint32_t sectors_per_fat     = 0;
	uint16_t sectors_per_cluster = 0;
	uint64_t total_size_kb       = 0;
	bool is_floppy               = false;

	uint32_t GetTotalSectors() const
	{
		return cylinders * heads * sectors;
	}
};

// All the known geometries, from the smallest to the largest
const std::vector<DiskGeometry>& get_geometry_presets();

// Finds the preset by name (e.g., "fd_1440kb"), case-insensitive
std::optional<DiskGeometry> find_geometry_preset(const std::string& name);

// Return a 3-byte array [heads, sectors|cylinders_high, cylinders_low], as
// stored in the partition table
std::array<uint8_t, 3> lba_to_chs(int64_t lba, int max_cylinders, int max_heads,
                                  int max_sectors);

// Placement of the FAT file system structures, in sectors relative to the
// start of the volume (the boot sector)
struct VolumeLayout {
	uint8_t fat_bits             = 12;
	// Sectors preceding the volume (MBR and the rest of its track)
	uint32_t hidden_sectors      = 0;
	uint32_t volume_sectors      = 0;
	uint16_t reserved_sectors    = 1;
	uint8_t fat_copies           = 2;
	uint16_t sectors_per_cluster = 1;
	uint32_t sectors_per_fat     = 0;
	uint16_t root_entries        = 0;
	uint32_t root_dir_sectors    = 0;
	uint32_t total_clusters      = 0;

	uint32_t GetFirstFatSector() const
	{
		return reserved_sectors;
	}

	uint32_t GetFirstRootDirSector() const
	{
		return reserved_sectors + fat_copies * sectors_per_fat;
	}

	uint32_t GetFirstDataSector() const
	{
		return GetFirstRootDirSector() + root_dir_sectors;
	}

	uint32_t GetClusterSizeBytes() const;

	// First sector of the data cluster, relative to the volume start
	uint32_t GetClusterSector(const uint32_t cluster) const;
};

// Compute the volume layout for the geometry; hard disk geometries get a
// partition starting at the second track. Returns an empty optional if the
// geometry can't hold a valid FAT12/16 volume.
std::optional<VolumeLayout> compute_volume_layout(const DiskGeometry& geometry,
                                                  const uint8_t fat_copies);

#endif
