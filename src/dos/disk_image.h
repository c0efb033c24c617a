// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-FileCopyrightText:  2002-2021 The DOSBox Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_DISK_IMAGE_H
#define FATIMG_DISK_IMAGE_H

#include <array>
#include <cstdint>
#include <vector>

#include "dos/disk_geometry.h"
#include "dos/fat_structs.h"
#include "misc/std_filesystem.h"

struct DiskSector {
	uint32_t cylinder = 0;
	uint32_t head     = 0;
	// Sectors are numbered from 1, as in the BIOS calls
	uint32_t sector   = 0;

	std::array<uint8_t, SectorSizeBytes> data = {};
};

using DiskTrack    = std::vector<DiskSector>;
using DiskCylinder = std::vector<DiskTrack>;

// Complete disk image, organized as cylinders, each holding one track per
// head, each holding the sectors of the track
class DiskImage {
public:
	// The raw image bytes must cover the whole geometry; missing bytes are
	// zero-filled
	DiskImage(const DiskGeometry& _geometry, const std::vector<uint8_t>& raw);

	const DiskGeometry& GetGeometry() const
	{
		return geometry;
	}

	const std::vector<DiskCylinder>& GetCylinders() const
	{
		return cylinders;
	}

	uint32_t GetTotalSectors() const
	{
		return geometry.GetTotalSectors();
	}

	uint64_t GetSizeBytes() const
	{
		return static_cast<uint64_t>(GetTotalSectors()) * SectorSizeBytes;
	}

	// Copy a single sector into 'data'; returns 0x00 on success, 0xff if
	// the sector does not exist
	uint8_t Read_Sector(uint32_t head, uint32_t cylinder, uint32_t sector,
	                    void* data) const;
	uint8_t Read_AbsoluteSector(uint32_t sectnum, void* data) const;

	// Flat image, as stored in a .img file
	std::vector<uint8_t> ToBytes() const;

	bool WriteToFile(const std_fs::path& path) const;

private:
	const DiskSector* FindSector(uint32_t sectnum) const;

	DiskGeometry geometry = {};
	std::vector<DiskCylinder> cylinders = {};
};

#endif
