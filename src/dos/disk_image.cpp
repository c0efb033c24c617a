// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-FileCopyrightText:  2002-2021 The DOSBox Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "dos/disk_image.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <utility>

#include "misc/logging.h"
#include "utils/fs_utils.h"

DiskImage::DiskImage(const DiskGeometry& _geometry, const std::vector<uint8_t>& raw)
        : geometry(_geometry)
{
	size_t position = 0;

	cylinders.reserve(geometry.cylinders);
	for (uint32_t c = 0; c < geometry.cylinders; ++c) {
		DiskCylinder cylinder = {};
		cylinder.reserve(geometry.heads);

		for (uint32_t h = 0; h < geometry.heads; ++h) {
			DiskTrack track = {};
			track.reserve(geometry.sectors);

			for (uint32_t s = 1; s <= geometry.sectors; ++s) {
				DiskSector sector = {};
				sector.cylinder   = c;
				sector.head       = h;
				sector.sector     = s;

				if (position < raw.size()) {
					const auto count = std::min<size_t>(SectorSizeBytes,
					                                    raw.size() - position);
					std::copy_n(raw.begin() + static_cast<std::ptrdiff_t>(position),
					            count,
					            sector.data.begin());
				}
				position += SectorSizeBytes;

				track.push_back(sector);
			}
			cylinder.push_back(std::move(track));
		}
		cylinders.push_back(std::move(cylinder));
	}

	if (raw.size() > position) {
		LOG(LOG_IMAGE, LOG_WARN)("IMAGE: Dropped %u bytes beyond the end of the disk",
		                         static_cast<unsigned int>(raw.size() - position));
	}
}

const DiskSector* DiskImage::FindSector(const uint32_t sectnum) const
{
	if (sectnum >= GetTotalSectors()) {
		return nullptr;
	}

	const auto sectors_per_cylinder = geometry.heads * geometry.sectors;

	const auto cylinder = sectnum / sectors_per_cylinder;
	const auto head     = (sectnum % sectors_per_cylinder) / geometry.sectors;
	const auto sector   = sectnum % geometry.sectors;

	return &cylinders[cylinder][head][sector];
}

uint8_t DiskImage::Read_Sector(uint32_t head, uint32_t cylinder, uint32_t sector,
                               void* data) const
{
	if (sector == 0 || sector > geometry.sectors || head >= geometry.heads) {
		LOG_ERR("IMAGE: Invalid sector address C:%u H:%u S:%u", cylinder, head, sector);
		return 0xff;
	}

	uint32_t sectnum;
	sectnum = ((cylinder * geometry.heads + head) * geometry.sectors) + sector - 1L;
	return Read_AbsoluteSector(sectnum, data);
}

uint8_t DiskImage::Read_AbsoluteSector(uint32_t sectnum, void* data) const
{
	const auto disk_sector = FindSector(sectnum);
	if (!disk_sector || !data) {
		LOG_ERR("IMAGE: Could not read sector %u of %u", sectnum, GetTotalSectors());
		return 0xff;
	}

	std::memcpy(data, disk_sector->data.data(), disk_sector->data.size());
	return 0x00;
}

std::vector<uint8_t> DiskImage::ToBytes() const
{
	std::vector<uint8_t> bytes = {};
	bytes.reserve(static_cast<size_t>(GetSizeBytes()));

	for (const auto& cylinder : cylinders) {
		for (const auto& track : cylinder) {
			for (const auto& sector : track) {
				bytes.insert(bytes.end(), sector.data.begin(), sector.data.end());
			}
		}
	}
	return bytes;
}

bool DiskImage::WriteToFile(const std_fs::path& path) const
{
	FilePtr file(fopen(path.string().c_str(), "wb"));
	if (!file) {
		LOG_WARNING("IMAGE: Could not create '%s'", path.string().c_str());
		return false;
	}

	for (const auto& cylinder : cylinders) {
		for (const auto& track : cylinder) {
			for (const auto& sector : track) {
				if (fwrite(sector.data.data(), 1, sector.data.size(), file.get()) !=
				    sector.data.size()) {
					LOG_WARNING("IMAGE: Could not write to '%s'",
					            path.string().c_str());
					return false;
				}
			}
		}
	}

	if (fflush(file.get()) != 0) {
		LOG_WARNING("IMAGE: Could not write to '%s'", path.string().c_str());
		return false;
	}

	LOG_MSG("IMAGE: Wrote %u sectors to '%s'",
	        GetTotalSectors(),
	        path.string().c_str());
	return true;
}
