// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-FileCopyrightText:  2002-2021 The DOSBox Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "dos/fat_table.h"

#include "dos/fat_structs.h"
#include "misc/logging.h"
#include "utils/byteorder.h"

FatTable::FatTable(const uint8_t _fat_bits, const uint32_t _total_clusters,
                   const uint32_t sectors_per_fat)
        : fat_bits(_fat_bits),
          total_clusters(_total_clusters),
          next_free_cluster(FatMarkers::FirstDataCluster),
          data(static_cast<size_t>(sectors_per_fat) * SectorSizeBytes, 0)
{}

uint32_t FatTable::GetOffset(const uint32_t cluster) const
{
	if (fat_bits == 12) {
		return cluster + (cluster / 2);
	}
	return cluster * 2;
}

uint32_t FatTable::GetEndOfChain() const
{
	return (fat_bits == 12) ? FatMarkers::Fat12Eoc : FatMarkers::Fat16Eoc;
}

uint32_t FatTable::GetFreeClusters() const
{
	const auto last_cluster = total_clusters + FatMarkers::FirstDataCluster;
	return last_cluster - next_free_cluster;
}

uint32_t FatTable::GetClusterValue(const uint32_t cluster) const
{
	const auto offset = GetOffset(cluster);
	if (offset + sizeof(uint16_t) > data.size()) {
		return 0;
	}

	uint32_t value = host_readw(&data[offset]);
	if (fat_bits == 12) {
		if (cluster & 0x1) {
			value >>= 4;
		} else {
			value &= 0xfff;
		}
	}
	return value;
}

void FatTable::SetClusterValue(const uint32_t cluster, const uint32_t value)
{
	const auto offset = GetOffset(cluster);
	if (offset + sizeof(uint16_t) > data.size()) {
		LOG_ERR("FAT: Cluster %u is outside of the allocation table", cluster);
		return;
	}

	if (fat_bits == 16) {
		host_writew(&data[offset], static_cast<uint16_t>(value));
		return;
	}

	uint16_t tmp_value = host_readw(&data[offset]);
	if (cluster & 0x1) {
		tmp_value &= 0xf;
		tmp_value |= static_cast<uint16_t>((value & 0xfff) << 4);
	} else {
		tmp_value &= 0xf000;
		tmp_value |= static_cast<uint16_t>(value & 0xfff);
	}
	host_writew(&data[offset], tmp_value);
}

void FatTable::SetMediaDescriptor(const uint8_t media_descriptor)
{
	const auto media_mask = (fat_bits == 12) ? FatMarkers::Fat12MediaMask
	                                         : FatMarkers::Fat16MediaMask;
	SetClusterValue(0, media_mask | media_descriptor);
	SetClusterValue(1, GetEndOfChain());
}

std::optional<uint32_t> FatTable::AllocateChain(const uint32_t num_clusters)
{
	if (num_clusters == 0) {
		return 0;
	}
	if (num_clusters > GetFreeClusters()) {
		LOG(LOG_FAT, LOG_WARN)("FAT: Can't allocate %u clusters, only %u free",
		                       num_clusters,
		                       GetFreeClusters());
		return {};
	}

	const auto first_cluster = next_free_cluster;
	const auto last_cluster  = first_cluster + num_clusters - 1;
	for (auto cluster = first_cluster; cluster < last_cluster; ++cluster) {
		SetClusterValue(cluster, cluster + 1);
	}
	SetClusterValue(last_cluster, GetEndOfChain());

	next_free_cluster = last_cluster + 1;
	return first_cluster;
}

std::vector<uint32_t> FatTable::GetChain(const uint32_t first_cluster) const
{
	std::vector<uint32_t> chain = {};

	const auto last_cluster = total_clusters + FatMarkers::FirstDataCluster - 1;
	// Values from 0xff8 (0xfff8 on FAT16) onwards terminate the chain
	const auto end_of_chain_min = GetEndOfChain() - 7;

	auto cluster = first_cluster;
	while (cluster >= FatMarkers::FirstDataCluster && cluster <= last_cluster) {
		if (chain.size() > total_clusters) {
			LOG_WARNING("FAT: Cluster chain starting at %u loops", first_cluster);
			return {};
		}
		chain.push_back(cluster);

		cluster = GetClusterValue(cluster);
		if (cluster >= end_of_chain_min) {
			return chain;
		}
	}

	if (!chain.empty() || first_cluster != 0) {
		LOG_WARNING("FAT: Cluster chain starting at %u is broken", first_cluster);
	}
	return {};
}
