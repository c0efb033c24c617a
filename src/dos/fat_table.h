// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-FileCopyrightText:  2002-2021 The DOSBox Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_FAT_TABLE_H
#define FATIMG_FAT_TABLE_H

#include <cstdint>
#include <optional>
#include <vector>

// In-memory File Allocation Table of a FAT12 or FAT16 volume. Clusters are
// handed out in ascending order, so every chain is contiguous.
class FatTable {
public:
	FatTable(const uint8_t fat_bits, const uint32_t total_clusters,
	         const uint32_t sectors_per_fat);

	uint8_t GetFatBits() const
	{
		return fat_bits;
	}

	// Number of data clusters, i.e. clusters 2 to total_clusters + 1
	uint32_t GetTotalClusters() const
	{
		return total_clusters;
	}

	uint32_t GetFreeClusters() const;

	// The value marking the end of a cluster chain
	uint32_t GetEndOfChain() const;

	uint32_t GetClusterValue(const uint32_t cluster) const;
	void SetClusterValue(const uint32_t cluster, const uint32_t value);

	// Fill the two reserved entries; entry 0 holds the media descriptor
	void SetMediaDescriptor(const uint8_t media_descriptor);

	// Allocate a chain of 'num_clusters' and terminate it with the end of
	// chain marker. Returns the first cluster of the chain, or an empty
	// optional if not enough clusters are free.
	std::optional<uint32_t> AllocateChain(const uint32_t num_clusters);

	// Follow the chain starting at 'first_cluster'; returns an empty vector
	// for cluster 0 or if the chain is broken or loops.
	std::vector<uint32_t> GetChain(const uint32_t first_cluster) const;

	// Raw table contents, sectors_per_fat * 512 bytes
	const std::vector<uint8_t>& GetData() const
	{
		return data;
	}

private:
	uint32_t GetOffset(const uint32_t cluster) const;

	uint8_t fat_bits          = 12;
	uint32_t total_clusters   = 0;
	uint32_t next_free_cluster = 0;
	std::vector<uint8_t> data = {};
};

#endif
