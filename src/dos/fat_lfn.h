// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_FAT_LFN_H
#define FATIMG_FAT_LFN_H

#include <array>
#include <cstdint>
#include <span>
#include <string>

#include "dos/fat_structs.h"

// VFAT long file name limits
constexpr uint8_t LfnCharsPerEntry = 13;
constexpr uint16_t LfnMaxLength    = 255;
constexpr uint8_t LfnMaxEntries    = (LfnMaxLength + LfnCharsPerEntry - 1) /
                                  LfnCharsPerEntry;

// Set on the ordinal of the entry holding the end of the name, which is the
// first one stored in the directory
constexpr uint8_t LfnLastEntryFlag = 0x40;
constexpr uint8_t LfnOrdinalMask   = 0x3f;

// Name padding following the terminator of the last entry
constexpr char16_t LfnTerminator = 0x0000;
constexpr char16_t LfnPadding    = 0xffff;

// Number of VFAT long file name entries needed to store the name, 0 if the
// name fits into a plain 8.3 entry.
int get_lfn_entry_count(const std::string& name);

// Number of directory slots taken by the name: the long file name entries
// (if any) plus the 8.3 entry. Volume labels never get a long file name.
int get_dir_entry_count(const std::string& name, const FatAttributeFlags attributes);

// Checksum of the 11 byte short name, stored in every long file name entry
// belonging to it.
uint8_t build_lfn_checksum(const std::array<uint8_t, ShortNameLength>& dir_name);

// Same as above, for a "NAME.EXT" short name
uint8_t build_lfn_checksum(const std::string& short_name);

// Write the long file name entries for 'long_name' into the buffer, starting
// at 'offset'. The entries are written in the on-disk order, the entry with
// the highest ordinal first; the 8.3 entry for 'short_name' is expected to
// follow them, but is not written here.
//
// Returns the number of bytes written, or 0 if the name is empty, longer than
// 255 UTF-16 code units, or does not fit into the buffer.
size_t build_lfn_entries(std::span<uint8_t> buffer, const size_t offset,
                         const std::string& long_name,
                         const std::string& short_name);

// Directory entry in the form needed to plan the size of a directory
struct DirectoryRecord {
	std::string name             = {};
	FatAttributeFlags attributes = {};
};

// Total number of directory slots needed to store the given records.
int get_total_dir_entries(std::span<const DirectoryRecord> records);

#endif
