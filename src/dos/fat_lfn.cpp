// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "dos/fat_lfn.h"

#include <algorithm>
#include <cstring>

#include "dos/dos_names.h"
#include "misc/logging.h"
#include "misc/unicode.h"
#include "utils/byteorder.h"
#include "utils/math_utils.h"

int get_lfn_entry_count(const std::string& name)
{
	if (!needs_lfn(name)) {
		return 0;
	}
	return static_cast<int>(ceil_udivide(ucs2_length(name), LfnCharsPerEntry));
}

int get_dir_entry_count(const std::string& name, const FatAttributeFlags attributes)
{
	if (attributes.volume()) {
		return 1;
	}
	return get_lfn_entry_count(name) + 1;
}

uint8_t build_lfn_checksum(const std::array<uint8_t, ShortNameLength>& dir_name)
{
	uint8_t sum = 0;
	for (const auto byte : dir_name) {
		// Rotate right by one bit, then add the next byte
		sum = static_cast<uint8_t>(((sum & 1) << 7) + (sum >> 1) + byte);
	}
	return sum;
}

uint8_t build_lfn_checksum(const std::string& short_name)
{
	return build_lfn_checksum(to_dir_name(short_name));
}

// Stores the 13 name characters into the three name fields of the entry
static void write_lfn_chars(LfnDirectoryEntry& entry,
                            const std::array<char16_t, LfnCharsPerEntry>& chars)
{
	auto write_field = [&](uint8_t* field, const size_t first, const size_t count) {
		for (size_t i = 0; i < count; ++i) {
			host_writew(field + i * sizeof(uint16_t),
			            static_cast<uint16_t>(chars[first + i]));
		}
	};

	write_field(entry.name_1, 0, sizeof(entry.name_1) / sizeof(uint16_t));
	write_field(entry.name_2, 5, sizeof(entry.name_2) / sizeof(uint16_t));
	write_field(entry.name_3, 11, sizeof(entry.name_3) / sizeof(uint16_t));
}

size_t build_lfn_entries(std::span<uint8_t> buffer, const size_t offset,
                         const std::string& long_name, const std::string& short_name)
{
	const auto name = utf8_to_ucs2(long_name);
	if (name.empty() || name.size() > LfnMaxLength) {
		LOG(LOG_FAT, LOG_WARN)("FAT: Can't build long file name entries for '%s'",
		                       long_name.c_str());
		return 0;
	}

	const auto num_entries = ceil_udivide(name.size(), LfnCharsPerEntry);
	const auto num_bytes   = num_entries * DirEntrySizeBytes;
	if (offset > buffer.size() || buffer.size() - offset < num_bytes) {
		LOG(LOG_FAT, LOG_WARN)("FAT: No room for %u long file name entries of '%s'",
		                       static_cast<unsigned int>(num_entries),
		                       long_name.c_str());
		return 0;
	}

	const auto checksum = build_lfn_checksum(short_name);

	auto destination = buffer.data() + offset;
	for (size_t i = 0; i < num_entries; ++i) {
		// Highest ordinal goes first
		const auto ordinal = num_entries - i;
		const auto first   = (ordinal - 1) * LfnCharsPerEntry;

		std::array<char16_t, LfnCharsPerEntry> chars = {};
		chars.fill(LfnPadding);
		const auto count = std::min<size_t>(LfnCharsPerEntry, name.size() - first);
		std::copy_n(name.begin() + static_cast<std::ptrdiff_t>(first), count, chars.begin());
		if (count < LfnCharsPerEntry) {
			chars[count] = LfnTerminator;
		}

		LfnDirectoryEntry entry = {};
		entry.ordinal = static_cast<uint8_t>(ordinal);
		if (i == 0) {
			entry.ordinal |= LfnLastEntryFlag;
		}
		entry.attributes = FatAttributeFlags::LongName;
		entry.checksum   = checksum;
		write_lfn_chars(entry, chars);

		std::memcpy(destination, &entry, sizeof(entry));
		destination += sizeof(entry);
	}

	return num_bytes;
}

int get_total_dir_entries(std::span<const DirectoryRecord> records)
{
	int total = 0;
	for (const auto& record : records) {
		total += get_dir_entry_count(record.name, record.attributes);
	}
	return total;
}
