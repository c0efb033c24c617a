// SPDX-FileCopyrightText:  2025-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_FAT_STRUCTS_H
#define FATIMG_FAT_STRUCTS_H

#include <cstdint>

constexpr uint16_t SectorSizeBytes    = 512;
constexpr uint16_t DirEntrySizeBytes  = 32;

// Length of a short name in the directory entry, 8 + 3 characters
constexpr uint8_t ShortNameBaseLength = 8;
constexpr uint8_t ShortNameExtLength  = 3;
constexpr uint8_t ShortNameLength     = ShortNameBaseLength + ShortNameExtLength;

struct FatAttributeFlags {
	enum : uint8_t {
		ReadOnly  = 1 << 0,
		Hidden    = 1 << 1,
		System    = 1 << 2,
		Volume    = 1 << 3,
		Directory = 1 << 4,
		Archive   = 1 << 5,
		// Combination marking a VFAT long file name entry
		LongName = ReadOnly | Hidden | System | Volume,
	};

	uint8_t _data = 0;

	FatAttributeFlags() = default;
	FatAttributeFlags(const uint8_t data) : _data(data) {}

	bool read_only() const { return _data & ReadOnly; }
	bool hidden() const { return _data & Hidden; }
	bool system() const { return _data & System; }
	bool volume() const { return _data & Volume; }
	bool directory() const { return _data & Directory; }
	bool archive() const { return _data & Archive; }

	bool operator==(const FatAttributeFlags& other) const
	{
		return _data == other._data;
	}
};

#pragma pack(push, 1)
struct FatBootSector {
	// Common Bios Parameter Block (BPB) (Bytes 0x00 - 0x23)
	uint8_t jump[3];
	char oem_name[8];
	uint16_t bytes_per_sector   = 0;
	uint8_t sectors_per_cluster = 0;
	uint16_t reserved_sectors   = 0;
	uint8_t fat_copies          = 0;
	uint16_t root_entries       = 0;
	uint16_t total_sectors_16   = 0;
	uint8_t media_descriptor    = 0;
	uint16_t sectors_per_fat_16 = 0;
	uint16_t sectors_per_track  = 0;
	uint16_t heads              = 0;
	uint32_t hidden_sectors     = 0;
	uint32_t total_sectors_32   = 0;

	// FAT12 / FAT16 Extended BPB (Bytes 0x24 - 0x1FE)
	uint8_t drive_number   = 0;
	uint8_t reserved1      = 0;
	uint8_t boot_signature = 0;
	uint32_t serial_number = 0;
	char label[11];
	char fs_type[8];
	uint8_t boot_code[448];

	uint8_t signature[2] = {};
};
#pragma pack(pop)

static_assert(sizeof(FatBootSector) == SectorSizeBytes,
              "FAT BootSector must be exactly 512 bytes");

// Standard DOS Directory Entry (32 bytes)
#pragma pack(push, 1)
struct DirectoryEntry {
	// Filename is in 8.3 format and padded with spaces
	char filename[ShortNameLength] = {};
	uint8_t attributes = 0;
	// Reserved for Windows NT / OS/2
	uint8_t reserved          = 0;
	uint8_t create_time_tenth = 0;
	uint16_t create_time      = 0;
	uint16_t create_date      = 0;
	uint16_t last_access_date = 0;
	// FAT32 only
	uint16_t first_cluster_high = 0;
	uint16_t write_time         = 0;
	uint16_t write_date         = 0;
	uint16_t first_cluster_low  = 0;
	uint32_t file_size          = 0;
};
#pragma pack(pop)

static_assert(sizeof(DirectoryEntry) == DirEntrySizeBytes,
              "DirectoryEntry must be 32 bytes");

// VFAT long file name entry, occupies a directory slot just like the
// DirectoryEntry; name characters are UCS-2, little-endian
#pragma pack(push, 1)
struct LfnDirectoryEntry {
	// Sequence number, 0x40 marks the entry with the highest number
	uint8_t ordinal    = 0;
	uint8_t name_1[10] = {};
	// Always FatAttributeFlags::LongName
	uint8_t attributes = 0;
	uint8_t type       = 0;
	// Checksum of the short name this entry belongs to
	uint8_t checksum   = 0;
	uint8_t name_2[12] = {};
	// Always 0
	uint16_t first_cluster = 0;
	uint8_t name_3[4]      = {};
};
#pragma pack(pop)

static_assert(sizeof(LfnDirectoryEntry) == DirEntrySizeBytes,
              "LfnDirectoryEntry must be 32 bytes");

// Constants for FAT markers
namespace FatMarkers {
// End of Chain (EOC) markers indicate the end of a file/chain.
constexpr uint16_t Fat12Eoc = 0x0FFF;
constexpr uint16_t Fat16Eoc = 0xFFFF;

// The first entry usually contains the Media Descriptor in the low byte.
// The upper bits are set to 1.
constexpr uint16_t Fat12MediaMask = 0x0F00;
constexpr uint16_t Fat16MediaMask = 0xFF00;

// FAT Limits (Max clusters)
constexpr uint32_t MaxClustersFat12 = 4084;
constexpr uint32_t MaxClustersFat16 = 65524;

// Clusters 0 and 1 are reserved, data starts at cluster 2
constexpr uint16_t FirstDataCluster = 2;
} // namespace FatMarkers

enum class FatPartitionType : uint8_t {
	Fat12 = 0x01,

	// For partitions smaller than 32MB
	Fat16_Small = 0x04,

	// For partitions larger than 32MB but not LBA
	Fat16B = 0x06,

	Fat16_LBA = 0x0E,
};

namespace BootCode {

// Assembly code to print "Non-system disk" message:
// clang-format off
constexpr uint8_t Printer[] = {
    // Stack Setup
    0xFA,             // 0:  CLI              ; Disable interrupts
    0x31, 0xC0,       // 1:  XOR AX, AX       ; AX = 0
    0x8E, 0xD0,       // 3:  MOV SS, AX       ; SS = 0
    0xBC, 0x00, 0x7C, // 5:  MOV SP, 7C00     ; SP = 7C00 (Grow down)
    0xFB,             // 8:  STI              ; Enable interrupts

    // Video Mode Setup
    0xB8, 0x03, 0x00, // 9:  MOV AX, 0003h    ; AH=00 (Set Mode), AL=03 (80x25 Color)
    0xCD, 0x10,       // 12: INT 10h

    // Segment Setup
    0x31, 0xC0,       // 14: XOR AX, AX       ; AX = 0
    0x8E, 0xD8,       // 16: MOV DS, AX       ; DS = 0
    0x8E, 0xC0,       // 18: MOV ES, AX       ; ES = 0

    // Print Loop
    0xBE, 0x00, 0x00, // 20: MOV SI, [addr]   ; (Patched later at offset 21)
    0xFC,             // 23: CLD              ; Clear Direction Flag

    // .loop:
    0xAC,             // 24: LODSB            ; AL = [SI++]
    0x08, 0xC0,       // 25: OR AL, AL
    0x74, 0x05,       // 27: JZ +5            ; -> HANG

    0xB4, 0x0E,       // 29: MOV AH, 0E       ; Teletype
    0x31, 0xDB,       // 31: XOR BX, BX       ; Page 0, Color 0
    0xCD, 0x10,       // 33: INT 10           ; Print
    0xEB, 0xF3,       // 35: JMP -13          ; -> .loop

    // .hang:
    0xF4,             // 37: HLT
    0xEB, 0xFD,       // 38: JMP -3           ; Infinite HLT Loop

    // --- Data Section (Offset 40 / 0x28) ---
    0x0D, 0x0A,
    'N', 'o', 'n', '-', 's', 'y', 's', 't', 'e', 'm', ' ',
    'd', 'i', 's', 'k', '.', 0x0D, 0x0A,
    'T', 'h', 'i', 's', ' ', 'i', 'm', 'a', 'g', 'e', ' ',
    'o', 'n', 'l', 'y', ' ', 'h', 'o', 'l', 'd', 's', ' ',
    'f', 'i', 'l', 'e', 's', '.', 0x0D, 0x0A, 0x00
};
// clang-format on

// Offset where the boot code starts in a FAT12/16 boot sector
constexpr uint16_t OffsetFat16 = 0x3E;

// BIOS loads boot sector at 0x7C00.
// The string starts at offset 40 inside the Printer array.
constexpr auto StringOffsetInCode = 40;
// The SI patch is at offset 21 in the code.
constexpr auto PatchOffsetInCode = 21;
constexpr auto PhysicalAddress   = 0x7C00;

} // namespace BootCode

#endif
