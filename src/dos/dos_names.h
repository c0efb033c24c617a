// SPDX-FileCopyrightText:  2020-2026 The DOSBox Staging Team
// SPDX-FileCopyrightText:  2002-2021 The DOSBox Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_DOS_NAMES_H
#define FATIMG_DOS_NAMES_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

#include "dos/fat_structs.h"

// Short names already taken inside a single directory, in "NAME.EXT" form
using ShortNameSet = std::unordered_set<std::string>;

// Numeric tails range from ~1 to ~9999
constexpr uint16_t MaxNumericTail = 9999;

// Characters DOS does not allow in file names, path separators included
constexpr bool is_special_character(const char c)
{
	constexpr auto special_characters = std::string_view("\"+=,;:<>[]|?*\\/");
	return special_characters.find(c) != std::string_view::npos;
}

// Returns true if the name can't be stored as a plain upper case 8.3 short
// name, i.e. a VFAT long file name is required to preserve it. The "." and
// ".." directory entries never need one.
bool needs_lfn(const std::string& name);

// Derive a unique 8.3 short name ("NAME.EXT" form) from the long name.
//
// The name is upper-cased, spaces and superfluous dots are dropped, characters
// not allowed in short names are replaced with '_', and the base and extension
// are truncated to 8 and 3 characters. If anything besides the letter case was
// lost, or the result is already in 'used_names', the lowest free numeric tail
// (~1 to ~9999) is appended to the base.
//
// Returns an empty optional if all the numeric tails are taken.
std::optional<std::string> generate_short_name(const std::string& long_name,
                                               const ShortNameSet& used_names);

// Convert the "NAME.EXT" short name to the space-padded 11 byte form stored in
// the directory entry, e.g. "A TALE O.TXT" -> "A TALE OTXT".
std::array<uint8_t, ShortNameLength> to_dir_name(const std::string& short_name);

// Convert the 11 byte directory entry name back to the "NAME.EXT" form.
std::string dir_name_to_string(const uint8_t* dir_name);

#endif
