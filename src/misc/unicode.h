// SPDX-FileCopyrightText:  2024-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_UNICODE_H
#define FATIMG_UNICODE_H

#include <cstdint>
#include <string>

// Character used in place of malformed UTF-8 sequences and of code points
// which can't be encoded; U+FFFD is allowed in VFAT long file names
constexpr char16_t UnknownCharacter = u'\ufffd';

constexpr bool is_high_surrogate(const char16_t code_unit)
{
	return code_unit >= 0xd800 && code_unit <= 0xdbff;
}

constexpr bool is_low_surrogate(const char16_t code_unit)
{
	return code_unit >= 0xdc00 && code_unit <= 0xdfff;
}

// Convert the UTF-8 string to the 16-bit code units stored in VFAT long file
// names. Characters of the Basic Multilingual Plane take one code unit (the
// UCS-2 subset), the others are stored as UTF-16 surrogate pairs. Malformed
// sequences are replaced with UnknownCharacter.
std::u16string utf8_to_ucs2(const std::string& str);

// Convert the 16-bit code units back to UTF-8. Unpaired surrogates are
// replaced with UnknownCharacter.
std::string ucs2_to_utf8(const std::u16string& str);

// Length of the string in 16-bit code units, the unit VFAT long file name
// limits are counted in.
size_t ucs2_length(const std::string& str);

// Returns true if the string only contains 7-bit ASCII characters.
bool is_ascii(const std::string& str);

#endif
