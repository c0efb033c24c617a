// SPDX-FileCopyrightText:  2019-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_BYTEORDER_H
#define FATIMG_BYTEORDER_H

#include <cstdint>

// Read/write helpers for little-endian (DOS byte-ordered) memory, independent
// of the host byte order and of the alignment of the pointer.

// Read a 16-bit word from 8-bit DOS/little-endian byte-ordered memory.
static inline uint16_t host_readw(const uint8_t* arr) noexcept
{
	return static_cast<uint16_t>(arr[0] | (arr[1] << 8));
}

// Read a 32-bit double-word from 8-bit DOS/little-endian byte-ordered memory.
static inline uint32_t host_readd(const uint8_t* arr) noexcept
{
	return static_cast<uint32_t>(arr[0]) |
	       (static_cast<uint32_t>(arr[1]) << 8) |
	       (static_cast<uint32_t>(arr[2]) << 16) |
	       (static_cast<uint32_t>(arr[3]) << 24);
}

// Write a 16-bit word to 8-bit memory using DOS/little-endian byte-ordering.
static inline void host_writew(uint8_t* arr, const uint16_t val) noexcept
{
	arr[0] = static_cast<uint8_t>(val & 0xff);
	arr[1] = static_cast<uint8_t>(val >> 8);
}

// Write a 32-bit double-word to 8-bit memory using DOS/little-endian byte-ordering.
static inline void host_writed(uint8_t* arr, const uint32_t val) noexcept
{
	arr[0] = static_cast<uint8_t>(val & 0xff);
	arr[1] = static_cast<uint8_t>((val >> 8) & 0xff);
	arr[2] = static_cast<uint8_t>((val >> 16) & 0xff);
	arr[3] = static_cast<uint8_t>(val >> 24);
}

#endif
