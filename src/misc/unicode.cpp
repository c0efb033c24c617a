// SPDX-FileCopyrightText:  2022-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "misc/unicode.h"

#include <algorithm>

#include "misc/logging.h"

// Thresholds for UTF-8 decoding/encoding
constexpr uint8_t DecodeThresholdNonAscii = 0b1'000'0000;
constexpr uint8_t DecodeThreshold2Bytes   = 0b1'100'0000;
constexpr uint8_t DecodeThreshold3Bytes   = 0b1'110'0000;
constexpr uint8_t DecodeThreshold4Bytes   = 0b1'111'0000;
constexpr uint8_t DecodeThreshold5Bytes   = 0b1'111'1000;
constexpr uint8_t DecodeThreshold6Bytes   = 0b1'111'1100;
constexpr uint32_t EncodeThreshold2Bytes  = 0x0080;
constexpr uint32_t EncodeThreshold3Bytes  = 0x0800;
constexpr uint32_t EncodeThreshold4Bytes  = 0x10000;

// Code points from U+10000 up are stored as surrogate pairs
constexpr uint32_t MaxCodePoint          = 0x10ffff;
constexpr char16_t HighSurrogateBase     = 0xd800;
constexpr char16_t LowSurrogateBase      = 0xdc00;
constexpr uint32_t SurrogatePayloadBits  = 10;
constexpr uint32_t SurrogatePayloadMask  = 0x3ff;

static bool is_continuation_byte(const uint8_t byte)
{
	return byte >= DecodeThresholdNonAscii && byte < DecodeThreshold2Bytes;
}

std::u16string utf8_to_ucs2(const std::string& str)
{
	// For UTF-8 encoding explanation see here:
	// - https://en.wikipedia.org/wiki/UTF-8#Encoding

	bool already_warned = false;
	auto warn_decode_problem = [&](const size_t position) {
		if (already_warned) {
			return;
		}
		LOG_WARNING("UNICODE: Problem decoding UTF8 string '%s', position %u",
		            str.c_str(),
		            static_cast<unsigned int>(position));
		already_warned = true;
	};

	std::u16string str_out = {};
	str_out.reserve(str.size());

	for (size_t i = 0; i < str.size(); ++i) {
		const size_t remaining = str.size() - i - 1;

		auto byte_at = [&](const size_t offset) -> uint8_t {
			return (remaining >= offset) ? static_cast<uint8_t>(str[i + offset]) : 0;
		};
		const uint8_t byte_1 = static_cast<uint8_t>(str[i]);
		const uint8_t byte_2 = byte_at(1);
		const uint8_t byte_3 = byte_at(2);
		const uint8_t byte_4 = byte_at(3);

		auto advance = [&](const size_t bytes) {
			auto counter = std::min(remaining, bytes);
			while (counter--) {
				const auto byte_next = static_cast<uint8_t>(str[i + 1]);
				if (!is_continuation_byte(byte_next)) {
					break;
				}
				++i;
			}

			// advance without decoding
			warn_decode_problem(i);
		};

		auto add_bits = [](const uint32_t code_point, const uint8_t byte) {
			return (code_point << 6) + byte - DecodeThresholdNonAscii;
		};

		uint32_t code_point = UnknownCharacter;

		if (byte_1 >= DecodeThreshold6Bytes) {
			advance(5);
		} else if (byte_1 >= DecodeThreshold5Bytes) {
			advance(4);
		} else if (byte_1 >= DecodeThreshold4Bytes) {
			if (is_continuation_byte(byte_2) && is_continuation_byte(byte_3) &&
			    is_continuation_byte(byte_4)) {
				code_point = static_cast<uint8_t>(byte_1 - DecodeThreshold4Bytes);
				code_point = add_bits(code_point, byte_2);
				code_point = add_bits(code_point, byte_3);
				code_point = add_bits(code_point, byte_4);
				i += 3;
				// overlong encoding, or beyond the Unicode range
				if (code_point < EncodeThreshold4Bytes || code_point > MaxCodePoint) {
					warn_decode_problem(i);
					code_point = UnknownCharacter;
				}
			} else {
				// code point encoding too short
				advance(3);
			}
		} else if (byte_1 >= DecodeThreshold3Bytes) {
			if (is_continuation_byte(byte_2) && is_continuation_byte(byte_3)) {
				code_point = static_cast<uint8_t>(byte_1 - DecodeThreshold3Bytes);
				code_point = add_bits(code_point, byte_2);
				code_point = add_bits(code_point, byte_3);
				i += 2;
				// surrogates are not characters on their own
				const auto code_unit = static_cast<char16_t>(code_point);
				if (is_high_surrogate(code_unit) || is_low_surrogate(code_unit)) {
					warn_decode_problem(i);
					code_point = UnknownCharacter;
				}
			} else {
				// code point encoding too short
				advance(2);
			}
		} else if (byte_1 >= DecodeThreshold2Bytes) {
			if (is_continuation_byte(byte_2)) {
				code_point = static_cast<uint8_t>(byte_1 - DecodeThreshold2Bytes);
				code_point = add_bits(code_point, byte_2);
				++i;
			} else {
				// code point encoding too short
				warn_decode_problem(i);
			}
		} else if (byte_1 < DecodeThresholdNonAscii) {
			// 1-byte code point, ASCII compatible
			code_point = byte_1;
		} else {
			warn_decode_problem(i); // not UTF8 encoding
		}

		if (code_point >= EncodeThreshold4Bytes) {
			const auto payload = code_point - EncodeThreshold4Bytes;
			str_out.push_back(static_cast<char16_t>(
			        HighSurrogateBase + (payload >> SurrogatePayloadBits)));
			str_out.push_back(static_cast<char16_t>(
			        LowSurrogateBase + (payload & SurrogatePayloadMask)));
		} else {
			str_out.push_back(static_cast<char16_t>(code_point));
		}
	}

	return str_out;
}

std::string ucs2_to_utf8(const std::u16string& str)
{
	std::string str_out = {};
	str_out.reserve(str.size() * 2);

	auto push = [&](const uint32_t value) {
		const auto byte = static_cast<uint8_t>(value);
		str_out.push_back(static_cast<char>(byte));
	};

	for (size_t i = 0; i < str.size(); ++i) {
		const auto code_unit = str[i];

		uint32_t code_point = code_unit;
		if (is_high_surrogate(code_unit) && i + 1 < str.size() &&
		    is_low_surrogate(str[i + 1])) {
			code_point = EncodeThreshold4Bytes +
			             (static_cast<uint32_t>(code_unit - HighSurrogateBase)
			              << SurrogatePayloadBits) +
			             static_cast<uint32_t>(str[i + 1] - LowSurrogateBase);
			++i;
		} else if (is_high_surrogate(code_unit) || is_low_surrogate(code_unit)) {
			code_point = UnknownCharacter;
		}

		if (code_point < EncodeThreshold2Bytes) {
			// Encode using 1 byte
			push(code_point);
		} else if (code_point < EncodeThreshold3Bytes) {
			// Encode using 2 bytes
			push((code_point >> 6) | 0b1'100'0000);
			push((0b0'011'1111 & code_point) | 0b1'000'0000);
		} else if (code_point < EncodeThreshold4Bytes) {
			// Encode using 3 bytes
			push((code_point >> 12) | 0b1'110'0000);
			push((0b0'011'1111 & (code_point >> 6)) | 0b1'000'0000);
			push((0b0'011'1111 & code_point) | 0b1'000'0000);
		} else {
			// Encode using 4 bytes
			push((code_point >> 18) | 0b1'111'0000);
			push((0b0'011'1111 & (code_point >> 12)) | 0b1'000'0000);
			push((0b0'011'1111 & (code_point >> 6)) | 0b1'000'0000);
			push((0b0'011'1111 & code_point) | 0b1'000'0000);
		}
	}

	return str_out;
}

size_t ucs2_length(const std::string& str)
{
	return utf8_to_ucs2(str).size();
}

bool is_ascii(const std::string& str)
{
	return std::all_of(str.begin(), str.end(), [](const char c) {
		return static_cast<uint8_t>(c) < DecodeThresholdNonAscii;
	});
}
