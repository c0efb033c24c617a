// SPDX-FileCopyrightText:  2020-2026 The DOSBox Staging Team
// SPDX-FileCopyrightText:  2002-2021 The DOSBox Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "dos/dos_names.h"

#include <algorithm>
#include <cctype>

#include "misc/unicode.h"
#include "utils/string_utils.h"

constexpr char ReplacementCharacter = '_';

// Characters allowed in the short name, except the letter case
static bool is_valid_short_name_character(const char16_t c)
{
	if (c <= 32 || c >= 127) {
		return false;
	}
	return !is_special_character(static_cast<char>(c));
}

static bool is_dot_entry(const std::string& name)
{
	return name == "." || name == "..";
}

bool needs_lfn(const std::string& name)
{
	if (is_dot_entry(name)) {
		return false;
	}

	const auto is_strict_8x3_character = [](const char c) {
		return is_valid_short_name_character(static_cast<uint8_t>(c)) &&
		       !(c >= 'a' && c <= 'z');
	};

	const auto dot_pos = name.find('.');
	const auto base    = std::string_view(name).substr(0, dot_pos);
	if (base.empty() || base.size() > ShortNameBaseLength) {
		return true;
	}
	if (!std::all_of(base.begin(), base.end(), is_strict_8x3_character)) {
		return true;
	}
	if (dot_pos == std::string::npos) {
		return false; /* made it past 8 or less normal chars and end of
		                 string: normal */
	}

	/* skip dot */
	const auto ext = std::string_view(name).substr(dot_pos + 1);

	// an empty extension or another '.' means LFN
	if (ext.empty() || ext.size() > ShortNameExtLength) {
		return true;
	}
	return !std::all_of(ext.begin(), ext.end(), [&](const char c) {
		return c != '.' && is_strict_8x3_character(c);
	});
}

std::optional<std::string> generate_short_name(const std::string& long_name,
                                               const ShortNameSet& used_names)
{
	if (is_dot_entry(long_name)) {
		return long_name;
	}

	auto input = utf8_to_ucs2(long_name);

	// Set if anything but the letter case was changed
	bool is_lossy = false;

	// Leading and trailing dots and spaces are never part of the short name
	while (!input.empty() && (input.front() == u'.' || input.front() == u' ')) {
		input.erase(input.begin());
		is_lossy = true;
	}
	while (!input.empty() && (input.back() == u'.' || input.back() == u' ')) {
		input.pop_back();
		is_lossy = true;
	}

	auto convert = [&](const std::u16string_view part, const size_t max_length) {
		std::string result = {};
		for (const auto c : part) {
			if (c == u' ' || c == u'.') {
				is_lossy = true;
				continue;
			}
			// The high surrogate already got replaced
			if (is_low_surrogate(c)) {
				continue;
			}
			if (result.size() >= max_length) {
				is_lossy = true;
				break;
			}
			if (is_valid_short_name_character(c)) {
				result += static_cast<char>(std::toupper(static_cast<int>(c)));
			} else {
				result += ReplacementCharacter;
				is_lossy = true;
			}
		}
		return result;
	};

	const auto found = input.rfind(u'.');
	const auto input_view = std::u16string_view(input);

	auto base = convert(input_view.substr(0, found), ShortNameBaseLength);
	const auto ext = (found != std::u16string::npos)
	                       ? convert(input_view.substr(found + 1), ShortNameExtLength)
	                       : std::string();

	if (base.empty()) {
		base     = std::string(1, ReplacementCharacter);
		is_lossy = true;
	}

	auto make_name = [&ext](const std::string& name_base) {
		return ext.empty() ? name_base : name_base + "." + ext;
	};

	if (!is_lossy) {
		auto candidate = make_name(base);
		if (!used_names.contains(candidate)) {
			return candidate;
		}
	}

	/* Generate 8.3 names with tilde usage (from ~1 to ~9999). */
	for (uint16_t num = 1; num <= MaxNumericTail; ++num) {
		const auto tail = "~" + std::to_string(num);
		auto candidate  = make_name(
                        base.substr(0, ShortNameBaseLength - tail.size()) + tail);
		if (!used_names.contains(candidate)) {
			return candidate;
		}
	}

	return {};
}

std::array<uint8_t, ShortNameLength> to_dir_name(const std::string& short_name)
{
	std::array<uint8_t, ShortNameLength> result = {};
	result.fill(' ');

	auto copy_padded = [&](const std::string& part, const size_t offset, const size_t length) {
		const auto padded = right_pad(part, length, ' ');
		std::copy(padded.begin(), padded.end(), result.begin() + offset);
	};

	if (is_dot_entry(short_name)) {
		copy_padded(short_name, 0, ShortNameLength);
		return result;
	}

	const auto found = short_name.rfind('.');
	copy_padded(short_name.substr(0, found), 0, ShortNameBaseLength);
	if (found != std::string::npos) {
		copy_padded(short_name.substr(found + 1),
		            ShortNameBaseLength,
		            ShortNameExtLength);
	}
	return result;
}

std::string dir_name_to_string(const uint8_t* dir_name)
{
	std::string base(reinterpret_cast<const char*>(dir_name), ShortNameBaseLength);
	std::string ext(reinterpret_cast<const char*>(dir_name) + ShortNameBaseLength,
	                ShortNameExtLength);

	auto trim_right = [](std::string& str) {
		const auto last = str.find_last_not_of(' ');
		str.erase(last == std::string::npos ? 0 : last + 1);
	};
	trim_right(base);
	trim_right(ext);

	return ext.empty() ? base : base + "." + ext;
}
