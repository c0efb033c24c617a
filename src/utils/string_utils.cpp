// SPDX-FileCopyrightText:  2020-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "utils/string_utils.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

bool ciequals(const char a, const char b)
{
	return tolower(a) == tolower(b);
}

void trim(std::string& str, const std::string_view trim_chars)
{
	const auto empty_pfx = str.find_first_not_of(trim_chars);
	if (empty_pfx == std::string::npos) {
		str.clear(); // whole string is filled with trim_chars
		return;
	}
	const auto empty_sfx = str.find_last_not_of(trim_chars);
	str.erase(empty_sfx + 1);
	str.erase(0, empty_pfx);
}

void upcase(std::string& str)
{
	auto to_upper = [](const int character) {
		return static_cast<char>(std::toupper(character));
	};
	std::transform(str.begin(), str.end(), str.begin(), to_upper);
}

std::string right_pad(const std::string& str, const size_t length, const char pad_char)
{
	auto temp = str;
	temp.resize(length, pad_char);
	return temp;
}

std::optional<int> parse_int(const std::string& s, const int base)
{
	try {
		if (!s.empty()) {
			size_t num_chars_processed = 0;
			const auto number = std::stoi(s, &num_chars_processed, base);
			if (s.size() == num_chars_processed) {
				return number;
			}
		}
		// Note: stoi can throw invalid_argument and out_of_range
	} catch (const std::invalid_argument&) {
		// do nothing, we expect these
	} catch (const std::out_of_range&) {
		// do nothing, we expect these
	}
	return {};
}
