// SPDX-FileCopyrightText:  2020-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_STRING_UTILS_H
#define FATIMG_STRING_UTILS_H

#include <algorithm>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

// case-insensitive comparisons
bool ciequals(const char a, const char b);

// case-insensitive comparison for combinations of
// const char *, const std::string&, and const string_view
template <typename T1, typename T2>
constexpr bool iequals(T1&& a, T2&& b)
{
	using str_t1 = std::conditional_t<std::is_same_v<T1, const std::string&>,
	                                  const std::string&,
	                                  const std::string_view>;

	using str_t2 = std::conditional_t<std::is_same_v<T2, const std::string&>,
	                                  const std::string&,
	                                  const std::string_view>;

	const str_t1 str_a = std::forward<T1>(a);
	const str_t2 str_b = std::forward<T2>(b);

	return std::equal(str_a.begin(), str_a.end(), str_b.begin(), str_b.end(), ciequals);
}

void trim(std::string& str, const std::string_view trim_chars = " \r\t\f\n");
void upcase(std::string& str);

// Pads the string on the right up to 'length' characters, or truncates it
// if it is longer.
std::string right_pad(const std::string& str, const size_t length, const char pad_char);

// Parse the string as an integer, return empty if the whole string can't
// be parsed. For example:
//  - parse_int("100")  returns 100
//  - parse_int("100a") returns empty
//  - parse_int("ff", 16) returns 255
//
std::optional<int> parse_int(const std::string& s, const int base = 10);

template <typename... Args>
std::string format_str(const std::string& format, const Args&... args) noexcept
{
	// Perform a non-writing format to determine the size
	const auto required_size = std::snprintf(nullptr, 0, format.c_str(), args...);
	if (required_size <= 0) {
		return {};
	}

	// snprintf still writes the trailing null into the buffer, so we need
	// to include that in our allocation.
	const auto out_size = static_cast<size_t>(required_size) +
	                      static_cast<size_t>(1);
	std::string result(out_size, '\0');

	std::snprintf(result.data(), result.size(), format.c_str(), args...);

	// Drop the trailing null
	result.pop_back();
	return result;
}

#endif
