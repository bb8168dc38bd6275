// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**************************************************************************************************/

namespace crashdata {

/**************************************************************************************************/

std::vector<std::string> split(const std::string& src, const std::string& delimiter);

std::string join(std::vector<std::string> src, const std::string& delimiter);

std::string toupper(std::string&& s);

std::string tolower(std::string&& s);

// compares two strings ignoring ASCII case.
bool iequals(std::string_view a, std::string_view b);

/**************************************************************************************************/

// "0x" followed by `x` in lowercase hex, zero-padded to `digits`. e.g., (0x1000, 8) -> "0x00001000"
std::string format_hex(std::uint64_t x, std::size_t digits = 0);

// `x` as "0x"-prefixed lowercase hex, right-aligned with spaces in a field `width` characters wide.
// Zero has no prefix, matching printf's `%#*llx`.
std::string format_hex_field(std::uint64_t x, std::size_t width);

// `s` right-aligned with spaces in a field `width` characters wide. Longer strings are untouched.
std::string right_align(std::string_view s, std::size_t width);

/**************************************************************************************************/

// The part of `path` after the last '/'.
std::string last_path_component(std::string_view path);

// Replaces a leading `home` directory (or a leading `~`) in `path` with the `/Users/USER`
// placeholder, so user names do not leave the device.
std::string anonymize_path(std::string_view path, std::string_view home);

/**************************************************************************************************/

} // namespace crashdata

/**************************************************************************************************/
