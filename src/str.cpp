// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "crashdata/str.hpp"

// stdc++
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

/**************************************************************************************************/

namespace crashdata {

/**************************************************************************************************/

std::vector<std::string> split(const std::string& src, const std::string& delimiter) {
    std::size_t p = 0;
    std::vector<std::string> result;
    while (true) {
        auto next = src.find(delimiter, p);
        if (next == std::string::npos) {
            result.push_back(src.substr(p, std::string::npos));
            break;
        }
        result.push_back(src.substr(p, next - p));
        p = next + delimiter.size();
        if (p > src.size()) break;
    }
    return result;
}

/**************************************************************************************************/

std::string join(std::vector<std::string> src, const std::string& delimiter) {
    if (src.empty()) return std::string();
    std::string result = src[0];
    for (std::size_t i = 1; i < src.size(); ++i)
        result += delimiter + src[i];
    return result;
}

/**************************************************************************************************/

std::string toupper(std::string&& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return static_cast<char>(std::toupper(c));
    });
    return s;
}

std::string tolower(std::string&& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

/**************************************************************************************************/

std::string format_hex(std::uint64_t x, std::size_t digits) {
    std::stringstream result;
    result << "0x" << std::hex << std::setfill('0') << std::setw(static_cast<int>(digits)) << x;
    return result.str();
}

std::string format_hex_field(std::uint64_t x, std::size_t width) {
    std::stringstream result;
    result << std::hex << std::showbase << std::setw(static_cast<int>(width)) << x;
    return result.str();
}

std::string right_align(std::string_view s, std::size_t width) {
    if (s.size() >= width) return std::string(s);
    return std::string(width - s.size(), ' ') + std::string(s);
}

/**************************************************************************************************/

std::string last_path_component(std::string_view path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string_view::npos) return std::string(path);
    return std::string(path.substr(pos + 1));
}

/**************************************************************************************************/

std::string anonymize_path(std::string_view path, std::string_view home) {
    constexpr std::string_view placeholder_k = "/Users/USER";

    // A home directory given with a trailing separator still has to match on a segment boundary.
    while (home.size() > 1 && home.ends_with('/')) {
        home.remove_suffix(1);
    }

    if (!home.empty() && home != "/" && path.starts_with(home) &&
        (path.size() == home.size() || path[home.size()] == '/')) {
        return std::string(placeholder_k) + std::string(path.substr(home.size()));
    }

    if (path.starts_with('~') && (path.size() == 1 || path[1] == '/')) {
        return std::string(placeholder_k) + std::string(path.substr(1));
    }

    return std::string(path);
}

/**************************************************************************************************/

} // namespace crashdata

/**************************************************************************************************/
