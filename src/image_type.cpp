// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "crashdata/image_type.hpp"

// stdc++
#include <array>
#include <vector>

// application
#include "crashdata/str.hpp"

/**************************************************************************************************/

namespace crashdata {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/

constexpr std::string_view bundle_marker_k = ".app/";
constexpr std::string_view swift_runtime_k = "frameworks/libswift";
constexpr std::string_view dylib_suffix_k = ".dylib";

/**************************************************************************************************/

std::string drop_private_prefix(std::string path) {
    constexpr std::string_view private_k = "/private";
    constexpr std::array<std::string_view, 3> aliased_k{"/var", "/tmp", "/etc"};

    if (!path.starts_with(private_k)) return path;

    const std::string_view rest = std::string_view(path).substr(private_k.size());

    for (const auto& alias : aliased_k) {
        if (rest.starts_with(alias) &&
            (rest.size() == alias.size() || rest[alias.size()] == '/')) {
            return std::string(rest);
        }
    }

    return path;
}

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

const char* to_string(image_type type) {
    switch (type) {
        case image_type::app_binary: return "app";
        case image_type::app_framework: return "framework";
        case image_type::other: return "other";
    }
    return "other";
}

/**************************************************************************************************/

std::string standardize_path(std::string_view path) {
    if (path.empty()) return std::string();

    const bool absolute = path.front() == '/';
    std::vector<std::string> segments;

    for (auto& segment : split(std::string(path), "/")) {
        if (segment.empty() || segment == ".") continue;

        if (segment == "..") {
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else if (!absolute) {
                segments.push_back(std::move(segment));
            }
            continue;
        }

        segments.push_back(std::move(segment));
    }

    std::string result = join(std::move(segments), "/");

    if (!absolute) return result;

    return drop_private_prefix("/" + result);
}

/**************************************************************************************************/

image_type classify_image(std::string_view image_path, std::string_view process_path) {
    const std::string standardized = tolower(standardize_path(image_path));
    const std::string raw = tolower(std::string(image_path));
    const std::string process = tolower(std::string(process_path));

    const auto bundle_pos = standardized.find(bundle_marker_k);

    if (bundle_pos == std::string::npos) return image_type::other;

    if (standardized.find(swift_runtime_k) != std::string::npos &&
        standardized.ends_with(dylib_suffix_k)) {
        return image_type::other;
    }

    const std::string bundle_root = standardized.substr(0, bundle_pos + bundle_marker_k.size());

    // The raw comparisons catch the OS versions where standardizing drops a leading `/private`.
    if (!process.empty() && (standardized == process || raw.starts_with(process))) {
        return image_type::app_binary;
    }

    if (standardized.starts_with(bundle_root) || raw.starts_with(bundle_root)) {
        return image_type::app_framework;
    }

    return image_type::other;
}

/**************************************************************************************************/

} // namespace crashdata

/**************************************************************************************************/
