// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

//--------------------------------------------------------------------------------------------------

namespace crashdata {

//--------------------------------------------------------------------------------------------------
// A snapshot of a single image loaded into this process. `_header` points at the image's Mach-O
// header in memory; `_slide` is the amount the image was moved from its link-time address.
struct loaded_image {
    const std::byte* _header{nullptr};
    std::intptr_t _slide{0};
    std::string _path;
};

//--------------------------------------------------------------------------------------------------
/*
    The table of images currently loaded in this process. The OS may load or unload images at any
    time from any thread, so callers snapshot `count()` first and then query each index. An index
    that no longer refers to an image (because one was unloaded between the two calls) yields
    `std::nullopt`, and must be treated as a miss rather than an error. Nothing is cached between
    calls.
*/
class image_table {
public:
    virtual ~image_table() = default;

    virtual std::uint32_t count() const = 0;

    virtual std::optional<loaded_image> image(std::uint32_t index) const = 0;
};

//--------------------------------------------------------------------------------------------------
// The table backed by the dynamic loader of this process. On platforms without dyld no Mach-O
// images are ever loaded, and the returned table is empty.
const image_table& live_image_table();

//--------------------------------------------------------------------------------------------------

} // namespace crashdata

//--------------------------------------------------------------------------------------------------
