// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "crashdata/report.hpp"

// stdc++
#include <algorithm>

/**************************************************************************************************/

namespace crashdata {

/**************************************************************************************************/

const binary_image_info* raw_crash_report::image_for_address(std::uint64_t address) const {
    auto found = std::find_if(_images.begin(), _images.end(),
                              [&](const auto& image) { return image.contains(address); });
    return found == _images.end() ? nullptr : &*found;
}

/**************************************************************************************************/

const thread_info* raw_crash_report::crashed_thread() const {
    auto found = std::find_if(_threads.begin(), _threads.end(),
                              [](const auto& thread) { return thread._crashed; });
    return found == _threads.end() ? nullptr : &*found;
}

/**************************************************************************************************/

} // namespace crashdata

/**************************************************************************************************/
