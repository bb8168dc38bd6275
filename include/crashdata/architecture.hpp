// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstdint>
#include <optional>
#include <string>

// application
#include "crashdata/report.hpp"

//--------------------------------------------------------------------------------------------------

namespace crashdata {

//--------------------------------------------------------------------------------------------------

struct architecture {
    std::optional<std::int64_t> _cpu_type;
    bool _lp64{true};
};

//--------------------------------------------------------------------------------------------------
/*
    Derives the architecture of the crashed process. Resolution is an ordered list of strategies,
    and the first one that produces a cpu type wins:

        1. The first binary image (in report order) with a Mach-encoded code type. The word width
           cannot be told from the cpu type alone here, so `_lp64` keeps its default of `true`.
        2. The legacy architecture value of the report's system info.

    If neither applies the result has no cpu type and `_lp64` is `true`.
*/
architecture resolve_architecture(const raw_crash_report& report);

//--------------------------------------------------------------------------------------------------
// Apple's name for a cpu type/subtype pair, e.g., "arm64" or "armv7s". "???" when unknown.
std::string arch_name(std::int64_t cpu_type, std::int64_t cpu_subtype);

// The architecture name of a single image, from its own code type. "???" if the image carries no
// Mach-encoded code type.
std::string arch_name(const binary_image_info& image);

//--------------------------------------------------------------------------------------------------

} // namespace crashdata

//--------------------------------------------------------------------------------------------------
