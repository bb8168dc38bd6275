// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstddef>
#include <string>
#include <string_view>

// application
#include "crashdata/crash_data.hpp"
#include "crashdata/report.hpp"

//--------------------------------------------------------------------------------------------------

namespace crashdata {

//--------------------------------------------------------------------------------------------------

// Formats one stack frame of `report`. App images are deliberately left unsymbolicated: their
// frames are rendered as `0x<image base> + <offset>` to be symbolicated server-side.
crash_data_thread_frame format_stack_frame(const stack_frame_info& frame,
                                           std::size_t index,
                                           const raw_crash_report& report,
                                           bool lp64);

// Removes the leading underscore the platform's C symbol mangling adds, where the OS is known to
// use one.
std::string strip_symbol_prefix(std::string symbol, operating_system os);

// Pads or truncates an image name to the fixed column of a textual report.
std::string pad_image_name(std::string_view name);

//--------------------------------------------------------------------------------------------------

} // namespace crashdata

//--------------------------------------------------------------------------------------------------
