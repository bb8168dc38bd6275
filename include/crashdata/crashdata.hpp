// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// application
#include "crashdata/crash_data.hpp"
#include "crashdata/image_table.hpp"
#include "crashdata/report.hpp"
#include "crashdata/settings.hpp"

//--------------------------------------------------------------------------------------------------

namespace crashdata {

//--------------------------------------------------------------------------------------------------
/*
    Converts a raw crash snapshot into its crash data record. This never throws and always
    produces a complete record; fields that cannot be derived hold their sentinel values.

    `reporter_key` identifies the reporting SDK instance. `exception` is set when the report is for
    an exception the application handled itself. `table` is consulted only to recover the selector
    of a crashing message send, when the report carries no exception info.
*/
crash_data crash_data_for_report(const raw_crash_report& report,
                                 const std::string& reporter_key,
                                 const std::optional<handled_exception>& exception,
                                 const image_table& table = live_image_table());

// The UUID, architecture and kind of every image that belongs to the app (its executable and
// bundled frameworks), ordered by base address. System images are not included.
std::vector<app_uuid> app_uuids_for_report(const raw_crash_report& report);

// Orders images by ascending base address. Images with equal base addresses are equivalent and
// may end up in any relative order.
std::vector<const binary_image_info*> sort_binary_images(
    const std::vector<binary_image_info>& images);

//--------------------------------------------------------------------------------------------------

std::mutex& ostream_safe_mutex();

template <class F>
void ostream_safe(std::ostream& s, F&& f) {
    std::lock_guard<std::mutex> lock{ostream_safe_mutex()};
    std::forward<F>(f)(s);
}

template <class F>
void cout_safe(F&& f) {
    ostream_safe(std::cout, std::forward<F>(f));
}

template <class F>
void cerr_safe(F&& f) {
    ostream_safe(std::cerr, std::forward<F>(f));
}

//--------------------------------------------------------------------------------------------------

} // namespace crashdata

//--------------------------------------------------------------------------------------------------
