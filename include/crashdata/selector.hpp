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
#include <string_view>
#include <vector>

// application
#include "crashdata/image_table.hpp"
#include "crashdata/report.hpp"
#include "crashdata/settings.hpp"

//--------------------------------------------------------------------------------------------------

namespace crashdata {

//--------------------------------------------------------------------------------------------------
/*
    A validated `[first, last)` window onto memory this process does not own the layout of (e.g., a
    string table section of a loaded image). The only way to get a string out of it is
    `c_string_at`, which refuses any position outside the window and any string whose terminator
    is not found before `last`. No partial string is ever produced.
*/
class bounded_region {
public:
    bounded_region(const char* first, const char* last);

    const char* begin() const { return _first; }
    const char* end() const { return _last; }
    std::size_t size() const { return static_cast<std::size_t>(_last - _first); }

    bool contains(std::uintptr_t address) const;

    // Addresses are taken as integers so no pointer is formed before it has been validated.
    std::optional<std::string_view> c_string_at(std::uintptr_t address) const;

private:
    const char* _first{nullptr};
    const char* _last{nullptr};
};

//--------------------------------------------------------------------------------------------------
// Returns the `LC_UUID` of the Mach-O image whose header is at `header` as 32 lowercase hex
// digits, or `std::nullopt` if the header is unrecognized or has no UUID command.
std::optional<std::string> image_uuid(const std::byte* header);

// Returns the slid `__TEXT,__objc_methname` section of the Mach-O image whose header is at
// `header`, or `std::nullopt` if the image has no such section.
std::optional<bounded_region> selector_section(const std::byte* header, std::intptr_t slide);

//--------------------------------------------------------------------------------------------------
// Looks up the loaded image matching `image_path` (byte-for-byte) and `uuid` (ignoring case),
// and reads the selector name stored at `relative_address` bytes past its header, provided the
// address lands inside the image's method name section and the name is terminated within it.
std::optional<std::string> find_selector(const image_table& table,
                                         const std::string& image_path,
                                         const std::string& uuid,
                                         std::uint64_t relative_address);

// Recovers a selector name from the value of the register named `register_name` in `thread`.
std::optional<std::string> selector_for_register(const image_table& table,
                                                 const raw_crash_report& report,
                                                 const thread_info& thread,
                                                 std::string_view register_name);

// The argument registers that may hold the selector of a message send for a given target and
// word width, in the order they should be tried.
std::vector<std::string_view> selector_registers(settings::target target, bool lp64);

// Tries each of `selector_registers` in order, returning the first recovered selector.
std::optional<std::string> recover_selector(const image_table& table,
                                            const raw_crash_report& report,
                                            const thread_info& crashed_thread,
                                            bool lp64);

//--------------------------------------------------------------------------------------------------

} // namespace crashdata

//--------------------------------------------------------------------------------------------------
