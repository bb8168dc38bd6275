// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "crashdata/frame.hpp"

// stdc++
#include <vector>

// application
#include "crashdata/crashdata.hpp" // for cerr_safe
#include "crashdata/image_type.hpp"
#include "crashdata/settings.hpp"
#include "crashdata/str.hpp"
#include "crashdata/tracy.hpp"

/**************************************************************************************************/

namespace crashdata {

/**************************************************************************************************/

crash_data_thread_frame format_stack_frame(const stack_frame_info& frame,
                                           std::size_t index,
                                           const raw_crash_report& report,
                                           bool lp64) {
    ZoneScoped;

    const std::uint64_t pc = frame._instruction_pointer;
    std::uint64_t base_address{0};
    std::string image_name(unknown_k);
    image_type type = image_type::other;

    if (const binary_image_info* image = report.image_for_address(pc)) {
        image_name = last_path_component(image->_path);
        base_address = image->_base_address;

        const std::string_view process_path =
            report._process && report._process->_process_path ?
                std::string_view(*report._process->_process_path) :
                std::string_view();

        type = classify_image(image->_path, process_path);
    } else if (log_level_at_least(settings::log_level::verbose)) {
        cout_safe([&](auto& s) {
            s << "verbose: no image contains frame " << index << " (" << format_hex(pc) << ")\n";
        });
    }

    crash_data_thread_frame result;
    result._address = format_hex(pc, lp64 ? 16 : 8);
    result._image = pad_image_name(image_name);

    // Apple's reports use `symbol + offset` where a symbol is known, and `image base + offset`
    // otherwise.
    if (frame._symbol && type == image_type::other) {
        const auto symbol_offset = static_cast<std::int64_t>(pc - frame._symbol->_start_address);
        result._symbol =
            strip_symbol_prefix(frame._symbol->_name, report._system._operating_system) + " + " +
            std::to_string(symbol_offset);
    } else {
        const auto pc_offset = static_cast<std::int64_t>(pc - base_address);
        result._symbol = format_hex(base_address) + " + " + std::to_string(pc_offset);
    }

    return result;
}

/**************************************************************************************************/

std::string strip_symbol_prefix(std::string symbol, operating_system os) {
    if (symbol.size() <= 1 || symbol.front() != '_') return symbol;

    switch (os) {
        case operating_system::mac_os_x:
        case operating_system::iphone_os:
        case operating_system::iphone_simulator: {
            symbol.erase(0, 1);
        } break;
        case operating_system::unknown: {
            if (log_level_at_least(settings::log_level::warning)) {
                cerr_safe([&](auto& s) {
                    s << "warning: symbol prefix rules are unknown for this OS\n";
                });
            }
        } break;
    }

    return symbol;
}

/**************************************************************************************************/
// Names up to 33 code points are padded to a 36 column field; anything longer is cut to 32 code
// points and marked with an ellipsis, which fills the field exactly.
std::string pad_image_name(std::string_view name) {
    constexpr std::size_t column_k = 36;
    constexpr std::size_t longest_k = 33;
    constexpr std::size_t truncated_k = 32;

    std::vector<std::size_t> starts;
    for (std::size_t i = 0; i < name.size(); ++i) {
        if ((static_cast<unsigned char>(name[i]) & 0xc0) != 0x80) starts.push_back(i);
    }

    if (starts.size() > longest_k) {
        return std::string(name.substr(0, starts[truncated_k])) + "... ";
    }

    return std::string(name) + std::string(column_k - starts.size(), ' ');
}

/**************************************************************************************************/

} // namespace crashdata

/**************************************************************************************************/
