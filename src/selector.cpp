// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "crashdata/selector.hpp"

// stdc++
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <sstream>

// adobe contract checks
#include "adobe/contract_checks.hpp"

// application
#include "crashdata/crashdata.hpp" // for cout_safe
#include "crashdata/mach_types.hpp"
#include "crashdata/str.hpp"
#include "crashdata/tracy.hpp"

/**************************************************************************************************/

namespace crashdata {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/

constexpr std::string_view text_segment_k = "__TEXT";
constexpr std::string_view selector_section_k = "__objc_methname";

/**************************************************************************************************/
// The images are mapped by the loader at addresses with no alignment guarantee for these
// structures, so they are always copied out.
template <typename T>
T read_pod(const std::byte* p) {
    T x;
    std::memcpy(&x, p, sizeof(T));
    return x;
}

// Segment and section names are fixed 16 character fields, NUL-padded but not NUL-terminated when
// all 16 characters are used.
std::string_view fixed_name(const char (&name)[16]) {
    return std::string_view(name, strnlen(name, sizeof(name)));
}

/**************************************************************************************************/

struct macho_layout {
    bool _is_64_bit{false};
    std::uint32_t _ncmds{0};
    std::uint32_t _sizeofcmds{0};
    const std::byte* _commands{nullptr};
};

std::optional<macho_layout> read_layout(const std::byte* header) {
    if (!header) return std::nullopt;

    const auto magic = read_pod<std::uint32_t>(header);

    if (magic == mach::mh_magic_64_k) {
        const auto h = read_pod<mach::header_64>(header);
        return macho_layout{true, h.ncmds, h.sizeofcmds, header + sizeof(mach::header_64)};
    } else if (magic == mach::mh_magic_k) {
        const auto h = read_pod<mach::header>(header);
        return macho_layout{false, h.ncmds, h.sizeofcmds, header + sizeof(mach::header)};
    }

    return std::nullopt;
}

/**************************************************************************************************/
// Calls `f(command, address)` for each load command until `f` returns `true`. The walk stops at
// the first command that claims to extend past `sizeofcmds`.
template <typename F>
void for_each_load_command(const macho_layout& layout, F&& f) {
    const std::byte* p = layout._commands;
    std::size_t remaining = layout._sizeofcmds;

    for (std::uint32_t i = 0; i < layout._ncmds; ++i) {
        if (remaining < sizeof(mach::load_command)) return;

        const auto command = read_pod<mach::load_command>(p);

        if (command.cmdsize < sizeof(mach::load_command) || command.cmdsize > remaining) return;

        if (f(command, p)) return;

        p += command.cmdsize;
        remaining -= command.cmdsize;
    }
}

/**************************************************************************************************/

template <typename Segment, typename Section>
std::optional<bounded_region> find_section(const mach::load_command& command,
                                           const std::byte* p,
                                           std::intptr_t slide) {
    if (command.cmdsize < sizeof(Segment)) return std::nullopt;

    const auto segment = read_pod<Segment>(p);

    const std::size_t capacity = (command.cmdsize - sizeof(Segment)) / sizeof(Section);
    const std::size_t count = std::min<std::size_t>(segment.nsects, capacity);
    const std::byte* section_p = p + sizeof(Segment);

    for (std::size_t i = 0; i < count; ++i, section_p += sizeof(Section)) {
        const auto section = read_pod<Section>(section_p);

        if (fixed_name(section.segname) != text_segment_k ||
            fixed_name(section.sectname) != selector_section_k) {
            continue;
        }

        // The recorded address is the link-time one; the image was moved by `slide`.
        const auto first = static_cast<std::uintptr_t>(section.addr) +
                           static_cast<std::uintptr_t>(slide);
        const auto last = first + static_cast<std::uintptr_t>(section.size);

        if (last < first) return std::nullopt;

        return bounded_region(reinterpret_cast<const char*>(first),
                              reinterpret_cast<const char*>(last));
    }

    return std::nullopt;
}

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

bounded_region::bounded_region(const char* first, const char* last) : _first(first), _last(last) {
    ADOBE_PRECONDITION(reinterpret_cast<std::uintptr_t>(first) <=
                           reinterpret_cast<std::uintptr_t>(last),
                       "bounded_region end precedes its start");
}

bool bounded_region::contains(std::uintptr_t address) const {
    return address >= reinterpret_cast<std::uintptr_t>(_first) &&
           address < reinterpret_cast<std::uintptr_t>(_last);
}

std::optional<std::string_view> bounded_region::c_string_at(std::uintptr_t address) const {
    if (!contains(address)) return std::nullopt;

    const char* p = reinterpret_cast<const char*>(address);
    const auto available = static_cast<std::size_t>(reinterpret_cast<std::uintptr_t>(_last) - address);
    const void* terminator = std::memchr(p, 0, available);

    if (!terminator) return std::nullopt;

    const auto length = static_cast<std::size_t>(static_cast<const char*>(terminator) - p);

    // An empty name is refused rather than reported as an empty selector.
    if (length == 0) return std::nullopt;

    return std::string_view(p, length);
}

/**************************************************************************************************/

std::optional<std::string> image_uuid(const std::byte* header) {
    const auto layout = read_layout(header);

    if (!layout) return std::nullopt;

    std::optional<std::string> result;

    for_each_load_command(*layout, [&](const mach::load_command& command, const std::byte* p) {
        if (command.cmd != mach::lc_uuid_k) return false;
        if (command.cmdsize < sizeof(mach::uuid_command)) return true;

        const auto uuid = read_pod<mach::uuid_command>(p);
        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (const auto byte : uuid.uuid) {
            ss << std::setw(2) << static_cast<unsigned>(byte);
        }
        result = ss.str();
        return true;
    });

    return result;
}

/**************************************************************************************************/

std::optional<bounded_region> selector_section(const std::byte* header, std::intptr_t slide) {
    const auto layout = read_layout(header);

    if (!layout) return std::nullopt;

    std::optional<bounded_region> result;

    for_each_load_command(*layout, [&](const mach::load_command& command, const std::byte* p) {
        if (layout->_is_64_bit && command.cmd == mach::lc_segment_64_k) {
            result = find_section<mach::segment_command_64, mach::section_64>(command, p, slide);
        } else if (!layout->_is_64_bit && command.cmd == mach::lc_segment_k) {
            result = find_section<mach::segment_command, mach::section>(command, p, slide);
        }
        return result.has_value();
    });

    return result;
}

/**************************************************************************************************/

std::optional<std::string> find_selector(const image_table& table,
                                         const std::string& image_path,
                                         const std::string& uuid,
                                         std::uint64_t relative_address) {
    ZoneScoped;

    const std::uint32_t count = table.count();

    for (std::uint32_t i = 0; i < count; ++i) {
        const std::optional<loaded_image> image = table.image(i);

        // The image was unloaded since `count()` was taken.
        if (!image || !image->_header) continue;

        if (image->_path != image_path) continue;

        // Guard against a different build of the image now living at the same path.
        const auto loaded_uuid = image_uuid(image->_header);
        if (!loaded_uuid || !iequals(*loaded_uuid, uuid)) continue;

        const auto section = selector_section(image->_header, image->_slide);
        if (!section) return std::nullopt;

        const std::uintptr_t target =
            reinterpret_cast<std::uintptr_t>(image->_header) + relative_address;

        const auto name = section->c_string_at(target);
        if (!name) return std::nullopt;

        return std::string(*name);
    }

    return std::nullopt;
}

/**************************************************************************************************/

std::optional<std::string> selector_for_register(const image_table& table,
                                                 const raw_crash_report& report,
                                                 const thread_info& thread,
                                                 std::string_view register_name) {
    std::uint64_t address{0};

    for (const auto& reg : thread._registers) {
        if (reg._name == register_name) {
            address = reg._value;
            break;
        }
    }

    if (address == 0) return std::nullopt;

    const binary_image_info* image = report.image_for_address(address);

    if (!image || !image->_uuid) return std::nullopt;

    return find_selector(table, image->_path, *image->_uuid, address - image->_base_address);
}

/**************************************************************************************************/
// See http://sealiesoftware.com/blog/archive/2008/09/22/objc_explain_So_you_crashed_in_objc_msgSend.html
std::vector<std::string_view> selector_registers(settings::target target, bool lp64) {
    if (target == settings::target::simulator) {
        if (lp64) return {"rsi", "rdx"};
        return {"ecx"};
    }

    if (lp64) return {"x1"};
    return {"r1", "r2"};
}

/**************************************************************************************************/

std::optional<std::string> recover_selector(const image_table& table,
                                            const raw_crash_report& report,
                                            const thread_info& crashed_thread,
                                            bool lp64) {
    ZoneScoped;

    for (const auto& name : selector_registers(settings::instance()._target, lp64)) {
        auto selector = selector_for_register(table, report, crashed_thread, name);

        if (!selector) continue;

        if (log_level_at_least(settings::log_level::verbose)) {
            cout_safe([&](auto& s) {
                s << "verbose: recovered selector '" << *selector << "' from register " << name
                  << '\n';
            });
        }

        return selector;
    }

    return std::nullopt;
}

/**************************************************************************************************/

} // namespace crashdata

/**************************************************************************************************/
