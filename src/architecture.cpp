// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "crashdata/architecture.hpp"

// stdc++
#include <array>

// application
#include "crashdata/mach_types.hpp"

/**************************************************************************************************/

namespace crashdata {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/

using strategy = std::optional<architecture> (*)(const raw_crash_report&);

std::optional<architecture> architecture_from_images(const raw_crash_report& report) {
    for (const auto& image : report._images) {
        if (!image._code_type || !image._code_type->is_mach()) continue;

        architecture result;
        result._cpu_type = static_cast<std::int64_t>(image._code_type->_type);
        return result;
    }

    return std::nullopt;
}

std::optional<architecture> architecture_from_legacy_value(const raw_crash_report& report) {
    architecture result;

    switch (report._system._architecture) {
        case architecture_kind::armv6:
        case architecture_kind::armv7: {
            result._cpu_type = mach::cpu_type_arm_k;
            result._lp64 = false;
        } break;
        case architecture_kind::x86_32: {
            result._cpu_type = mach::cpu_type_x86_k;
            result._lp64 = false;
        } break;
        case architecture_kind::x86_64: {
            result._cpu_type = mach::cpu_type_x86_64_k;
            result._lp64 = true;
        } break;
        case architecture_kind::ppc: {
            result._cpu_type = mach::cpu_type_powerpc_k;
            result._lp64 = false;
        } break;
        case architecture_kind::ppc64:
        case architecture_kind::unknown: {
            return std::nullopt;
        }
    }

    return result;
}

// Tried in order. Newer report formats record a Mach code type per image; older ones only have the
// legacy architecture value.
constexpr std::array<strategy, 2> strategies_k{
    architecture_from_images,
    architecture_from_legacy_value,
};

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

architecture resolve_architecture(const raw_crash_report& report) {
    for (const auto& resolve : strategies_k) {
        if (auto result = resolve(report)) return *result;
    }

    return architecture();
}

/**************************************************************************************************/

std::string arch_name(std::int64_t cpu_type, std::int64_t cpu_subtype) {
    // clang-format off
    switch (cpu_type) {
        case mach::cpu_type_arm_k: {
            // Apple includes the subtype for ARM binaries.
            switch (cpu_subtype) {
                case mach::cpu_subtype_arm_v6_k: return "armv6";
                case mach::cpu_subtype_arm_v7_k: return "armv7";
                case mach::cpu_subtype_arm_v7s_k: return "armv7s";
                default: return "arm-unknown";
            }
        }
        case mach::cpu_type_arm64_k: {
            switch (cpu_subtype) {
                case mach::cpu_subtype_arm_all_k:
                case mach::cpu_subtype_arm_v8_k: return "arm64";
                default: return "arm64-unknown";
            }
        }
        case mach::cpu_type_x86_k: return "i386";
        case mach::cpu_type_x86_64_k: return "x86_64";
        case mach::cpu_type_powerpc_k: return "powerpc";
        default: return "???";
    }
    // clang-format on
}

std::string arch_name(const binary_image_info& image) {
    if (!image._code_type || !image._code_type->is_mach()) return "???";
    return arch_name(static_cast<std::int64_t>(image._code_type->_type),
                     static_cast<std::int64_t>(image._code_type->_subtype));
}

/**************************************************************************************************/

} // namespace crashdata

/**************************************************************************************************/
