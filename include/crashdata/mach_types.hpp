// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstdint>

/**************************************************************************************************/
// The subset of the Mach-O `<mach-o/loader.h>` and `<mach/machine.h>` definitions the engine needs.
// These live in their own namespace so they can coexist with the system headers on Apple platforms,
// where those are macros.

namespace crashdata::mach {

/**************************************************************************************************/

constexpr std::uint32_t mh_magic_k = 0xfeedface;
constexpr std::uint32_t mh_magic_64_k = 0xfeedfacf;

constexpr std::uint32_t lc_segment_k = 0x1;
constexpr std::uint32_t lc_segment_64_k = 0x19;
constexpr std::uint32_t lc_uuid_k = 0x1b;

using cpu_type_t = std::int32_t;
using cpu_subtype_t = std::int32_t;

constexpr cpu_type_t cpu_type_any_k = -1;
constexpr cpu_type_t cpu_arch_mask_k = static_cast<cpu_type_t>(0xff000000);
constexpr cpu_type_t cpu_arch_abi64_k = 0x01000000;
constexpr cpu_type_t cpu_type_x86_k = 7;
constexpr cpu_type_t cpu_type_arm_k = 12;
constexpr cpu_type_t cpu_type_powerpc_k = 18;
constexpr cpu_type_t cpu_type_x86_64_k = cpu_type_x86_k | cpu_arch_abi64_k;
constexpr cpu_type_t cpu_type_arm64_k = cpu_type_arm_k | cpu_arch_abi64_k;

constexpr cpu_subtype_t cpu_subtype_multiple_k = -1;
constexpr cpu_subtype_t cpu_subtype_arm_all_k = 0;
constexpr cpu_subtype_t cpu_subtype_arm_v6_k = 6;
constexpr cpu_subtype_t cpu_subtype_arm_v7_k = 9;
constexpr cpu_subtype_t cpu_subtype_arm_v7s_k = 11;
constexpr cpu_subtype_t cpu_subtype_arm_v8_k = 13;

/**************************************************************************************************/

struct header {
    std::uint32_t magic;
    cpu_type_t cputype;
    cpu_subtype_t cpusubtype;
    std::uint32_t filetype;
    std::uint32_t ncmds;
    std::uint32_t sizeofcmds;
    std::uint32_t flags;
};

struct header_64 {
    std::uint32_t magic;
    cpu_type_t cputype;
    cpu_subtype_t cpusubtype;
    std::uint32_t filetype;
    std::uint32_t ncmds;
    std::uint32_t sizeofcmds;
    std::uint32_t flags;
    std::uint32_t reserved;
};

struct load_command {
    std::uint32_t cmd;
    std::uint32_t cmdsize;
};

struct segment_command {
    std::uint32_t cmd;
    std::uint32_t cmdsize;
    char segname[16];
    std::uint32_t vmaddr;
    std::uint32_t vmsize;
    std::uint32_t fileoff;
    std::uint32_t filesize;
    std::int32_t maxprot;
    std::int32_t initprot;
    std::uint32_t nsects;
    std::uint32_t flags;
};

struct segment_command_64 {
    std::uint32_t cmd;
    std::uint32_t cmdsize;
    char segname[16];
    std::uint64_t vmaddr;
    std::uint64_t vmsize;
    std::uint64_t fileoff;
    std::uint64_t filesize;
    std::int32_t maxprot;
    std::int32_t initprot;
    std::uint32_t nsects;
    std::uint32_t flags;
};

struct section {
    char sectname[16];
    char segname[16];
    std::uint32_t addr;
    std::uint32_t size;
    std::uint32_t offset;
    std::uint32_t align;
    std::uint32_t reloff;
    std::uint32_t nreloc;
    std::uint32_t flags;
    std::uint32_t reserved1;
    std::uint32_t reserved2;
};

struct section_64 {
    char sectname[16];
    char segname[16];
    std::uint64_t addr;
    std::uint64_t size;
    std::uint32_t offset;
    std::uint32_t align;
    std::uint32_t reloff;
    std::uint32_t nreloc;
    std::uint32_t flags;
    std::uint32_t reserved1;
    std::uint32_t reserved2;
    std::uint32_t reserved3;
};

struct uuid_command {
    std::uint32_t cmd;
    std::uint32_t cmdsize;
    std::uint8_t uuid[16];
};

static_assert(sizeof(header) == 28);
static_assert(sizeof(header_64) == 32);
static_assert(sizeof(segment_command) == 56);
static_assert(sizeof(segment_command_64) == 72);
static_assert(sizeof(section) == 68);
static_assert(sizeof(section_64) == 80);
static_assert(sizeof(uuid_command) == 24);

/**************************************************************************************************/

} // namespace crashdata::mach

/**************************************************************************************************/
