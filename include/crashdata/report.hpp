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
#include <vector>

//--------------------------------------------------------------------------------------------------
// The raw crash snapshot as handed over by the crash capture library. Nothing in here is modified
// by the engine.

namespace crashdata {

//--------------------------------------------------------------------------------------------------

// Legacy, pre-Mach-encoding architecture values recorded by older report formats.
enum class architecture_kind {
    x86_32,
    x86_64,
    armv6,
    ppc,
    ppc64,
    armv7,
    unknown,
};

enum class operating_system {
    mac_os_x,
    iphone_os,
    iphone_simulator,
    unknown,
};

struct system_info {
    architecture_kind _architecture{architecture_kind::unknown};
    operating_system _operating_system{operating_system::unknown};
};

//--------------------------------------------------------------------------------------------------

struct processor_info {
    enum class encoding {
        unknown,
        mach, // `_type` and `_subtype` are Mach `cpu_type_t`/`cpu_subtype_t` values
    };

    encoding _encoding{encoding::unknown};
    std::uint64_t _type{0};
    std::uint64_t _subtype{0};

    bool is_mach() const { return _encoding == encoding::mach; }
};

struct machine_info {
    processor_info _processor;
};

//--------------------------------------------------------------------------------------------------

struct process_info {
    std::optional<std::string> _process_name;
    std::uint64_t _process_id{0};
    std::optional<std::string> _process_path;
    std::optional<std::string> _parent_process_name;
    std::uint64_t _parent_process_id{0};
};

struct application_info {
    std::optional<std::string> _identifier;
    std::optional<std::string> _version;
};

//--------------------------------------------------------------------------------------------------

struct symbol_info {
    std::string _name;
    std::uint64_t _start_address{0};
};

struct stack_frame_info {
    std::uint64_t _instruction_pointer{0};
    std::optional<symbol_info> _symbol;
};

struct register_info {
    std::string _name;
    std::uint64_t _value{0};
};

struct thread_info {
    std::int64_t _number{0};
    bool _crashed{false};
    std::vector<stack_frame_info> _frames;
    std::vector<register_info> _registers;
};

//--------------------------------------------------------------------------------------------------

struct exception_info {
    std::string _name;
    std::string _reason;
    std::vector<stack_frame_info> _frames;
};

struct signal_info {
    std::string _name;
    std::string _code;
    std::uint64_t _address{0};
};

//--------------------------------------------------------------------------------------------------

struct binary_image_info {
    std::string _path;
    std::optional<std::string> _uuid;
    std::uint64_t _base_address{0};
    std::uint64_t _size{0};
    std::optional<processor_info> _code_type;

    bool contains(std::uint64_t address) const {
        return address >= _base_address && address - _base_address < _size;
    }
};

//--------------------------------------------------------------------------------------------------

struct raw_crash_report {
    system_info _system;
    std::optional<machine_info> _machine;
    std::optional<process_info> _process;
    application_info _application;
    std::optional<std::string> _uuid;
    std::optional<exception_info> _exception;
    signal_info _signal;
    std::vector<thread_info> _threads;
    std::vector<binary_image_info> _images;

    // Returns the first image whose address range contains `address`, or `nullptr`.
    const binary_image_info* image_for_address(std::uint64_t address) const;

    // Returns the first thread marked as crashed, or `nullptr`.
    const thread_info* crashed_thread() const;
};

//--------------------------------------------------------------------------------------------------

// An exception the host application caught and reported explicitly.
struct handled_exception {
    std::string _name;
    std::string _reason;
};

//--------------------------------------------------------------------------------------------------

} // namespace crashdata

//--------------------------------------------------------------------------------------------------
