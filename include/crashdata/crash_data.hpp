// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

//--------------------------------------------------------------------------------------------------

namespace crashdata {

//--------------------------------------------------------------------------------------------------

constexpr const char* unknown_k = "???";

//--------------------------------------------------------------------------------------------------

struct crash_data_headers {
    std::string _id{unknown_k};
    std::string _incident_identifier{unknown_k};
    std::string _process{unknown_k};
    std::optional<std::uint64_t> _process_id;
    std::string _parent_process{unknown_k};
    std::optional<std::uint64_t> _parent_process_id;
    std::string _application_identifier{unknown_k};
    std::string _application_build{unknown_k};
    std::string _application_path{unknown_k};
    std::optional<std::int64_t> _crash_thread;
    std::string _exception_address{unknown_k};
    std::string _exception_type{unknown_k};
    std::optional<std::string> _exception_reason;
    std::string _exception_code{unknown_k};
};

struct crash_data_thread_frame {
    std::string _address;
    std::string _symbol;
    std::string _image; // padded image column, only used by the text rendering
    std::map<std::string, std::string> _registers;
};

struct crash_data_thread {
    static constexpr std::int64_t exception_thread_id_k = -1;

    std::int64_t _id{0};
    std::vector<crash_data_thread_frame> _frames;
};

struct crash_data_binary {
    std::string _uuid{unknown_k};
    std::int64_t _cpu_type{-1};
    std::int64_t _cpu_subtype{-1};
    std::string _start_address;
    std::string _end_address;
    std::string _path;
    std::string _name;
};

struct crash_data {
    crash_data_headers _headers;
    std::vector<crash_data_thread> _threads;
    std::vector<crash_data_binary> _binaries;
};

//--------------------------------------------------------------------------------------------------
// One entry of the auxiliary export consumed by the dSYM matching collaborator.
struct app_uuid {
    std::string _uuid;
    std::string _arch;
    std::string _type; // "app" or "framework"

    friend bool operator==(const app_uuid&, const app_uuid&) = default;
};

//--------------------------------------------------------------------------------------------------
// Deterministic JSON rendering. Absent optional values render as "???". Identical input yields
// byte-identical output.
std::string to_json(const crash_data& data);

std::string to_json(const std::vector<app_uuid>& uuids);

// Apple-style plain text rendering of the record.
std::string to_text(const crash_data& data);

//--------------------------------------------------------------------------------------------------

} // namespace crashdata

//--------------------------------------------------------------------------------------------------
