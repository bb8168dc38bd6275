// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "crashdata/crash_data.hpp"

// stdc++
#include <iomanip>
#include <map>
#include <optional>
#include <sstream>
#include <type_traits>

// toml++
#include <toml++/toml.h>

// application
#include "crashdata/str.hpp"

/**************************************************************************************************/

namespace crashdata {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/
// Absent values render as the unknown sentinel, so every record has the same set of keys.

template <class T>
void insert_optional(toml::table& table, std::string_view key, const std::optional<T>& value) {
    if (value) {
        if constexpr (std::is_integral_v<T>) {
            table.insert_or_assign(key, static_cast<std::int64_t>(*value));
        } else {
            table.insert_or_assign(key, *value);
        }
    } else {
        table.insert_or_assign(key, unknown_k);
    }
}

/**************************************************************************************************/

toml::table to_table(const crash_data_headers& headers) {
    toml::table result;

    result.insert_or_assign("id", headers._id);
    result.insert_or_assign("incident_identifier", headers._incident_identifier);
    result.insert_or_assign("process", headers._process);
    insert_optional(result, "process_id", headers._process_id);
    result.insert_or_assign("parent_process", headers._parent_process);
    insert_optional(result, "parent_process_id", headers._parent_process_id);
    result.insert_or_assign("application_identifier", headers._application_identifier);
    result.insert_or_assign("application_build", headers._application_build);
    result.insert_or_assign("application_path", headers._application_path);
    insert_optional(result, "crash_thread", headers._crash_thread);
    result.insert_or_assign("exception_address", headers._exception_address);
    result.insert_or_assign("exception_type", headers._exception_type);
    insert_optional(result, "exception_reason", headers._exception_reason);
    result.insert_or_assign("exception_code", headers._exception_code);

    return result;
}

/**************************************************************************************************/

toml::table to_table(const crash_data_thread_frame& frame) {
    toml::table result;

    result.insert_or_assign("address", frame._address);
    result.insert_or_assign("symbol", frame._symbol);

    if (!frame._registers.empty()) {
        toml::table registers;
        for (const auto& [name, value] : frame._registers) {
            registers.insert_or_assign(name, value);
        }
        result.insert_or_assign("registers", std::move(registers));
    }

    return result;
}

/**************************************************************************************************/

toml::table to_table(const crash_data_thread& thread) {
    toml::array frames;
    for (const auto& frame : thread._frames) {
        frames.push_back(to_table(frame));
    }

    toml::table result;
    result.insert_or_assign("id", thread._id);
    result.insert_or_assign("frames", std::move(frames));
    return result;
}

/**************************************************************************************************/

toml::table to_table(const crash_data_binary& binary) {
    toml::table result;

    result.insert_or_assign("uuid", binary._uuid);
    result.insert_or_assign("cpu_type", binary._cpu_type);
    result.insert_or_assign("cpu_subtype", binary._cpu_subtype);
    result.insert_or_assign("start_address", binary._start_address);
    result.insert_or_assign("end_address", binary._end_address);
    result.insert_or_assign("path", binary._path);
    result.insert_or_assign("name", binary._name);

    return result;
}

/**************************************************************************************************/

std::string emit(const toml::table& table) {
    std::ostringstream result;
    result << toml::json_formatter{table};
    return result.str();
}

/**************************************************************************************************/

const char* register_family(const std::map<std::string, std::string>& registers) {
    for (const char* name : {"rip", "eip"}) {
        if (registers.count(right_align(name, 6))) return "X86";
    }
    return "ARM";
}

/**************************************************************************************************/

void write_registers(std::ostream& s,
                     std::int64_t thread_id,
                     const std::map<std::string, std::string>& registers) {
    s << "Thread " << thread_id << " crashed with " << register_family(registers)
      << " Thread State:\n";

    std::size_t column = 0;
    for (const auto& [name, value] : registers) {
        s << (column ? " " : "") << name << ": " << value;
        if (++column == 4) {
            s << '\n';
            column = 0;
        }
    }

    if (column) s << '\n';
    s << '\n';
}

/**************************************************************************************************/

template <class T>
void write_id(std::ostream& s, const std::optional<T>& id) {
    if (id) s << " [" << *id << "]";
}

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

std::string to_json(const crash_data& data) {
    toml::array threads;
    for (const auto& thread : data._threads) {
        threads.push_back(to_table(thread));
    }

    toml::array binaries;
    for (const auto& binary : data._binaries) {
        binaries.push_back(to_table(binary));
    }

    toml::table root;
    root.insert_or_assign("headers", to_table(data._headers));
    root.insert_or_assign("threads", std::move(threads));
    root.insert_or_assign("binaries", std::move(binaries));

    return emit(root);
}

/**************************************************************************************************/

std::string to_json(const std::vector<app_uuid>& uuids) {
    toml::array images;

    for (const auto& uuid : uuids) {
        images.push_back(toml::table{
            {"uuid", uuid._uuid},
            {"arch", uuid._arch},
            {"type", uuid._type},
        });
    }

    toml::table root;
    root.insert_or_assign("images", std::move(images));
    return emit(root);
}

/**************************************************************************************************/

std::string to_text(const crash_data& data) {
    const crash_data_headers& headers = data._headers;
    std::ostringstream s;

    s << "Incident Identifier: " << headers._incident_identifier << '\n';
    s << "CrashReporter Key:   " << headers._id << '\n';
    s << "Process:             " << headers._process;
    write_id(s, headers._process_id);
    s << '\n';
    s << "Path:                " << headers._application_path << '\n';
    s << "Identifier:          " << headers._application_identifier << '\n';
    s << "Version:             " << headers._application_build << '\n';
    s << "Parent Process:      " << headers._parent_process;
    write_id(s, headers._parent_process_id);
    s << "\n\n";

    s << "Exception Type:  " << headers._exception_type << '\n';
    s << "Exception Codes: " << headers._exception_code << " at " << headers._exception_address
      << '\n';
    if (headers._crash_thread) {
        s << "Crashed Thread:  " << *headers._crash_thread << '\n';
    }
    s << '\n';

    if (headers._exception_reason) {
        s << "Application Specific Information:\n" << *headers._exception_reason;
        if (headers._exception_reason->empty() || headers._exception_reason->back() != '\n') {
            s << '\n';
        }
        s << '\n';
    }

    const crash_data_thread* crashed = nullptr;

    for (const auto& thread : data._threads) {
        if (thread._id == crash_data_thread::exception_thread_id_k) {
            s << "Last Exception Backtrace:\n";
        } else if (headers._crash_thread && thread._id == *headers._crash_thread) {
            s << "Thread " << thread._id << " Crashed:\n";
            if (!crashed) crashed = &thread;
        } else {
            s << "Thread " << thread._id << ":\n";
        }

        for (std::size_t i = 0; i < thread._frames.size(); ++i) {
            const auto& frame = thread._frames[i];
            s << std::left << std::setw(4) << i << std::right << frame._image << frame._address
              << ' ' << frame._symbol << '\n';
        }

        s << '\n';
    }

    if (crashed && !crashed->_frames.empty() && !crashed->_frames.front()._registers.empty()) {
        write_registers(s, crashed->_id, crashed->_frames.front()._registers);
    }

    s << "Binary Images:\n";
    for (const auto& binary : data._binaries) {
        s << binary._start_address << " - " << binary._end_address << ' ' << binary._name << ' '
          << binary._uuid << ' ' << binary._path << '\n';
    }

    return s.str();
}

/**************************************************************************************************/

} // namespace crashdata

/**************************************************************************************************/
