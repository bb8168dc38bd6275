// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "crashdata/crashdata.hpp"

// stdc++
#include <algorithm>

// application
#include "crashdata/architecture.hpp"
#include "crashdata/frame.hpp"
#include "crashdata/image_type.hpp"
#include "crashdata/mach_types.hpp"
#include "crashdata/selector.hpp"
#include "crashdata/str.hpp"
#include "crashdata/tracy.hpp"

/**************************************************************************************************/

namespace crashdata {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/

constexpr std::string_view selector_reason_k = "Selector name found in current argument registers: ";

/**************************************************************************************************/

std::string process_path(const raw_crash_report& report) {
    if (!report._process || !report._process->_process_path) return std::string();
    return *report._process->_process_path;
}

/**************************************************************************************************/

crash_data_headers make_headers(const raw_crash_report& report,
                                const std::string& reporter_key,
                                const std::optional<handled_exception>& exception) {
    crash_data_headers result;

    if (!reporter_key.empty()) result._id = reporter_key;
    if (report._uuid) result._incident_identifier = *report._uuid;

    // Process information was not available in earlier crash report versions
    if (const auto& process = report._process) {
        if (process->_process_name) result._process = *process->_process_name;
        result._process_id = process->_process_id;

        if (process->_process_path && !process->_process_path->empty()) {
            result._application_path =
                anonymize_path(*process->_process_path, settings::instance()._home_directory);
        }

        if (process->_parent_process_name) result._parent_process = *process->_parent_process_name;
        result._parent_process_id = process->_parent_process_id;
    }

    if (report._application._identifier) {
        result._application_identifier = *report._application._identifier;
    }
    if (report._application._version) {
        result._application_build = *report._application._version;
    }

    result._exception_address = format_hex(report._signal._address);
    result._exception_type = exception ? exception->_name : report._signal._name;
    if (exception) result._exception_reason = exception->_reason;
    result._exception_code = report._signal._code;

    if (const thread_info* crashed = report.crashed_thread()) {
        result._crash_thread = crashed->_number;
    }

    return result;
}

/**************************************************************************************************/

std::map<std::string, std::string> format_registers(const thread_info& thread,
                                                    const raw_crash_report& report,
                                                    bool lp64) {
    // Apple's reports call r12 `ip` on ARM.
    bool arm = false;
    if (report._machine && report._machine->_processor.is_mach()) {
        const auto type = static_cast<mach::cpu_type_t>(report._machine->_processor._type);
        arm = (type & ~mach::cpu_arch_mask_k) == mach::cpu_type_arm_k;
    }

    std::map<std::string, std::string> result;

    for (const auto& reg : thread._registers) {
        const std::string_view name = arm && reg._name == "r12" ? std::string_view("ip") :
                                                                 std::string_view(reg._name);
        result[right_align(name, 6)] = format_hex(reg._value, lp64 ? 16 : 8);
    }

    return result;
}

/**************************************************************************************************/

crash_data_thread format_thread(std::int64_t id,
                                const std::vector<stack_frame_info>& frames,
                                const raw_crash_report& report,
                                bool lp64) {
    crash_data_thread result;
    result._id = id;
    result._frames.reserve(frames.size());

    for (std::size_t i = 0; i < frames.size(); ++i) {
        result._frames.push_back(format_stack_frame(frames[i], i, report, lp64));
    }

    return result;
}

/**************************************************************************************************/

std::vector<crash_data_binary> format_binaries(const raw_crash_report& report,
                                               const architecture& arch) {
    ZoneScoped;

    const std::string process = process_path(report);
    const std::string& home = settings::instance()._home_directory;
    const std::size_t width = arch._lp64 ? 18 : 10;
    std::vector<crash_data_binary> result;

    for (const binary_image_info* image : sort_binary_images(report._images)) {
        crash_data_binary binary;

        if (image->_uuid) binary._uuid = *image->_uuid;

        // REVISIT: One architecture is applied to every image, even when a fat install mixes
        // slices of differing architectures.
        binary._cpu_type = arch._cpu_type.value_or(mach::cpu_type_any_k);
        binary._cpu_subtype = image->_code_type ?
                                  static_cast<std::int64_t>(
                                      static_cast<mach::cpu_subtype_t>(image->_code_type->_subtype)) :
                                  mach::cpu_subtype_multiple_k;

        const std::uint64_t last = image->_base_address + (std::max<std::uint64_t>(1, image->_size) - 1);
        binary._start_address = format_hex_field(image->_base_address, width);
        binary._end_address = format_hex_field(last, width);

        binary._path = anonymize_path(image->_path, home);

        const char* designator = classify_image(image->_path, process) == image_type::other ? " " : "+";
        binary._name = designator + last_path_component(image->_path);

        result.push_back(std::move(binary));
    }

    return result;
}

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

std::mutex& ostream_safe_mutex() {
    static std::mutex m;
    return m;
}

/**************************************************************************************************/

std::vector<const binary_image_info*> sort_binary_images(
    const std::vector<binary_image_info>& images) {
    std::vector<const binary_image_info*> result;
    result.reserve(images.size());

    for (const auto& image : images) {
        result.push_back(&image);
    }

    std::sort(result.begin(), result.end(), [](const auto* a, const auto* b) {
        return a->_base_address < b->_base_address;
    });

    return result;
}

/**************************************************************************************************/

crash_data crash_data_for_report(const raw_crash_report& report,
                                 const std::string& reporter_key,
                                 const std::optional<handled_exception>& exception,
                                 const image_table& table) {
    ZoneScoped;

    const architecture arch = resolve_architecture(report);
    const thread_info* crashed = report.crashed_thread();

    crash_data result;
    result._headers = make_headers(report, reporter_key, exception);

    if (report._exception) {
        result._headers._exception_reason = report._exception->_reason;
    } else if (crashed) {
        // No exception object, so this may have been a crash inside a message send. The frame
        // can't be told apart without symbols, so the argument registers are always inspected.
        if (auto selector = recover_selector(table, report, *crashed, arch._lp64)) {
            result._headers._exception_reason = std::string(selector_reason_k) + *selector + "\n";
        }
    }

    if (report._exception && !report._exception->_frames.empty()) {
        result._threads.push_back(format_thread(crash_data_thread::exception_thread_id_k,
                                                report._exception->_frames, report, arch._lp64));
    }

    for (const auto& thread : report._threads) {
        auto formatted = format_thread(thread._number, thread._frames, report, arch._lp64);

        if (&thread == crashed && !formatted._frames.empty()) {
            formatted._frames.front()._registers = format_registers(thread, report, arch._lp64);
        }

        result._threads.push_back(std::move(formatted));
    }

    result._binaries = format_binaries(report, arch);

    if (log_level_at_least(settings::log_level::info)) {
        cout_safe([&](auto& s) {
            s << "info: formatted crash report: " << result._threads.size() << " thread(s), "
              << result._binaries.size() << " image(s)\n";
        });
    }

    return result;
}

/**************************************************************************************************/

std::vector<app_uuid> app_uuids_for_report(const raw_crash_report& report) {
    const std::string process = process_path(report);
    std::vector<app_uuid> result;

    for (const binary_image_info* image : sort_binary_images(report._images)) {
        const image_type type = classify_image(image->_path, process);

        if (type == image_type::other) continue;

        result.push_back(app_uuid{image->_uuid.value_or(unknown_k), arch_name(*image),
                                  to_string(type)});
    }

    return result;
}

/**************************************************************************************************/

} // namespace crashdata

/**************************************************************************************************/
