// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// stdc++
#include <algorithm>
#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

// toml++
#include <toml++/toml.h>

// crashdata
#include <crashdata/crashdata.hpp>
#include <crashdata/settings.hpp>

// Google Test
#include <gtest/gtest.h>

//--------------------------------------------------------------------------------------------------

using namespace crashdata;

//--------------------------------------------------------------------------------------------------

namespace {

//--------------------------------------------------------------------------------------------------

void assume(bool condition, std::string message) {
    if (condition) return;
    throw std::runtime_error(message);
}

//--------------------------------------------------------------------------------------------------
// Battery reports never have their images loaded into the test process.
class no_images : public image_table {
public:
    std::uint32_t count() const override { return 0; }
    std::optional<loaded_image> image(std::uint32_t) const override { return std::nullopt; }
};

//--------------------------------------------------------------------------------------------------

template <class T>
T require(const toml::node_view<const toml::node>& node, const char* key) {
    auto result = node[key].value<T>();
    assume(result.has_value(), std::string("missing or mistyped key `") + key + "`");
    return *result;
}

std::uint64_t address(const toml::node_view<const toml::node>& node, const char* key) {
    return static_cast<std::uint64_t>(node[key].value_or<std::int64_t>(0));
}

//--------------------------------------------------------------------------------------------------

architecture_kind derive_architecture(const std::string& name) {
    static const std::unordered_map<std::string, architecture_kind> map_k = {
        {"x86_32", architecture_kind::x86_32}, {"x86_64", architecture_kind::x86_64},
        {"armv6", architecture_kind::armv6},   {"armv7", architecture_kind::armv7},
        {"ppc", architecture_kind::ppc},       {"ppc64", architecture_kind::ppc64},
    };
    auto found = map_k.find(name);
    return found == map_k.end() ? architecture_kind::unknown : found->second;
}

operating_system derive_operating_system(const std::string& name) {
    if (name == "mac_os_x") return operating_system::mac_os_x;
    if (name == "iphone_os") return operating_system::iphone_os;
    if (name == "iphone_simulator") return operating_system::iphone_simulator;
    return operating_system::unknown;
}

processor_info derive_processor(const toml::node_view<const toml::node>& node) {
    processor_info result;
    result._encoding = processor_info::encoding::mach;
    result._type = static_cast<std::uint64_t>(require<std::int64_t>(node, "cpu_type"));
    result._subtype = static_cast<std::uint64_t>(node["cpu_subtype"].value_or<std::int64_t>(0));
    return result;
}

//--------------------------------------------------------------------------------------------------

std::vector<stack_frame_info> derive_frames(const toml::node_view<const toml::node>& node) {
    std::vector<stack_frame_info> result;
    const toml::array* frames = node.as_array();
    if (!frames) return result;

    for (const toml::node& entry : *frames) {
        toml::node_view<const toml::node> frame{&entry};
        stack_frame_info info;
        info._instruction_pointer = address(frame, "pc");
        if (auto symbol = frame["symbol"].value<std::string>()) {
            info._symbol = symbol_info{*symbol, address(frame, "symbol_start")};
        }
        result.push_back(std::move(info));
    }

    return result;
}

//--------------------------------------------------------------------------------------------------

raw_crash_report derive_report(const toml::table& settings) {
    auto node = settings["report"];
    assume(node.is_table(), "missing [report] table");

    raw_crash_report result;

    result._system._architecture =
        derive_architecture(node["architecture"].value_or(std::string()));
    result._system._operating_system =
        derive_operating_system(node["operating_system"].value_or(std::string()));
    result._uuid = node["uuid"].value<std::string>();

    if (node["processor"].is_table()) {
        result._machine = machine_info{derive_processor(node["processor"])};
    }

    if (auto process = node["process"]; process.is_table()) {
        process_info info;
        info._process_name = process["name"].value<std::string>();
        info._process_id = address(process, "id");
        info._process_path = process["path"].value<std::string>();
        info._parent_process_name = process["parent_name"].value<std::string>();
        info._parent_process_id = address(process, "parent_id");
        result._process = std::move(info);
    }

    result._application._identifier = node["application"]["identifier"].value<std::string>();
    result._application._version = node["application"]["version"].value<std::string>();

    result._signal._name = node["signal"]["name"].value_or(std::string());
    result._signal._code = node["signal"]["code"].value_or(std::string());
    result._signal._address = address(node["signal"], "address");

    if (auto exception = node["exception"]; exception.is_table()) {
        result._exception = exception_info{require<std::string>(exception, "name"),
                                           require<std::string>(exception, "reason"),
                                           derive_frames(exception["frames"])};
    }

    if (const toml::array* threads = node["threads"].as_array()) {
        for (const toml::node& entry : *threads) {
            toml::node_view<const toml::node> thread{&entry};
            thread_info info;
            info._number = require<std::int64_t>(thread, "number");
            info._crashed = thread["crashed"].value_or(false);
            info._frames = derive_frames(thread["frames"]);
            if (const toml::table* registers = thread["registers"].as_table()) {
                for (auto&& [name, value] : *registers) {
                    info._registers.push_back(register_info{
                        std::string(name.str()),
                        static_cast<std::uint64_t>(value.value_or<std::int64_t>(0))});
                }
            }
            result._threads.push_back(std::move(info));
        }
    }

    if (const toml::array* images = node["images"].as_array()) {
        for (const toml::node& entry : *images) {
            toml::node_view<const toml::node> image{&entry};
            binary_image_info info;
            info._path = require<std::string>(image, "path");
            info._uuid = image["uuid"].value<std::string>();
            info._base_address = address(image, "base");
            info._size = address(image, "size");
            if (image["cpu_type"]) info._code_type = derive_processor(image);
            result._images.push_back(std::move(info));
        }
    }

    return result;
}

//--------------------------------------------------------------------------------------------------

std::optional<std::string> header_field(const crash_data_headers& headers, const std::string& key) {
    const auto number = [](const auto& x) -> std::string {
        return x ? std::to_string(*x) : std::string(unknown_k);
    };

    // clang-format off
    if (key == "id") return headers._id;
    if (key == "incident_identifier") return headers._incident_identifier;
    if (key == "process") return headers._process;
    if (key == "process_id") return number(headers._process_id);
    if (key == "parent_process") return headers._parent_process;
    if (key == "parent_process_id") return number(headers._parent_process_id);
    if (key == "application_identifier") return headers._application_identifier;
    if (key == "application_build") return headers._application_build;
    if (key == "application_path") return headers._application_path;
    if (key == "crash_thread") return number(headers._crash_thread);
    if (key == "exception_address") return headers._exception_address;
    if (key == "exception_type") return headers._exception_type;
    if (key == "exception_reason") return headers._exception_reason.value_or(unknown_k);
    if (key == "exception_code") return headers._exception_code;
    // clang-format on

    return std::nullopt;
}

//--------------------------------------------------------------------------------------------------

void validate_headers(const crash_data& data, const toml::node_view<const toml::node>& expected) {
    const toml::table* table = expected.as_table();
    if (!table) return;

    for (auto&& [key, value] : *table) {
        const std::string name(key.str());
        auto actual = header_field(data._headers, name);
        assume(actual.has_value(), "unknown header `" + name + "`");
        EXPECT_EQ(value.value_or(std::string()), *actual) << "header `" << name << "`";
    }
}

//--------------------------------------------------------------------------------------------------

void validate_frames(const crash_data& data, const toml::node_view<const toml::node>& expected) {
    const toml::array* frames = expected.as_array();
    if (!frames) return;

    for (const toml::node& entry : *frames) {
        toml::node_view<const toml::node> frame{&entry};
        const auto thread = static_cast<std::size_t>(require<std::int64_t>(frame, "thread"));
        const auto index = static_cast<std::size_t>(require<std::int64_t>(frame, "frame"));

        ASSERT_LT(thread, data._threads.size());
        ASSERT_LT(index, data._threads[thread]._frames.size());

        const crash_data_thread_frame& actual = data._threads[thread]._frames[index];

        if (auto id = frame["thread_id"].value<std::int64_t>()) {
            EXPECT_EQ(*id, data._threads[thread]._id);
        }
        if (auto address = frame["address"].value<std::string>()) {
            EXPECT_EQ(*address, actual._address);
        }
        if (auto symbol = frame["symbol"].value<std::string>()) {
            EXPECT_EQ(*symbol, actual._symbol);
        }
    }
}

//--------------------------------------------------------------------------------------------------

void validate_registers(const crash_data& data, const toml::node_view<const toml::node>& expected) {
    const toml::table* table = expected.as_table();
    if (!table) return;

    std::map<std::string, std::string> registers;
    std::size_t holders = 0;

    for (const auto& thread : data._threads) {
        for (const auto& frame : thread._frames) {
            if (frame._registers.empty()) continue;
            registers = frame._registers;
            ++holders;
        }
    }

    EXPECT_EQ(holders, 1u) << "register map count";

    for (auto&& [key, value] : *table) {
        // The battery names registers unpadded.
        const std::string name(key.str());
        const std::string padded = std::string(name.size() < 6 ? 6 - name.size() : 0, ' ') + name;
        auto found = registers.find(padded);
        ASSERT_NE(found, registers.end()) << "register `" << name << "`";
        EXPECT_EQ(value.value_or(std::string()), found->second) << "register `" << name << "`";
    }
}

//--------------------------------------------------------------------------------------------------

void validate_binaries(const crash_data& data, const toml::node_view<const toml::node>& expected) {
    const toml::array* binaries = expected.as_array();
    if (!binaries) return;

    ASSERT_EQ(binaries->size(), data._binaries.size());

    for (std::size_t i = 0; i < binaries->size(); ++i) {
        toml::node_view<const toml::node> binary{binaries->get(i)};
        const crash_data_binary& actual = data._binaries[i];

        if (auto name = binary["name"].value<std::string>()) EXPECT_EQ(*name, actual._name);
        if (auto path = binary["path"].value<std::string>()) EXPECT_EQ(*path, actual._path);
        if (auto uuid = binary["uuid"].value<std::string>()) EXPECT_EQ(*uuid, actual._uuid);
        if (auto start = binary["start"].value<std::string>()) {
            EXPECT_EQ(*start, actual._start_address);
        }
        if (auto end = binary["end"].value<std::string>()) EXPECT_EQ(*end, actual._end_address);
        if (auto type = binary["cpu_type"].value<std::int64_t>()) {
            EXPECT_EQ(*type, actual._cpu_type);
        }
        if (auto subtype = binary["cpu_subtype"].value<std::int64_t>()) {
            EXPECT_EQ(*subtype, actual._cpu_subtype);
        }
    }
}

//--------------------------------------------------------------------------------------------------

void validate_app_uuids(const raw_crash_report& report,
                        const toml::node_view<const toml::node>& expected) {
    const toml::array* uuids = expected.as_array();
    if (!uuids) return;

    const std::vector<app_uuid> actual = app_uuids_for_report(report);
    ASSERT_EQ(uuids->size(), actual.size());

    for (std::size_t i = 0; i < uuids->size(); ++i) {
        toml::node_view<const toml::node> uuid{uuids->get(i)};
        EXPECT_EQ(require<std::string>(uuid, "uuid"), actual[i]._uuid);
        EXPECT_EQ(require<std::string>(uuid, "arch"), actual[i]._arch);
        EXPECT_EQ(require<std::string>(uuid, "type"), actual[i]._type);
    }
}

//--------------------------------------------------------------------------------------------------

void apply_settings(const toml::node_view<const toml::node>& node) {
    auto& app_settings = settings::instance();

    app_settings._log_level = settings::log_level::silent;

    if (auto home = node["home_directory"].value<std::string>()) {
        app_settings._home_directory = *home;
    }

    if (auto target = node["target"].value<std::string>()) {
        app_settings._target =
            *target == "simulator" ? settings::target::simulator : settings::target::device;
    }
}

//--------------------------------------------------------------------------------------------------

constexpr const char* tomlname_k = "crash_test.toml";

//--------------------------------------------------------------------------------------------------
/**
 * @brief Test fixture for one battery case
 *
 * Each case directory holds a `crash_test.toml` describing a raw crash report, any settings
 * overrides, and the fields the resulting crash data is expected to have. Only the fields named
 * in the `[expected]` table are checked.
 */
class crashdata_test_instance : public ::testing::Test {
    std::filesystem::path _path;

public:
    explicit crashdata_test_instance(std::filesystem::path&& path) : _path(std::move(path)) {}

protected:
    void SetUp() override { reset_configuration(); }

    void TearDown() override { reset_configuration(); }

    void TestBody() override;
};

//--------------------------------------------------------------------------------------------------

void crashdata_test_instance::TestBody() {
    std::filesystem::path tomlpath = _path / tomlname_k;
    assume(std::filesystem::is_regular_file(tomlpath),
           "\"" + tomlpath.string() + "\" is not a regular file");
    toml::table parsed;

    try {
        parsed = toml::parse_file(tomlpath.string());
    } catch (const toml::parse_error& error) {
        std::cerr << error << '\n';
        throw std::runtime_error("battery file parsing error");
    }

    const toml::table& settings = parsed;

    if (settings["crash_test_flags"]["disable"].value_or(false)) {
        GTEST_SKIP() << "Test disabled in configuration";
    }

    apply_settings(settings["settings"]);

    const raw_crash_report report = derive_report(settings);
    const std::string reporter_key = settings["reporter_key"].value_or(std::string());
    std::optional<handled_exception> exception;

    if (auto handled = settings["handled_exception"]; handled.is_table()) {
        exception = handled_exception{require<std::string>(handled, "name"),
                                      require<std::string>(handled, "reason")};
    }

    const crash_data data = crash_data_for_report(report, reporter_key, exception, no_images());
    auto expected = settings["expected"];

    if (auto count = expected["thread_count"].value<std::int64_t>()) {
        EXPECT_EQ(static_cast<std::size_t>(*count), data._threads.size());
    }

    validate_headers(data, expected["headers"]);
    validate_frames(data, expected["frames"]);
    validate_registers(data, expected["registers"]);
    validate_binaries(data, expected["binaries"]);
    validate_app_uuids(report, expected["app_uuids"]);

    // Formatting is a pure function of its input.
    EXPECT_EQ(to_json(data), to_json(crash_data_for_report(report, reporter_key, exception,
                                                           no_images())));
}

//--------------------------------------------------------------------------------------------------

void create_test(const std::filesystem::path& home) {
    std::string test_name = home.stem().string();
    std::replace(test_name.begin(), test_name.end(), '-', '_');

    ::testing::RegisterTest("crashdata_battery", test_name.c_str(), nullptr, nullptr, __FILE__,
                            __LINE__, [_home = home]() mutable -> ::testing::Test* {
                                return new crashdata_test_instance(std::move(_home));
                            });
}

//--------------------------------------------------------------------------------------------------
// Registers a test for every directory under `directory` (inclusive) with a battery file.
void traverse_directory_tree(const std::filesystem::path& directory) {
    if (exists(directory / tomlname_k)) {
        create_test(directory);
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        if (is_directory(entry)) {
            traverse_directory_tree(entry.path());
        }
    }
}

//--------------------------------------------------------------------------------------------------

} // namespace

//--------------------------------------------------------------------------------------------------

int main(int argc, char** argv) try {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " /path/to/test/battery/\n";
        throw std::runtime_error("no path to test battery given");
    }

    std::filesystem::path battery_path{argv[1]};

    if (!exists(battery_path) || !is_directory(battery_path)) {
        throw std::runtime_error("test battery path is missing or not a directory");
    }

    traverse_directory_tree(battery_path);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
} catch (const std::exception& error) {
    std::cerr << "Fatal error: " << error.what() << '\n';
    return EXIT_FAILURE;
}

//--------------------------------------------------------------------------------------------------
