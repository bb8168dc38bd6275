// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "crashdata/settings.hpp"

// stdc++
#include <cstdlib>
#include <stdexcept>

// toml++
#include <toml++/toml.h>

// application
#include "crashdata/crashdata.hpp" // for cerr_safe
#include "crashdata/str.hpp"

/**************************************************************************************************/

namespace crashdata {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/

template <typename T>
T parse_enval(std::string&&) = delete;

template <>
std::string parse_enval(std::string&& x) {
    return x;
}

template <>
bool parse_enval(std::string&& x) {
    return !x.empty() && x != "0" && toupper(std::move(x)) != "FALSE";
}

template <typename T>
T derive_configuration(const char* key, const toml::table& settings, T&& fallback) {
    T result = settings[key].value_or(fallback);
    std::string envar = toupper(std::string("CRASHDATA_") + key);
    if (const char* enval = std::getenv(envar.c_str())) {
        result = parse_enval<T>(enval);
    }
    return result;
}

/**************************************************************************************************/

std::string default_home_directory() {
    if (const char* home = std::getenv("HOME")) return home;
    return std::string();
}

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

settings& settings::instance() {
    static settings instance;
    static bool initialized_s = [] {
        instance._home_directory = default_home_directory();
        return true;
    }();
    (void)initialized_s;
    return instance;
}

/**************************************************************************************************/

bool log_level_at_least(settings::log_level level) {
    using value_type = std::underlying_type_t<settings::log_level>;
    return static_cast<value_type>(settings::instance()._log_level) >=
           static_cast<value_type>(level);
}

/**************************************************************************************************/

std::filesystem::path find_configuration(const std::filesystem::path& start) {
    std::filesystem::path directory = std::filesystem::absolute(start);

    // run up the directories looking for the first instance of .crashdata-config or
    // _crashdata-config
    while (true) {
        std::filesystem::path candidate = directory / ".crashdata-config";

        if (exists(candidate)) return candidate;

        candidate = directory / "_crashdata-config";

        if (exists(candidate)) return candidate;

        std::filesystem::path parent = directory.parent_path();

        if (parent == directory) break;

        directory = std::move(parent);
    }

    return std::filesystem::path();
}

/**************************************************************************************************/

void process_configuration(const std::filesystem::path& config_path) {
    toml::table settings;

    if (!config_path.empty() && exists(config_path)) {
        try {
            settings = toml::parse_file(config_path.string());
        } catch (const toml::parse_error& err) {
            cerr_safe([&](auto& s) { s << "Parsing failed:\n" << err << "\n"; });
            throw std::runtime_error("configuration parsing error");
        }
    }

    auto& app_settings = settings::instance();

    app_settings._home_directory =
        derive_configuration("home_directory", settings, default_home_directory());

    const std::string log_level =
        derive_configuration("log_level", settings, std::string("warning"));
    const std::string target = derive_configuration("target", settings, std::string("device"));

    if (log_level == "silent") {
        app_settings._log_level = settings::log_level::silent;
    } else if (log_level == "warning") {
        app_settings._log_level = settings::log_level::warning;
    } else if (log_level == "info") {
        app_settings._log_level = settings::log_level::info;
    } else if (log_level == "verbose") {
        app_settings._log_level = settings::log_level::verbose;
    } else {
        // not a known value. Switch to verbose!
        app_settings._log_level = settings::log_level::verbose;
        cerr_safe([&](auto& s) {
            s << "warning: unknown log_level '" << log_level << "'; using verbose\n";
        });
    }

    if (target == "device") {
        app_settings._target = settings::target::device;
    } else if (target == "simulator") {
        app_settings._target = settings::target::simulator;
    } else {
        app_settings._target = settings::target::device;
        if (log_level_at_least(settings::log_level::warning)) {
            cerr_safe([&](auto& s) {
                s << "warning: unknown target '" << target << "'; using device\n";
            });
        }
    }

    if (log_level_at_least(settings::log_level::info)) {
        cout_safe([&](auto& s) {
            s << "info: crashdata config file: "
              << (config_path.empty() ? std::string("not found") : config_path.string()) << "\n";
        });
    }
}

/**************************************************************************************************/

void reset_configuration() {
    settings::instance() = settings();
    settings::instance()._home_directory = default_home_directory();
}

/**************************************************************************************************/

} // namespace crashdata

/**************************************************************************************************/
