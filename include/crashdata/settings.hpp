// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <filesystem>
#include <string>

// application
#include "crashdata/features.hpp"

//--------------------------------------------------------------------------------------------------

namespace crashdata {

//--------------------------------------------------------------------------------------------------

struct settings {
    enum class log_level {
        silent, // emit nothing
        warning, // emit anomalies found while formatting
        info, // emit brief, informative status
        verbose, // emit as much as possible
    };

    // The build target the SDK runs on. Selects the argument registers the message-dispatch
    // selector is recovered from.
    enum class target {
        device,
        simulator,
    };

    static settings& instance();

    log_level _log_level{log_level::warning};
    target _target{target::device};
    std::string _home_directory;
};

//--------------------------------------------------------------------------------------------------
// returns true iff the current log level is at least as noisy as the passed-in value.
bool log_level_at_least(settings::log_level);

//--------------------------------------------------------------------------------------------------
// Walks up the directory tree from `start` looking for the first `.crashdata-config` or
// `_crashdata-config` file. Returns an empty path if none is found.
std::filesystem::path find_configuration(const std::filesystem::path& start);

// Populates `settings::instance()` from the TOML file at `config_path`, with each key overridable
// by a `CRASHDATA_<KEY>` environment variable. A missing file leaves the defaults in place. Throws
// `std::runtime_error` if the file exists but cannot be parsed.
void process_configuration(const std::filesystem::path& config_path);

// Restores the default settings. Intended for tests.
void reset_configuration();

//--------------------------------------------------------------------------------------------------

} // namespace crashdata

//--------------------------------------------------------------------------------------------------
