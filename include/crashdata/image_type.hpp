// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <string>
#include <string_view>

//--------------------------------------------------------------------------------------------------

namespace crashdata {

//--------------------------------------------------------------------------------------------------

enum class image_type {
    app_binary, // the main executable of the app
    app_framework, // a framework or library shipped inside the app bundle
    other, // everything else, e.g., system libraries
};

const char* to_string(image_type type);

//--------------------------------------------------------------------------------------------------
// Lexically standardizes `path` the way the platform does: repeated separators, `.` and `..`
// segments and trailing separators are removed, and a leading `/private` is dropped when what
// follows is one of the directories the platform aliases into it (`/var`, `/tmp`, `/etc`).
std::string standardize_path(std::string_view path);

//--------------------------------------------------------------------------------------------------
/*
    Classifies the image at `image_path` relative to the process executable at `process_path`.

    Only images inside an app bundle (a `.app/` segment) can belong to the app. Swift runtime
    dylibs bundled under `Frameworks/libswift*.dylib` are considered `other`, as they never have
    a matching dSYM.

    Standardization of the image path is lossy on some OS versions (it drops a leading `/private`),
    so both the standardized and the raw image path are compared against the process path and the
    bundle root, in that order.
*/
image_type classify_image(std::string_view image_path, std::string_view process_path);

//--------------------------------------------------------------------------------------------------

} // namespace crashdata

//--------------------------------------------------------------------------------------------------
