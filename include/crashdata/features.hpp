// Copyright 2025 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

//--------------------------------------------------------------------------------------------------

#define CRASHDATA_FEATURE(X) (CRASHDATA_PRIVATE_FEATURE_ ## X())

#ifndef NDEBUG
    #define CRASHDATA_PRIVATE_FEATURE_DEBUG() 1
    #define CRASHDATA_PRIVATE_FEATURE_RELEASE() 0
#else
    #define CRASHDATA_PRIVATE_FEATURE_DEBUG() 0
    #define CRASHDATA_PRIVATE_FEATURE_RELEASE() 1
#endif // !defined(NDEBUG)

#if defined(TRACY_ENABLE)
    #define CRASHDATA_PRIVATE_FEATURE_TRACY() 1
#else
    #define CRASHDATA_PRIVATE_FEATURE_TRACY() 0
#endif

// The live image table is backed by dyld, so it only exists on Apple platforms.
#if defined(__APPLE__)
    #define CRASHDATA_PRIVATE_FEATURE_DYLD() 1
#else
    #define CRASHDATA_PRIVATE_FEATURE_DYLD() 0
#endif

//--------------------------------------------------------------------------------------------------
