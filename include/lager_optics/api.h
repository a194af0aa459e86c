// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file api.h
/// @brief Cross-platform export/import macros for the compiled part of lager_optics.
///
/// Most of lager_optics is header-only templates. The few non-template
/// functions (optic kind names, law report formatting) live in the
/// lager_optics library target and are marked with LAGER_OPTICS_API.
///
/// - Building as a SHARED library: CMake defines LAGER_OPTICS_EXPORTS
///   (private) and LAGER_OPTICS_SHARED (public).
/// - Building/using as a STATIC library: LAGER_OPTICS_API expands to nothing.

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #ifdef LAGER_OPTICS_SHARED
        #ifdef LAGER_OPTICS_EXPORTS
            #define LAGER_OPTICS_API __declspec(dllexport)
        #else
            #define LAGER_OPTICS_API __declspec(dllimport)
        #endif
    #else
        #define LAGER_OPTICS_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(LAGER_OPTICS_SHARED) && defined(LAGER_OPTICS_EXPORTS)
        #define LAGER_OPTICS_API __attribute__((visibility("default")))
    #else
        #define LAGER_OPTICS_API
    #endif
#else
    #define LAGER_OPTICS_API
#endif

/// Mark a class for export
#define LAGER_OPTICS_CLASS LAGER_OPTICS_API
