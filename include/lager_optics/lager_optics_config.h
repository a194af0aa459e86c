// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lager_optics_config.h
/// @brief Centralized configuration for lager_optics and its dependencies
///
/// This file defines the compile-time configuration for lager_optics and
/// the third-party libraries it builds on:
///   - immer: persistent vectors used by folds and traversals
///   - zug: function composition
///   - lager: lens interoperability
///
/// It MUST be included before any library headers to ensure consistent settings.
/// All lager_optics public headers already include this file first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(LAGER_OPTICS_CONFIGURED)
#error "immer headers were included before lager_optics/lager_optics_config.h. " \
       "Please include lager_optics headers before any direct immer includes."
#endif

#define LAGER_OPTICS_CONFIGURED 1

// ============================================================
// Diagnostics
// ============================================================

/// @brief Log diagnostics (law violations) to stderr
///
/// Enabled by default in debug builds, disabled with NDEBUG.
/// To explicitly enable: #define LAGER_OPTICS_VERBOSE_LOG 1
/// To explicitly disable: #define LAGER_OPTICS_VERBOSE_LOG 0
#ifndef LAGER_OPTICS_VERBOSE_LOG
#  if defined(NDEBUG)
#    define LAGER_OPTICS_VERBOSE_LOG 0
#  else
#    define LAGER_OPTICS_VERBOSE_LOG 1
#  endif
#endif

/// @brief Maximum number of violations a LawReport records
///
/// Checking continues past the limit (LawReport::checked keeps counting),
/// only the stored violation list is capped.
#ifndef LAGER_OPTICS_LAW_REPORT_LIMIT
#define LAGER_OPTICS_LAW_REPORT_LIMIT 16
#endif

// ============================================================
// Immer Debug Settings (all disabled)
// ============================================================

// Thread safety stays enabled: optic results may be handed to effects
// that resolve on other threads.

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Zug Library Configuration
// ============================================================

/// @brief Force zug to use std::variant instead of boost::variant
#ifndef ZUG_VARIANT_STD
#define ZUG_VARIANT_STD 1
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef LAGER_OPTICS_CONFIG_VERBOSE
#if LAGER_OPTICS_VERBOSE_LOG
#pragma message("lager_optics: verbose diagnostics ENABLED")
#else
#pragma message("lager_optics: verbose diagnostics DISABLED")
#endif
#endif // LAGER_OPTICS_CONFIG_VERBOSE
