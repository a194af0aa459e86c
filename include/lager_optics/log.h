// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief stderr diagnostics, compiled out unless LAGER_OPTICS_VERBOSE_LOG is set.

#pragma once

#include <lager_optics/lager_optics_config.h>

#include <cstddef>
#include <iostream>
#include <source_location>
#include <string_view>

namespace lager_optics {

namespace detail {

inline void log_diagnostic(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if LAGER_OPTICS_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_law_violation(
    std::string_view func,
    std::string_view law,
    std::size_t sample_index,
    std::string_view detail) noexcept
{
#if LAGER_OPTICS_VERBOSE_LOG
    std::cerr << "[" << func << "] law '" << law << "' violated at sample "
              << sample_index << ": " << detail << "\n";
#else
    (void)func;
    (void)law;
    (void)sample_index;
    (void)detail;
#endif
}

} // namespace detail

} // namespace lager_optics
