// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file monoid.h
/// @brief Stock aggregation capabilities for folds.
///
/// A monoid tag exposes `value_type`, `empty()` and `combine(a, b)`.
/// Folds aggregate zero-or-more foci by mapping each into `value_type`
/// and combining left to right, starting from `empty()`.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>

#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <optional>

namespace lager_optics {

/// Addition (or concatenation, for strings)
template<typename T>
struct sum_monoid {
    using value_type = T;
    static T empty() { return T{}; }
    static T combine(const T& a, const T& b) { return a + b; }
};

template<typename T>
struct product_monoid {
    using value_type = T;
    static T empty() { return T{1}; }
    static T combine(const T& a, const T& b) { return a * b; }
};

struct any_monoid {
    using value_type = bool;
    static bool empty() noexcept { return false; }
    static bool combine(bool a, bool b) noexcept { return a || b; }
};

struct all_monoid {
    using value_type = bool;
    static bool empty() noexcept { return true; }
    static bool combine(bool a, bool b) noexcept { return a && b; }
};

/// Keeps the leftmost present value
template<typename T>
struct first_monoid {
    using value_type = std::optional<T>;
    static value_type empty() { return std::nullopt; }
    static value_type combine(const value_type& a, const value_type& b) { return a ? a : b; }
};

/// Keeps the rightmost present value
template<typename T>
struct last_monoid {
    using value_type = std::optional<T>;
    static value_type empty() { return std::nullopt; }
    static value_type combine(const value_type& a, const value_type& b) { return b ? b : a; }
};

/// Collects foci into a persistent vector
template<typename T>
struct vector_monoid {
    using value_type = immer::vector<T>;
    static value_type empty() { return {}; }
    static value_type combine(const value_type& a, const value_type& b) {
        if (a.empty()) return b;
        if (b.empty()) return a;
        auto transient = a.transient();
        for (const auto& x : b) {
            transient.push_back(x);
        }
        return transient.persistent();
    }
};

static_assert(Monoid<sum_monoid<int>>);
static_assert(Monoid<any_monoid>);
static_assert(Monoid<vector_monoid<int>>);

} // namespace lager_optics
