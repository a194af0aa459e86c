// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file effect.h
/// @brief Stock effect capabilities for effectful modification.
///
/// An effect tag E describes a wrapper `E::type<X>` together with:
/// - `E::pure(x)`         lift a plain value
/// - `E::map(fx, f)`      transform the wrapped value
/// - `E::map2(fx, fy, f)` (applicative effects only) combine two wrapped values
///
/// Optics only ever call these in a fixed order (lift on no match,
/// transform then rebuild on match), so any container or future-like type
/// offering the three operations can be plugged in by writing a tag.
///
/// Example:
/// @code
/// auto halve = [](int n) -> std::optional<int> {
///     if (n % 2) return std::nullopt;
///     return n / 2;
/// };
/// std::optional<Shape> r = prism.modify_with_effect<optional_effect>(shape, halve);
/// @endcode

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>

#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace lager_optics {

// ============================================================
// identity_effect - no wrapping, modify_with_effect == modify_with
// ============================================================

struct identity_effect {
    template<typename X>
    using type = X;

    template<typename X>
    static std::decay_t<X> pure(X&& x) {
        return std::forward<X>(x);
    }

    template<typename X, typename Fn>
    static auto map(X&& x, Fn&& fn) {
        return std::invoke(std::forward<Fn>(fn), std::forward<X>(x));
    }

    template<typename X, typename Y, typename Fn>
    static auto map2(X&& x, Y&& y, Fn&& fn) {
        return std::invoke(std::forward<Fn>(fn), std::forward<X>(x), std::forward<Y>(y));
    }
};

// ============================================================
// optional_effect - short-circuits as soon as one step is absent
// ============================================================

struct optional_effect {
    template<typename X>
    using type = std::optional<X>;

    template<typename X>
    static std::optional<std::decay_t<X>> pure(X&& x) {
        return std::optional<std::decay_t<X>>{std::forward<X>(x)};
    }

    template<typename X, typename Fn>
    static auto map(std::optional<X> fx, Fn&& fn)
        -> std::optional<std::decay_t<std::invoke_result_t<Fn, X&&>>> {
        if (!fx) {
            return std::nullopt;
        }
        return std::invoke(std::forward<Fn>(fn), std::move(*fx));
    }

    template<typename X, typename Y, typename Fn>
    static auto map2(std::optional<X> fx, std::optional<Y> fy, Fn&& fn)
        -> std::optional<std::decay_t<std::invoke_result_t<Fn, X&&, Y&&>>> {
        if (!fx || !fy) {
            return std::nullopt;
        }
        return std::invoke(std::forward<Fn>(fn), std::move(*fx), std::move(*fy));
    }
};

// ============================================================
// vector_effect - non-determinism over immer::vector
//
// map2 produces every combination, left operand varying slowest.
// ============================================================

struct vector_effect {
    template<typename X>
    using type = immer::vector<X>;

    template<typename X>
    static immer::vector<std::decay_t<X>> pure(X&& x) {
        return immer::vector<std::decay_t<X>>{}.push_back(std::forward<X>(x));
    }

    template<typename X, typename Fn>
    static auto map(const immer::vector<X>& fx, Fn&& fn) {
        using Y = std::decay_t<std::invoke_result_t<Fn&, const X&>>;
        auto out = immer::vector<Y>{}.transient();
        for (const auto& x : fx) {
            out.push_back(std::invoke(fn, x));
        }
        return out.persistent();
    }

    template<typename X, typename Y, typename Fn>
    static auto map2(const immer::vector<X>& fx, const immer::vector<Y>& fy, Fn&& fn) {
        using Z = std::decay_t<std::invoke_result_t<Fn&, const X&, const Y&>>;
        auto out = immer::vector<Z>{}.transient();
        for (const auto& x : fx) {
            for (const auto& y : fy) {
                out.push_back(std::invoke(fn, x, y));
            }
        }
        return out.persistent();
    }
};

// ============================================================
// const_effect - accumulates a monoid and never rebuilds
//
// Running an effectful modify under const_effect<M> turns it into a
// fold: every focus contributes f(a), absent foci contribute M::empty().
// ============================================================

template<Monoid M>
struct const_effect {
    using value_type = typename M::value_type;

    template<typename X>
    using type = value_type;

    template<typename X>
    static value_type pure(X&&) {
        return M::empty();
    }

    template<typename Fn>
    static value_type map(value_type m, Fn&&) {
        return m;
    }

    template<typename Fn>
    static value_type map2(const value_type& a, const value_type& b, Fn&&) {
        return M::combine(a, b);
    }
};

static_assert(ApplicativeEffect<identity_effect>);
static_assert(ApplicativeEffect<optional_effect>);
static_assert(ApplicativeEffect<vector_effect>);

} // namespace lager_optics
