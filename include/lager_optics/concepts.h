// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for the capabilities lager_optics consumes.
///
/// Optics never depend on a concrete effect or aggregation type. They ask
/// for the smallest capability that implements the operation:
/// - Effect:            lift a plain value, transform a wrapped value
/// - ApplicativeEffect: Effect plus combining two wrapped values
/// - Monoid:            identity element plus associative combine
///
/// @note Requires C++20 or later.

#pragma once

#include <lager_optics/lager_optics_config.h>

#include <concepts>
#include <functional>
#include <type_traits>

namespace lager_optics {

namespace detail {

// Callables used only to probe capability signatures
struct probe_unary {
    template<typename X>
    X operator()(X x) const { return x; }
};

struct probe_binary {
    template<typename X, typename Y>
    X operator()(X x, Y) const { return x; }
};

} // namespace detail

// ============================================================
// Effect Concepts
// ============================================================

/// Concept for an effect tag: `E::type<X>` is the wrapped form of X,
/// `E::pure(x)` lifts a value and `E::map(fx, f)` transforms a wrapped value.
template<typename E>
concept Effect = requires(int x, typename E::template type<int> fx) {
    { E::pure(x) } -> std::convertible_to<typename E::template type<int>>;
    { E::map(fx, detail::probe_unary{}) } -> std::convertible_to<typename E::template type<int>>;
};

/// Concept for an effect that can also sequence two wrapped values.
/// Required wherever more than one focus is visited.
template<typename E>
concept ApplicativeEffect = Effect<E> &&
    requires(typename E::template type<int> fx, typename E::template type<long> fy) {
        { E::map2(fx, fy, detail::probe_binary{}) } -> std::convertible_to<typename E::template type<int>>;
    };

/// Wrapped form of X under effect E
template<typename E, typename X>
using effect_t = typename E::template type<X>;

// ============================================================
// Aggregation Concepts
// ============================================================

/// Concept for a monoid tag with an identity element and a combine operation
template<typename M>
concept Monoid = requires(const typename M::value_type& a, const typename M::value_type& b) {
    typename M::value_type;
    { M::empty() } -> std::convertible_to<typename M::value_type>;
    { M::combine(a, b) } -> std::convertible_to<typename M::value_type>;
};

// ============================================================
// Callable Concepts
// ============================================================

/// Concept for update functions that turn a focus A into a replacement B
template<typename Fn, typename A, typename B>
concept FocusTransformer = std::invocable<Fn, A> &&
                           std::convertible_to<std::invoke_result_t<Fn, A>, B>;

/// Concept for predicate functions on foci
template<typename Fn, typename A>
concept FocusPredicate = std::invocable<Fn, const A&> &&
                         std::convertible_to<std::invoke_result_t<Fn, const A&>, bool>;

/// Concept for equality comparators used by the law checker
template<typename Eq, typename X>
concept EqualityComparator = std::invocable<Eq, const X&, const X&> &&
                             std::convertible_to<std::invoke_result_t<Eq, const X&, const X&>, bool>;

} // namespace lager_optics
