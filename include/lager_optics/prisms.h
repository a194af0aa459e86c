// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file prisms.h
/// @brief Ready-made prisms for standard library sum types.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/prism.h>

#include <zug/compose.hpp>

#include <optional>
#include <utility>
#include <variant>

namespace lager_optics {

/// Always matches, reconstructs with the identity. Identity of prism composition.
template<typename S>
[[nodiscard]] Prism<S, S> identity_prism() {
    return Prism<S, S>{[](const S& s) -> Either<S, S> { return right(s); }, zug::identity};
}

/// One alternative of a std::variant
template<typename Alt, typename Variant>
[[nodiscard]] Prism<Variant, Alt> alternative() {
    return Prism<Variant, Alt>{
        [](const Variant& v) -> Either<Variant, Alt> {
            if (const auto* alt = std::get_if<Alt>(&v)) {
                return right(*alt);
            }
            return left(v);
        },
        [](Alt a) { return Variant{std::in_place_type<Alt>, std::move(a)}; }};
}

/// The engaged value of a std::optional; updating may change the value type.
/// An empty optional<A> comes back as an empty optional<B>.
template<typename A, typename B = A>
[[nodiscard]] BasicPrism<std::optional<A>, std::optional<B>, A, B> some() {
    return BasicPrism<std::optional<A>, std::optional<B>, A, B>{
        [](const std::optional<A>& o) -> Either<std::optional<B>, A> {
            if (o) {
                return right(*o);
            }
            return left(std::optional<B>{});
        },
        [](B b) { return std::optional<B>{std::move(b)}; }};
}

} // namespace lager_optics
