// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lager_adapters.h
/// @brief Adapters between lager_optics and lager's lens ecosystem.
///
/// Features:
/// 1. to_lager_lens()            - a Prism (or Lens) as a lager::lens, for lager::view/set/over,
///                                 cursor zooming and zug::comp composition
/// 2. from_lager_lens()          - any lager lens as a Lens, composable with prisms
/// 3. from_lager_optional_lens() - a lager lens onto std::optional<A> as an Optional
///
/// Example usage:
///   auto circle = alternative<Circle, Shape>();
///   auto radius = circle | from_lager_lens<Circle, double>(lager::lenses::attr(&Circle::radius));
///
///   lager::lens<Shape, std::optional<Circle>> l = to_lager_lens(circle);
///   std::optional<Circle> c = lager::view(l, shape);

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/either.h>
#include <lager_optics/lens.h>
#include <lager_optics/optional.h>
#include <lager_optics/prism.h>

#include <lager/lens.hpp>
#include <lager/lenses.hpp>

#include <optional>
#include <utility>

namespace lager_optics {

// ============================================================
// lager_optics -> lager
// ============================================================

/// @brief View a Prism as a lager lens onto std::optional<A>
///
/// Viewing yields match_option(). Setting an engaged optional behaves like
/// set_with() (a non-matching whole stays unchanged); setting an empty
/// optional leaves the whole unchanged.
///
/// This is not a lawful lens: on a matching whole, view(set(s, nullopt))
/// still yields the old focus rather than nullopt, and a non-matching
/// whole does not take an engaged part either.
template<typename S, typename A>
[[nodiscard]] lager::lens<S, std::optional<A>> to_lager_lens(const Prism<S, A>& prism) {
    return lager::lenses::getset(
        // Getter
        [prism](const S& whole) -> std::optional<A> { return prism.match_option(whole); },
        // Setter
        [prism](S whole, std::optional<A> part) -> S {
            if (!part) {
                return whole;
            }
            return prism.set_with(whole, std::move(*part));
        });
}

/// @brief View a Lens as a lager lens
template<typename S, typename A>
[[nodiscard]] lager::lens<S, A> to_lager_lens(const Lens<S, A>& lens) {
    return lager::lenses::getset(
        [lens](const S& whole) -> A { return lens.get(whole); },
        [lens](S whole, A part) -> S { return lens.set(whole, std::move(part)); });
}

// ============================================================
// lager -> lager_optics
// ============================================================

/// @brief Adapt any lager lens (getset, attr, at, zug::comp of lenses, lager::lens<S, A>)
template<typename S, typename A, typename LagerLens>
[[nodiscard]] Lens<S, A> from_lager_lens(LagerLens lens) {
    return Lens<S, A>{
        [lens](const S& whole) -> A { return lager::view(lens, whole); },
        [lens](const S& whole, A part) -> S { return lager::set(lens, whole, std::move(part)); }};
}

/// @brief Adapt a lager lens whose part is std::optional<A>
///
/// An empty part is a failed match. Writes only happen when the part is
/// engaged, so the result obeys the Optional contract even if the lager
/// setter would accept a value for an empty part.
template<typename S, typename A, typename LagerLens>
[[nodiscard]] Optional<S, A> from_lager_optional_lens(LagerLens lens) {
    return Optional<S, A>{
        [lens](const S& whole) -> Either<S, A> {
            std::optional<A> part = lager::view(lens, whole);
            if (part) {
                return right(std::move(*part));
            }
            return left(whole);
        },
        [lens](const S& whole, A part) -> S {
            std::optional<A> current = lager::view(lens, whole);
            if (!current) {
                return whole;
            }
            return lager::set(lens, whole, std::optional<A>{std::move(part)});
        }};
}

} // namespace lager_optics
