// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file prism.h
/// @brief BasicPrism<S, T, A, B>: a partial view paired with a total reconstruction.
///
/// A Prism typically relates a sum type to one of its alternatives. It is
/// defined by two functions:
/// - `try_match: S -> Either<T, A>`  the focus, or the source reinterpreted as T
/// - `reconstruct: B -> T`           build a whole from a focus alone
///
/// Every other operation is derived from these two. A non-matching source
/// is never an error: it comes back as the Left payload, unchanged.
///
/// Laws (documented contract, verified by laws.h on samples):
/// 1. try_match(s) == Right(a)  implies  reconstruct(a) == s
/// 2. try_match(reconstruct(b)) == Right(b)
/// 3. try_match(s) == Left(t)   implies  every update of s returns t
///
/// Composition keeps only the capabilities both operands support (see
/// optic_kind.h): Prism | Prism and Prism | Iso stay Prisms, Prism | Lens
/// and Prism | Optional give an Optional, and so on.
///
/// Example:
/// @code
/// using Shape = std::variant<Circle, Square>;
/// Prism<Shape, Circle> circle = alternative<Circle, Shape>();
///
/// circle.match_option(Shape{Square{2}});                  // nullopt
/// circle.modify_with(Shape{Circle{1}}, grow);             // Shape{Circle{...}}
/// auto radius = circle | radius_lens;                     // Optional<Shape, double>
/// @endcode

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>
#include <lager_optics/either.h>
#include <lager_optics/fold.h>
#include <lager_optics/getter.h>
#include <lager_optics/iso.h>
#include <lager_optics/lens.h>
#include <lager_optics/optic_kind.h>
#include <lager_optics/optional.h>
#include <lager_optics/setter.h>
#include <lager_optics/traversal.h>

#include <immer/vector.hpp>
#include <zug/compose.hpp>

#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>

namespace lager_optics {

template<typename S, typename T, typename A, typename B>
class BasicPrism {
public:
    static constexpr OpticKind kind = OpticKind::Prism;

    using source_type = S;
    using result_type = T;
    using focus_type = A;
    using replacement_type = B;
    using Matcher = std::function<Either<T, A>(const S&)>;
    using Builder = std::function<T(B)>;

    BasicPrism(Matcher try_match, Builder reconstruct)
        : match_(std::move(try_match))
        , build_(std::move(reconstruct))
    {}

    /// An Iso seen as a Prism that always matches
    [[nodiscard]] static BasicPrism from_iso(const BasicIso<S, T, A, B>& iso) {
        return BasicPrism{
            [iso](const S& s) -> Either<T, A> { return right(iso.get(s)); },
            [iso](B b) { return iso.reverse_get(std::move(b)); }};
    }

    // ============================================================
    // Core operations
    // ============================================================

    [[nodiscard]] Either<T, A> try_match(const S& s) const { return match_(s); }

    [[nodiscard]] T reconstruct(B b) const { return build_(std::move(b)); }

    [[nodiscard]] std::optional<A> match_option(const S& s) const {
        return match_(s).to_optional();
    }

    [[nodiscard]] bool is_matching(const S& s) const { return match_(s).is_right(); }

    /// Apply fn to the focus and reconstruct; a non-matching source is returned as is
    template<typename Fn>
        requires FocusTransformer<Fn, A, B>
    [[nodiscard]] T modify_with(const S& s, Fn&& fn) const {
        auto matched = match_(s);
        if (matched.is_left()) {
            return std::move(matched).left_value();
        }
        return build_(std::invoke(std::forward<Fn>(fn), std::move(matched).right_value()));
    }

    /// Effectful modify: lift the unchanged source on no match,
    /// otherwise run fn and reconstruct inside the effect.
    template<Effect E, typename Fn>
        requires std::invocable<Fn, A>
    [[nodiscard]] effect_t<E, T> modify_with_effect(const S& s, Fn&& fn) const {
        auto matched = match_(s);
        if (matched.is_left()) {
            return E::pure(std::move(matched).left_value());
        }
        return E::map(std::invoke(std::forward<Fn>(fn), std::move(matched).right_value()),
                      [build = build_](B b) -> T { return build(std::move(b)); });
    }

    /// Like modify_with, but nullopt when the source does not match
    template<typename Fn>
        requires FocusTransformer<Fn, A, B>
    [[nodiscard]] std::optional<T> modify_optional(const S& s, Fn&& fn) const {
        auto matched = match_(s);
        if (matched.is_left()) {
            return std::nullopt;
        }
        return build_(std::invoke(std::forward<Fn>(fn), std::move(matched).right_value()));
    }

    [[nodiscard]] T set_with(const S& s, B b) const {
        return modify_with(s, [&b](const A&) -> B { return std::move(b); });
    }

    [[nodiscard]] std::optional<T> set_optional(const S& s, B b) const {
        return modify_optional(s, [&b](const A&) -> B { return std::move(b); });
    }

    /// Reconstruction as a one-way accessor
    [[nodiscard]] Getter<B, T> reversed() const {
        return Getter<B, T>{[build = build_](const B& b) { return build(b); }};
    }

    // ============================================================
    // Composition
    // ============================================================

    template<typename C, typename D>
    [[nodiscard]] BasicPrism<S, T, C, D> compose_prism(const BasicPrism<A, B, C, D>& inner) const {
        auto outer = *this;
        return BasicPrism<S, T, C, D>{
            [outer, inner](const S& s) -> Either<T, C> {
                return outer.try_match(s).flat_map([&](A a) -> Either<T, C> {
                    // Inner mismatch: put the inner payload back under the outer variant
                    return inner.try_match(a).map_left([&](B b) { return outer.reconstruct(std::move(b)); });
                });
            },
            zug::comp(build_, inner.build_)};
    }

    template<typename C, typename D>
    [[nodiscard]] BasicPrism<S, T, C, D> compose_iso(const BasicIso<A, B, C, D>& inner) const {
        return compose_prism(BasicPrism<A, B, C, D>::from_iso(inner));
    }

    template<typename C, typename D>
    [[nodiscard]] BasicOptional<S, T, C, D> compose_lens(const BasicLens<A, B, C, D>& inner) const {
        return as_optional().compose_optional(inner.as_optional());
    }

    template<typename C, typename D>
    [[nodiscard]] BasicOptional<S, T, C, D> compose_optional(const BasicOptional<A, B, C, D>& inner) const {
        return as_optional().compose_optional(inner);
    }

    template<typename C, typename D>
    [[nodiscard]] BasicTraversal<S, T, C, D> compose_traversal(const BasicTraversal<A, B, C, D>& inner) const {
        return as_traversal().compose_traversal(inner);
    }

    template<typename C, typename D>
    [[nodiscard]] BasicSetter<S, T, C, D> compose_setter(const BasicSetter<A, B, C, D>& inner) const {
        return as_setter().compose_setter(inner);
    }

    template<typename C>
    [[nodiscard]] Fold<S, C> compose_fold(const Fold<A, C>& inner) const {
        return as_fold().compose_fold(inner);
    }

    template<typename C>
    [[nodiscard]] Fold<S, C> compose_getter(const Getter<A, C>& inner) const {
        return as_fold().compose_getter(inner);
    }

    // ============================================================
    // Weaker views
    //
    // Each view captures the same two functions; calling an operation on
    // the view is the same as calling the Prism operation directly.
    // ============================================================

    [[nodiscard]] Fold<S, A> as_fold() const {
        return Fold<S, A>{[match = match_](const S& s) {
            immer::vector<A> out;
            auto matched = match(s);
            if (matched.is_right()) {
                out = out.push_back(std::move(matched).right_value());
            }
            return out;
        }};
    }

    [[nodiscard]] BasicSetter<S, T, A, B> as_setter() const {
        return BasicSetter<S, T, A, B>{
            [self = *this](const S& s, const std::function<B(A)>& fn) { return self.modify_with(s, fn); }};
    }

    /// @throws std::invalid_argument from rebuild if a matched source gets no replacement
    [[nodiscard]] BasicTraversal<S, T, A, B> as_traversal() const {
        auto self = *this;
        return BasicTraversal<S, T, A, B>{
            [self](const S& s) { return self.as_fold().get_all(s); },
            [self](const S& s, immer::vector<B> replacements) -> T {
                auto matched = self.try_match(s);
                if (matched.is_left()) {
                    return std::move(matched).left_value();
                }
                if (replacements.empty()) {
                    throw std::invalid_argument("BasicPrism::as_traversal: missing replacement for matched focus");
                }
                return self.reconstruct(replacements[0]);
            }};
    }

    [[nodiscard]] BasicOptional<S, T, A, B> as_optional() const {
        return BasicOptional<S, T, A, B>{
            match_,
            [self = *this](const S& s, B b) { return self.set_with(s, std::move(b)); }};
    }

private:
    template<typename, typename, typename, typename>
    friend class BasicPrism;

    Matcher match_;
    Builder build_;
};

/// Monomorphic Prism: matching and reconstruction never change the static type
template<typename S, typename A>
using Prism = BasicPrism<S, S, A, A>;

/// Build a monomorphic Prism from `S -> std::optional<A>` and `A -> S`.
/// On absence the failure payload is the source itself.
template<typename S, typename A, typename MatchFn, typename BuildFn>
    requires std::invocable<MatchFn&, const S&> && std::invocable<BuildFn&, A>
[[nodiscard]] Prism<S, A> make_prism(MatchFn match, BuildFn build) {
    return Prism<S, A>{
        [match = std::move(match)](const S& s) -> Either<S, A> {
            if (auto found = std::invoke(match, s)) {
                return right(A(std::move(*found)));
            }
            return left(s);
        },
        std::move(build)};
}

// ============================================================
// Composition operators (outer | inner)
// ============================================================

template<typename S, typename T, typename A, typename B, typename C, typename D>
[[nodiscard]] BasicPrism<S, T, C, D> operator|(const BasicPrism<S, T, A, B>& outer,
                                               const BasicPrism<A, B, C, D>& inner) {
    return outer.compose_prism(inner);
}

template<typename S, typename T, typename A, typename B, typename C, typename D>
[[nodiscard]] BasicPrism<S, T, C, D> operator|(const BasicPrism<S, T, A, B>& outer,
                                               const BasicIso<A, B, C, D>& inner) {
    return outer.compose_iso(inner);
}

template<typename S, typename T, typename A, typename B, typename C, typename D>
[[nodiscard]] BasicOptional<S, T, C, D> operator|(const BasicPrism<S, T, A, B>& outer,
                                                  const BasicLens<A, B, C, D>& inner) {
    return outer.compose_lens(inner);
}

template<typename S, typename T, typename A, typename B, typename C, typename D>
[[nodiscard]] BasicOptional<S, T, C, D> operator|(const BasicPrism<S, T, A, B>& outer,
                                                  const BasicOptional<A, B, C, D>& inner) {
    return outer.compose_optional(inner);
}

template<typename S, typename T, typename A, typename B, typename C, typename D>
[[nodiscard]] BasicTraversal<S, T, C, D> operator|(const BasicPrism<S, T, A, B>& outer,
                                                   const BasicTraversal<A, B, C, D>& inner) {
    return outer.compose_traversal(inner);
}

template<typename S, typename T, typename A, typename B, typename C, typename D>
[[nodiscard]] BasicSetter<S, T, C, D> operator|(const BasicPrism<S, T, A, B>& outer,
                                                const BasicSetter<A, B, C, D>& inner) {
    return outer.compose_setter(inner);
}

template<typename S, typename T, typename A, typename B, typename C>
[[nodiscard]] Fold<S, C> operator|(const BasicPrism<S, T, A, B>& outer, const Fold<A, C>& inner) {
    return outer.compose_fold(inner);
}

template<typename S, typename T, typename A, typename B, typename C>
[[nodiscard]] Fold<S, C> operator|(const BasicPrism<S, T, A, B>& outer, const Getter<A, C>& inner) {
    return outer.compose_getter(inner);
}

} // namespace lager_optics
