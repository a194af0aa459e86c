// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file optional.h
/// @brief BasicOptional<S, T, A, B>: zero-or-one focus, read may fail.
///
/// Defined by:
/// - `get_or_modify: S -> Either<T, A>`  the focus, or the unchanged source
/// - `set: (S, B) -> T`                  replace the focus if there is one
///
/// Unlike a Prism, an Optional cannot build a whole from a focus alone,
/// so it has no reconstruct.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>
#include <lager_optics/either.h>
#include <lager_optics/fold.h>
#include <lager_optics/optic_kind.h>
#include <lager_optics/setter.h>
#include <lager_optics/traversal.h>

#include <immer/vector.hpp>

#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>

namespace lager_optics {

template<typename S, typename T, typename A, typename B>
class BasicLens;

template<typename S, typename T, typename A, typename B>
class BasicOptional {
public:
    static constexpr OpticKind kind = OpticKind::Optional;

    using source_type = S;
    using result_type = T;
    using focus_type = A;
    using replacement_type = B;
    using Matcher = std::function<Either<T, A>(const S&)>;
    using Replacer = std::function<T(const S&, B)>;

    BasicOptional(Matcher get_or_modify, Replacer set)
        : get_or_modify_(std::move(get_or_modify))
        , set_(std::move(set))
    {}

    [[nodiscard]] Either<T, A> get_or_modify(const S& s) const { return get_or_modify_(s); }

    [[nodiscard]] std::optional<A> get_option(const S& s) const {
        return get_or_modify_(s).to_optional();
    }

    [[nodiscard]] bool is_matching(const S& s) const { return get_or_modify_(s).is_right(); }

    [[nodiscard]] T set(const S& s, B b) const { return set_(s, std::move(b)); }

    template<typename Fn>
        requires FocusTransformer<Fn, A, B>
    [[nodiscard]] T modify(const S& s, Fn&& fn) const {
        auto matched = get_or_modify_(s);
        if (matched.is_left()) {
            return std::move(matched).left_value();
        }
        return set_(s, std::invoke(std::forward<Fn>(fn), std::move(matched).right_value()));
    }

    template<Effect E, typename Fn>
        requires std::invocable<Fn, A>
    [[nodiscard]] effect_t<E, T> modify_with_effect(const S& s, Fn&& fn) const {
        auto matched = get_or_modify_(s);
        if (matched.is_left()) {
            return E::pure(std::move(matched).left_value());
        }
        return E::map(std::invoke(std::forward<Fn>(fn), std::move(matched).right_value()),
                      [replace = set_, s](B b) -> T { return replace(s, std::move(b)); });
    }

    template<typename Fn>
        requires FocusTransformer<Fn, A, B>
    [[nodiscard]] std::optional<T> modify_option(const S& s, Fn&& fn) const {
        auto matched = get_or_modify_(s);
        if (matched.is_left()) {
            return std::nullopt;
        }
        return set_(s, std::invoke(std::forward<Fn>(fn), std::move(matched).right_value()));
    }

    [[nodiscard]] std::optional<T> set_option(const S& s, B b) const {
        if (!is_matching(s)) {
            return std::nullopt;
        }
        return set_(s, std::move(b));
    }

    template<typename C, typename D>
    [[nodiscard]] BasicOptional<S, T, C, D> compose_optional(const BasicOptional<A, B, C, D>& inner) const {
        auto outer = *this;
        return BasicOptional<S, T, C, D>{
            [outer, inner](const S& s) -> Either<T, C> {
                return outer.get_or_modify(s).flat_map([&](A a) -> Either<T, C> {
                    return inner.get_or_modify(a).map_left([&](B b) { return outer.set(s, std::move(b)); });
                });
            },
            [outer, inner](const S& s, D d) -> T {
                return outer.modify(s, [&](A a) { return inner.set(a, d); });
            }};
    }

    template<typename C, typename D>
    [[nodiscard]] BasicOptional<S, T, C, D> compose_lens(const BasicLens<A, B, C, D>& inner) const {
        return compose_optional(inner.as_optional());
    }

    [[nodiscard]] Fold<S, A> as_fold() const {
        return Fold<S, A>{[matcher = get_or_modify_](const S& s) {
            immer::vector<A> out;
            auto matched = matcher(s);
            if (matched.is_right()) {
                out = out.push_back(std::move(matched).right_value());
            }
            return out;
        }};
    }

    [[nodiscard]] BasicSetter<S, T, A, B> as_setter() const {
        return BasicSetter<S, T, A, B>{
            [self = *this](const S& s, const std::function<B(A)>& fn) { return self.modify(s, fn); }};
    }

    /// @throws std::invalid_argument from rebuild if a matched source gets no replacement
    [[nodiscard]] BasicTraversal<S, T, A, B> as_traversal() const {
        auto self = *this;
        return BasicTraversal<S, T, A, B>{
            [self](const S& s) { return self.as_fold().get_all(s); },
            [self](const S& s, immer::vector<B> replacements) -> T {
                auto matched = self.get_or_modify(s);
                if (matched.is_left()) {
                    return std::move(matched).left_value();
                }
                if (replacements.empty()) {
                    throw std::invalid_argument("BasicOptional::as_traversal: missing replacement for matched focus");
                }
                return self.set(s, replacements[0]);
            }};
    }

private:
    Matcher get_or_modify_;
    Replacer set_;
};

template<typename S, typename A>
using Optional = BasicOptional<S, S, A, A>;

template<typename S, typename T, typename A, typename B, typename C, typename D>
[[nodiscard]] BasicOptional<S, T, C, D> operator|(const BasicOptional<S, T, A, B>& outer,
                                                  const BasicOptional<A, B, C, D>& inner) {
    return outer.compose_optional(inner);
}

} // namespace lager_optics
