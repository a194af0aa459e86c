// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file lens.h
/// @brief BasicLens<S, T, A, B>: exactly one focus, total get and set.
///
/// The type-erased counterpart of a lager lens. Use from_lager_lens()
/// (lager_adapters.h) to lift any lager lens into a BasicLens.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>
#include <lager_optics/either.h>
#include <lager_optics/optic_kind.h>
#include <lager_optics/optional.h>

#include <functional>
#include <utility>

namespace lager_optics {

template<typename S, typename T, typename A, typename B>
class BasicLens {
public:
    static constexpr OpticKind kind = OpticKind::Lens;

    using source_type = S;
    using result_type = T;
    using focus_type = A;
    using replacement_type = B;
    using Reader = std::function<A(const S&)>;
    using Replacer = std::function<T(const S&, B)>;

    BasicLens(Reader get, Replacer set)
        : get_(std::move(get))
        , set_(std::move(set))
    {}

    [[nodiscard]] A get(const S& s) const { return get_(s); }
    [[nodiscard]] T set(const S& s, B b) const { return set_(s, std::move(b)); }

    template<typename Fn>
        requires FocusTransformer<Fn, A, B>
    [[nodiscard]] T modify(const S& s, Fn&& fn) const {
        return set_(s, std::invoke(std::forward<Fn>(fn), get_(s)));
    }

    template<Effect E, typename Fn>
        requires std::invocable<Fn, A>
    [[nodiscard]] effect_t<E, T> modify_with_effect(const S& s, Fn&& fn) const {
        return E::map(std::invoke(std::forward<Fn>(fn), get_(s)),
                      [replace = set_, s](B b) -> T { return replace(s, std::move(b)); });
    }

    template<typename C, typename D>
    [[nodiscard]] BasicLens<S, T, C, D> compose_lens(const BasicLens<A, B, C, D>& inner) const {
        auto outer = *this;
        return BasicLens<S, T, C, D>{
            [outer, inner](const S& s) { return inner.get(outer.get(s)); },
            [outer, inner](const S& s, D d) -> T {
                return outer.modify(s, [&](A a) { return inner.set(a, std::move(d)); });
            }};
    }

    /// Always-matching Optional; the failure branch is never produced
    [[nodiscard]] BasicOptional<S, T, A, B> as_optional() const {
        return BasicOptional<S, T, A, B>{
            [get = get_](const S& s) -> Either<T, A> { return right(get(s)); },
            set_};
    }

private:
    Reader get_;
    Replacer set_;
};

template<typename S, typename A>
using Lens = BasicLens<S, S, A, A>;

template<typename S, typename T, typename A, typename B, typename C, typename D>
[[nodiscard]] BasicLens<S, T, C, D> operator|(const BasicLens<S, T, A, B>& outer,
                                              const BasicLens<A, B, C, D>& inner) {
    return outer.compose_lens(inner);
}

template<typename S, typename T, typename A, typename B, typename C, typename D>
[[nodiscard]] BasicOptional<S, T, C, D> operator|(const BasicOptional<S, T, A, B>& outer,
                                                  const BasicLens<A, B, C, D>& inner) {
    return outer.compose_lens(inner);
}

} // namespace lager_optics
