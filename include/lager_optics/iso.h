// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file iso.h
/// @brief BasicIso<S, T, A, B>: a total, reversible conversion.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>
#include <lager_optics/lens.h>
#include <lager_optics/optic_kind.h>

#include <zug/compose.hpp>

#include <functional>
#include <utility>

namespace lager_optics {

template<typename S, typename T, typename A, typename B>
class BasicIso {
public:
    static constexpr OpticKind kind = OpticKind::Iso;

    using source_type = S;
    using result_type = T;
    using focus_type = A;
    using replacement_type = B;
    using Forward = std::function<A(const S&)>;
    using Backward = std::function<T(B)>;

    BasicIso(Forward get, Backward reverse_get)
        : get_(std::move(get))
        , reverse_get_(std::move(reverse_get))
    {}

    [[nodiscard]] A get(const S& s) const { return get_(s); }
    [[nodiscard]] T reverse_get(B b) const { return reverse_get_(std::move(b)); }

    template<typename Fn>
        requires FocusTransformer<Fn, A, B>
    [[nodiscard]] T modify(const S& s, Fn&& fn) const {
        return reverse_get_(std::invoke(std::forward<Fn>(fn), get_(s)));
    }

    [[nodiscard]] BasicIso<B, A, T, S> reverse() const {
        return BasicIso<B, A, T, S>{reverse_get_, get_};
    }

    template<typename C, typename D>
    [[nodiscard]] BasicIso<S, T, C, D> compose_iso(const BasicIso<A, B, C, D>& inner) const {
        return BasicIso<S, T, C, D>{
            [outer = get_, inner](const S& s) { return inner.get(outer(s)); },
            zug::comp(reverse_get_, [inner](D d) { return inner.reverse_get(std::move(d)); })};
    }

    [[nodiscard]] BasicLens<S, T, A, B> as_lens() const {
        return BasicLens<S, T, A, B>{get_, [back = reverse_get_](const S&, B b) { return back(std::move(b)); }};
    }

private:
    Forward get_;
    Backward reverse_get_;
};

template<typename S, typename A>
using Iso = BasicIso<S, S, A, A>;

template<typename S>
[[nodiscard]] Iso<S, S> identity_iso() {
    return Iso<S, S>{[](const S& s) { return s; }, zug::identity};
}

template<typename S, typename T, typename A, typename B, typename C, typename D>
[[nodiscard]] BasicIso<S, T, C, D> operator|(const BasicIso<S, T, A, B>& outer,
                                             const BasicIso<A, B, C, D>& inner) {
    return outer.compose_iso(inner);
}

} // namespace lager_optics
