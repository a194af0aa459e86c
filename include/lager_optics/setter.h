// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file setter.h
/// @brief BasicSetter<S, T, A, B>: write-only access to zero-or-more foci.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>
#include <lager_optics/optic_kind.h>

#include <functional>
#include <utility>

namespace lager_optics {

template<typename S, typename T, typename A, typename B>
class BasicSetter {
public:
    static constexpr OpticKind kind = OpticKind::Setter;

    using source_type = S;
    using result_type = T;
    using focus_type = A;
    using replacement_type = B;
    using Update = std::function<B(A)>;
    using Modifier = std::function<T(const S&, const Update&)>;

    explicit BasicSetter(Modifier modify) : modify_(std::move(modify)) {}

    template<typename Fn>
        requires FocusTransformer<Fn, A, B>
    [[nodiscard]] T modify(const S& s, Fn&& fn) const {
        return modify_(s, Update{std::forward<Fn>(fn)});
    }

    [[nodiscard]] T set(const S& s, B b) const {
        return modify_(s, Update{[b = std::move(b)](const A&) { return b; }});
    }

    template<typename C, typename D>
    [[nodiscard]] BasicSetter<S, T, C, D> compose_setter(const BasicSetter<A, B, C, D>& inner) const {
        return BasicSetter<S, T, C, D>{
            [outer = modify_, inner](const S& s, const std::function<D(C)>& fn) {
                return outer(s, Update{[&inner, &fn](A a) { return inner.modify(a, fn); }});
            }};
    }

private:
    Modifier modify_;
};

template<typename S, typename A>
using Setter = BasicSetter<S, S, A, A>;

template<typename S, typename T, typename A, typename B, typename C, typename D>
[[nodiscard]] BasicSetter<S, T, C, D> operator|(const BasicSetter<S, T, A, B>& outer,
                                                const BasicSetter<A, B, C, D>& inner) {
    return outer.compose_setter(inner);
}

} // namespace lager_optics
