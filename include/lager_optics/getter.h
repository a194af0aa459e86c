// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file getter.h
/// @brief Getter<S, A>: read-only access to exactly one focus.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/fold.h>
#include <lager_optics/optic_kind.h>

#include <functional>

namespace lager_optics {

template<typename S, typename A>
class Getter {
public:
    static constexpr OpticKind kind = OpticKind::Getter;

    using source_type = S;
    using focus_type = A;
    using Reader = std::function<A(const S&)>;

    explicit Getter(Reader get) : get_(std::move(get)) {}

    [[nodiscard]] A get(const S& s) const { return get_(s); }

    template<typename C>
    [[nodiscard]] Getter<S, C> compose_getter(const Getter<A, C>& inner) const {
        return Getter<S, C>{[outer = get_, inner](const S& s) { return inner.get(outer(s)); }};
    }

    template<typename C>
    [[nodiscard]] Fold<S, C> compose_fold(const Fold<A, C>& inner) const {
        return as_fold().compose_fold(inner);
    }

    [[nodiscard]] Fold<S, A> as_fold() const {
        return Fold<S, A>{[get = get_](const S& s) { return immer::vector<A>{}.push_back(get(s)); }};
    }

private:
    Reader get_;
};

template<typename S, typename A, typename C>
[[nodiscard]] Getter<S, C> operator|(const Getter<S, A>& outer, const Getter<A, C>& inner) {
    return outer.compose_getter(inner);
}

template<typename S, typename A, typename C>
[[nodiscard]] Fold<S, C> operator|(const Getter<S, A>& outer, const Fold<A, C>& inner) {
    return outer.compose_fold(inner);
}

template<typename S, typename A, typename C>
[[nodiscard]] Fold<S, C> operator|(const Fold<S, A>& outer, const Getter<A, C>& inner) {
    return outer.compose_getter(inner);
}

} // namespace lager_optics
