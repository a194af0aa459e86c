// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file fold.h
/// @brief Fold<S, A>: read-only access to zero-or-more foci.
///
/// A Fold is defined by a single collector `S -> immer::vector<A>`.
/// Aggregation goes through a monoid tag (see monoid.h), so the same fold
/// can sum, test, or collect its foci.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>
#include <lager_optics/monoid.h>
#include <lager_optics/optic_kind.h>

#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstddef>
#include <functional>
#include <optional>

namespace lager_optics {

template<typename S, typename A>
class Getter;

template<typename S, typename A>
class Fold {
public:
    static constexpr OpticKind kind = OpticKind::Fold;

    using source_type = S;
    using focus_type = A;
    using Collector = std::function<immer::vector<A>(const S&)>;

    explicit Fold(Collector get_all) : get_all_(std::move(get_all)) {}

    [[nodiscard]] immer::vector<A> get_all(const S& s) const { return get_all_(s); }

    /// Map every focus into M and combine left to right
    template<Monoid M, typename Fn>
    [[nodiscard]] typename M::value_type fold_map(const S& s, Fn&& fn) const {
        typename M::value_type acc = M::empty();
        for (const auto& a : get_all_(s)) {
            acc = M::combine(acc, std::invoke(fn, a));
        }
        return acc;
    }

    template<typename Pred>
        requires FocusPredicate<Pred, A>
    [[nodiscard]] std::optional<A> find(const S& s, Pred&& pred) const {
        for (const auto& a : get_all_(s)) {
            if (std::invoke(pred, a)) {
                return a;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<A> first(const S& s) const {
        auto all = get_all_(s);
        if (all.empty()) {
            return std::nullopt;
        }
        return all[0];
    }

    template<typename Pred>
        requires FocusPredicate<Pred, A>
    [[nodiscard]] bool exists(const S& s, Pred&& pred) const {
        return find(s, std::forward<Pred>(pred)).has_value();
    }

    template<typename Pred>
        requires FocusPredicate<Pred, A>
    [[nodiscard]] bool all(const S& s, Pred&& pred) const {
        return fold_map<all_monoid>(s, [&](const A& a) -> bool { return std::invoke(pred, a); });
    }

    [[nodiscard]] std::size_t length(const S& s) const { return get_all_(s).size(); }
    [[nodiscard]] bool is_empty(const S& s) const { return get_all_(s).empty(); }

    template<typename C>
    [[nodiscard]] Fold<S, C> compose_fold(const Fold<A, C>& inner) const {
        return Fold<S, C>{[outer = get_all_, inner](const S& s) {
            auto out = immer::vector<C>{}.transient();
            for (const auto& a : outer(s)) {
                for (const auto& c : inner.get_all(a)) {
                    out.push_back(c);
                }
            }
            return out.persistent();
        }};
    }

    template<typename C>
    [[nodiscard]] Fold<S, C> compose_getter(const Getter<A, C>& inner) const {
        return Fold<S, C>{[outer = get_all_, inner](const S& s) {
            auto out = immer::vector<C>{}.transient();
            for (const auto& a : outer(s)) {
                out.push_back(inner.get(a));
            }
            return out.persistent();
        }};
    }

private:
    Collector get_all_;
};

template<typename S, typename A, typename C>
[[nodiscard]] Fold<S, C> operator|(const Fold<S, A>& outer, const Fold<A, C>& inner) {
    return outer.compose_fold(inner);
}

} // namespace lager_optics
