// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file traversal.h
/// @brief BasicTraversal<S, T, A, B>: effectful update of zero-or-more foci.
///
/// A traversal is encoded by two effect-free functions:
/// - `get_all: S -> immer::vector<A>`       the foci, in order
/// - `rebuild: (S, immer::vector<B>) -> T`  put replacements back, in order
///
/// `rebuild` receives exactly as many replacements as `get_all` produced
/// for the same source. Effectful modification sequences the foci through
/// an applicative effect, which is what lets one type-erased Traversal
/// serve every effect.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/concepts.h>
#include <lager_optics/fold.h>
#include <lager_optics/optic_kind.h>
#include <lager_optics/setter.h>

#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <utility>

namespace lager_optics {

template<typename S, typename T, typename A, typename B>
class BasicTraversal {
public:
    static constexpr OpticKind kind = OpticKind::Traversal;

    using source_type = S;
    using result_type = T;
    using focus_type = A;
    using replacement_type = B;
    using Collector = std::function<immer::vector<A>(const S&)>;
    using Rebuilder = std::function<T(const S&, immer::vector<B>)>;

    BasicTraversal(Collector get_all, Rebuilder rebuild)
        : get_all_(std::move(get_all))
        , rebuild_(std::move(rebuild))
    {}

    [[nodiscard]] immer::vector<A> get_all(const S& s) const { return get_all_(s); }

    [[nodiscard]] T rebuild(const S& s, immer::vector<B> replacements) const {
        return rebuild_(s, std::move(replacements));
    }

    template<typename Fn>
        requires FocusTransformer<Fn, A, B>
    [[nodiscard]] T modify(const S& s, Fn&& fn) const {
        auto replacements = immer::vector<B>{}.transient();
        for (const auto& a : get_all_(s)) {
            replacements.push_back(std::invoke(fn, a));
        }
        return rebuild_(s, replacements.persistent());
    }

    [[nodiscard]] T set(const S& s, const B& b) const {
        return modify(s, [&b](const A&) { return b; });
    }

    /// Run fn on every focus left to right and rebuild inside the effect
    template<ApplicativeEffect E, typename Fn>
        requires std::invocable<Fn&, const A&>
    [[nodiscard]] effect_t<E, T> modify_with_effect(const S& s, Fn&& fn) const {
        effect_t<E, immer::vector<B>> acc = E::pure(immer::vector<B>{});
        for (const auto& a : get_all_(s)) {
            acc = E::map2(std::move(acc), std::invoke(fn, a),
                          [](const immer::vector<B>& done, B b) { return done.push_back(std::move(b)); });
        }
        return E::map(std::move(acc), [rebuild = rebuild_, s](immer::vector<B> replacements) -> T {
            return rebuild(s, std::move(replacements));
        });
    }

    template<Monoid M, typename Fn>
    [[nodiscard]] typename M::value_type fold_map(const S& s, Fn&& fn) const {
        return as_fold().template fold_map<M>(s, std::forward<Fn>(fn));
    }

    template<typename C, typename D>
    [[nodiscard]] BasicTraversal<S, T, C, D> compose_traversal(const BasicTraversal<A, B, C, D>& inner) const {
        auto outer = *this;
        return BasicTraversal<S, T, C, D>{
            [outer, inner](const S& s) {
                auto out = immer::vector<C>{}.transient();
                for (const auto& a : outer.get_all(s)) {
                    for (const auto& c : inner.get_all(a)) {
                        out.push_back(c);
                    }
                }
                return out.persistent();
            },
            [outer, inner](const S& s, immer::vector<D> replacements) -> T {
                // Split the flat replacement list back into one chunk per outer focus
                auto rebuilt = immer::vector<B>{}.transient();
                std::size_t offset = 0;
                for (const auto& a : outer.get_all(s)) {
                    const std::size_t count = inner.get_all(a).size();
                    if (offset + count > replacements.size()) {
                        throw std::invalid_argument("BasicTraversal::compose_traversal: missing replacement for matched focus");
                    }
                    auto chunk = immer::vector<D>{}.transient();
                    for (std::size_t i = 0; i < count; ++i, ++offset) {
                        chunk.push_back(replacements[offset]);
                    }
                    rebuilt.push_back(inner.rebuild(a, chunk.persistent()));
                }
                return outer.rebuild(s, rebuilt.persistent());
            }};
    }

    template<typename C, typename D>
    [[nodiscard]] BasicSetter<S, T, C, D> compose_setter(const BasicSetter<A, B, C, D>& inner) const {
        return as_setter().compose_setter(inner);
    }

    template<typename C>
    [[nodiscard]] Fold<S, C> compose_fold(const Fold<A, C>& inner) const {
        return as_fold().compose_fold(inner);
    }

    [[nodiscard]] Fold<S, A> as_fold() const { return Fold<S, A>{get_all_}; }

    [[nodiscard]] BasicSetter<S, T, A, B> as_setter() const {
        return BasicSetter<S, T, A, B>{
            [self = *this](const S& s, const std::function<B(A)>& fn) { return self.modify(s, fn); }};
    }

private:
    Collector get_all_;
    Rebuilder rebuild_;
};

template<typename S, typename A>
using Traversal = BasicTraversal<S, S, A, A>;

/// Every element of an immer::vector, optionally changing the element type
template<typename A, typename B = A>
[[nodiscard]] BasicTraversal<immer::vector<A>, immer::vector<B>, A, B> each() {
    return {[](const immer::vector<A>& v) { return v; },
            [](const immer::vector<A>&, immer::vector<B> replacements) { return replacements; }};
}

template<typename S, typename T, typename A, typename B, typename C, typename D>
[[nodiscard]] BasicTraversal<S, T, C, D> operator|(const BasicTraversal<S, T, A, B>& outer,
                                                   const BasicTraversal<A, B, C, D>& inner) {
    return outer.compose_traversal(inner);
}

} // namespace lager_optics
