// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file category.h
/// @brief Monomorphic prisms form a category under compose_prism.
///
/// `compose(f, g)` follows the mathematical order: g runs first (outer),
/// then f (inner), i.e. `compose(f, g) == g | f`.

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/prism.h>
#include <lager_optics/prisms.h>

namespace lager_optics {

struct prism_category {
    template<typename A>
    [[nodiscard]] static Prism<A, A> id() {
        return identity_prism<A>();
    }

    template<typename A, typename B, typename C>
    [[nodiscard]] static Prism<A, C> compose(const Prism<B, C>& f, const Prism<A, B>& g) {
        return g.compose_prism(f);
    }
};

} // namespace lager_optics
