// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file optic_kind.h
/// @brief Optic kinds as capability sets, and the kind of a composition.
///
/// Every optic kind is described by the capabilities it supports. Composing
/// two optics keeps only the capabilities both support, and the result is
/// the strongest kind that needs no more than that intersection:
///
/// | outer \ inner | Iso       | Prism     | Lens      | Optional  | Getter | Traversal | Setter | Fold |
/// |---------------|-----------|-----------|-----------|-----------|--------|-----------|--------|------|
/// | Prism         | Prism     | Prism     | Optional  | Optional  | Fold   | Traversal | Setter | Fold |
///
/// Every optic class carries `static constexpr OpticKind kind`, and the
/// static result type of each compose_* method agrees with compose_kind().

#pragma once

#include <lager_optics/api.h>

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <type_traits>

namespace lager_optics {

enum class OpticKind : std::uint8_t {
    Iso,
    Prism,
    Lens,
    Optional,
    Getter,
    Traversal,
    Setter,
    Fold,
};

/// Capability bits
enum class Capability : std::uint8_t {
    None        = 0,
    Get         = 1 << 0, ///< exactly one focus, always readable
    Match       = 1 << 1, ///< zero-or-one focus, read may fail
    Aggregate   = 1 << 2, ///< zero-or-more foci, folded with a monoid
    Reconstruct = 1 << 3, ///< build the whole from a focus alone
    Modify      = 1 << 4, ///< pure update of every focus
    Traverse    = 1 << 5, ///< effectful update of every focus
};

[[nodiscard]] constexpr Capability operator|(Capability a, Capability b) noexcept {
    return static_cast<Capability>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

[[nodiscard]] constexpr Capability operator&(Capability a, Capability b) noexcept {
    return static_cast<Capability>(static_cast<std::uint8_t>(a) & static_cast<std::uint8_t>(b));
}

/// True if every capability in `needed` is present in `available`
[[nodiscard]] constexpr bool contains(Capability available, Capability needed) noexcept {
    return (available & needed) == needed;
}

[[nodiscard]] constexpr Capability capabilities(OpticKind kind) noexcept {
    using C = Capability;
    switch (kind) {
    case OpticKind::Iso:
        return C::Get | C::Match | C::Aggregate | C::Reconstruct | C::Modify | C::Traverse;
    case OpticKind::Prism:
        return C::Match | C::Aggregate | C::Reconstruct | C::Modify | C::Traverse;
    case OpticKind::Lens:
        return C::Get | C::Match | C::Aggregate | C::Modify | C::Traverse;
    case OpticKind::Optional:
        return C::Match | C::Aggregate | C::Modify | C::Traverse;
    case OpticKind::Getter:
        return C::Get | C::Match | C::Aggregate;
    case OpticKind::Traversal:
        return C::Aggregate | C::Modify | C::Traverse;
    case OpticKind::Setter:
        return C::Modify;
    case OpticKind::Fold:
        return C::Aggregate;
    }
    return C::None;
}

/// Kinds from strongest to weakest; compose_kind picks the first that fits
inline constexpr std::array<OpticKind, 8> kinds_by_strength = {
    OpticKind::Iso,    OpticKind::Prism,     OpticKind::Lens,   OpticKind::Optional,
    OpticKind::Getter, OpticKind::Traversal, OpticKind::Setter, OpticKind::Fold,
};

/// Kind of `outer | inner`, or nullopt if the two kinds share no usable capability set
[[nodiscard]] constexpr std::optional<OpticKind> compose_kind(OpticKind outer, OpticKind inner) noexcept {
    const Capability shared = capabilities(outer) & capabilities(inner);
    for (OpticKind candidate : kinds_by_strength) {
        if (contains(shared, capabilities(candidate))) {
            return candidate;
        }
    }
    return std::nullopt;
}

/// True if an optic of kind `from` can be presented as kind `to` without adaptation loss
[[nodiscard]] constexpr bool can_weaken(OpticKind from, OpticKind to) noexcept {
    return contains(capabilities(from), capabilities(to));
}

[[nodiscard]] LAGER_OPTICS_API std::string_view to_string(OpticKind kind) noexcept;

LAGER_OPTICS_API std::ostream& operator<<(std::ostream& os, OpticKind kind);

// ============================================================
// Static kind lookup
// ============================================================

template<typename Optic>
inline constexpr OpticKind optic_kind_v = std::remove_cvref_t<Optic>::kind;

static_assert(compose_kind(OpticKind::Prism, OpticKind::Prism) == OpticKind::Prism);
static_assert(compose_kind(OpticKind::Prism, OpticKind::Iso) == OpticKind::Prism);
static_assert(compose_kind(OpticKind::Prism, OpticKind::Lens) == OpticKind::Optional);
static_assert(compose_kind(OpticKind::Prism, OpticKind::Getter) == OpticKind::Fold);
static_assert(!compose_kind(OpticKind::Getter, OpticKind::Setter).has_value());

} // namespace lager_optics
