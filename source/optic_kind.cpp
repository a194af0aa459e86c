// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <lager_optics/optic_kind.h>

namespace lager_optics {

std::string_view to_string(OpticKind kind) noexcept {
    switch (kind) {
    case OpticKind::Iso:       return "Iso";
    case OpticKind::Prism:     return "Prism";
    case OpticKind::Lens:      return "Lens";
    case OpticKind::Optional:  return "Optional";
    case OpticKind::Getter:    return "Getter";
    case OpticKind::Traversal: return "Traversal";
    case OpticKind::Setter:    return "Setter";
    case OpticKind::Fold:      return "Fold";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, OpticKind kind) {
    return os << to_string(kind);
}

} // namespace lager_optics
