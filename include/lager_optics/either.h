// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file either.h
/// @brief Either<L, R>: the result of a partial match.
///
/// `Left` carries the failure payload (for a Prism: the original value,
/// reinterpreted at the post-update type), `Right` carries the focus.
/// Alternatives are addressed by index, so `Either<int, int>` is valid.
///
/// Example:
/// @code
/// Either<std::string, int> parsed = right(42);
/// int n = parsed.fold([](const std::string&) { return 0; },
///                     [](int v) { return v; });
/// @endcode

#pragma once

#include <lager_optics/lager_optics_config.h>

#include <concepts>
#include <functional>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace lager_optics {

/// Tagged failure payload, converts into any Either with a compatible L
template<typename L>
struct Left {
    L value;
};

/// Tagged success payload, converts into any Either with a compatible R
template<typename R>
struct Right {
    R value;
};

template<typename L>
[[nodiscard]] Left<std::decay_t<L>> left(L&& value) {
    return {std::forward<L>(value)};
}

template<typename R>
[[nodiscard]] Right<std::decay_t<R>> right(R&& value) {
    return {std::forward<R>(value)};
}

template<typename L, typename R>
class Either {
public:
    using left_type = L;
    using right_type = R;

    template<typename U>
        requires std::constructible_from<L, U&&>
    Either(Left<U> l) : data_(std::in_place_index<0>, std::move(l.value)) {}

    template<typename U>
        requires std::constructible_from<R, U&&>
    Either(Right<U> r) : data_(std::in_place_index<1>, std::move(r.value)) {}

    [[nodiscard]] bool is_left() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_right() const noexcept { return data_.index() == 1; }

    /// @throws std::bad_variant_access if this holds a Right
    [[nodiscard]] const L& left_value() const & { return std::get<0>(data_); }
    [[nodiscard]] L left_value() && { return std::get<0>(std::move(data_)); }

    /// @throws std::bad_variant_access if this holds a Left
    [[nodiscard]] const R& right_value() const & { return std::get<1>(data_); }
    [[nodiscard]] R right_value() && { return std::get<1>(std::move(data_)); }

    /// Discard the Left payload
    [[nodiscard]] std::optional<R> to_optional() const & {
        if (is_right()) {
            return std::get<1>(data_);
        }
        return std::nullopt;
    }
    [[nodiscard]] std::optional<R> to_optional() && {
        if (is_right()) {
            return std::get<1>(std::move(data_));
        }
        return std::nullopt;
    }

    /// Collapse both sides into one result type
    template<typename FL, typename FR>
    [[nodiscard]] auto fold(FL&& on_left, FR&& on_right) const & {
        using Result = std::common_type_t<std::invoke_result_t<FL, const L&>,
                                          std::invoke_result_t<FR, const R&>>;
        if (is_left()) {
            return Result(std::invoke(std::forward<FL>(on_left), std::get<0>(data_)));
        }
        return Result(std::invoke(std::forward<FR>(on_right), std::get<1>(data_)));
    }

    template<typename FL, typename FR>
    [[nodiscard]] auto fold(FL&& on_left, FR&& on_right) && {
        using Result = std::common_type_t<std::invoke_result_t<FL, L&&>,
                                          std::invoke_result_t<FR, R&&>>;
        if (is_left()) {
            return Result(std::invoke(std::forward<FL>(on_left), std::get<0>(std::move(data_))));
        }
        return Result(std::invoke(std::forward<FR>(on_right), std::get<1>(std::move(data_))));
    }

    /// Transform the Right side, Left passes through
    template<typename Fn>
    [[nodiscard]] auto map(Fn&& fn) && -> Either<L, std::decay_t<std::invoke_result_t<Fn, R&&>>> {
        if (is_left()) {
            return Left<L>{std::get<0>(std::move(data_))};
        }
        return right(std::invoke(std::forward<Fn>(fn), std::get<1>(std::move(data_))));
    }

    template<typename Fn>
    [[nodiscard]] auto map(Fn&& fn) const & {
        return Either{*this}.map(std::forward<Fn>(fn));
    }

    /// Transform the Left side, Right passes through
    template<typename Fn>
    [[nodiscard]] auto map_left(Fn&& fn) && -> Either<std::decay_t<std::invoke_result_t<Fn, L&&>>, R> {
        if (is_right()) {
            return Right<R>{std::get<1>(std::move(data_))};
        }
        return left(std::invoke(std::forward<Fn>(fn), std::get<0>(std::move(data_))));
    }

    template<typename Fn>
    [[nodiscard]] auto map_left(Fn&& fn) const & {
        return Either{*this}.map_left(std::forward<Fn>(fn));
    }

    /// Chain a computation that may itself fail; fn must return Either<L, X>
    template<typename Fn>
    [[nodiscard]] auto flat_map(Fn&& fn) && {
        using Next = std::decay_t<std::invoke_result_t<Fn, R&&>>;
        static_assert(std::is_same_v<typename Next::left_type, L>,
                      "flat_map continuation must keep the Left type");
        if (is_left()) {
            return Next(Left<L>{std::get<0>(std::move(data_))});
        }
        return Next(std::invoke(std::forward<Fn>(fn), std::get<1>(std::move(data_))));
    }

    template<typename Fn>
    [[nodiscard]] auto flat_map(Fn&& fn) const & {
        return Either{*this}.flat_map(std::forward<Fn>(fn));
    }

    bool operator==(const Either&) const = default;

private:
    std::variant<L, R> data_;
};

template<typename L, typename R>
    requires requires(std::ostream& os, const L& l, const R& r) { os << l; os << r; }
std::ostream& operator<<(std::ostream& os, const Either<L, R>& e) {
    if (e.is_left()) {
        return os << "Left(" << e.left_value() << ")";
    }
    return os << "Right(" << e.right_value() << ")";
}

} // namespace lager_optics
