// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file laws.h
/// @brief Sample-based verification of the Prism laws.
///
/// The laws are a contract of whoever writes the two defining functions;
/// nothing checks them at construction. These functions check them on
/// caller-supplied samples and return a LawReport:
///
/// | Function                     | Checks                                              |
/// |------------------------------|-----------------------------------------------------|
/// | check_prism_laws()           | round trips, no-match inertness, modify/set agree   |
/// | check_prism_views()          | Fold/Setter/Traversal/Optional views agree          |
/// | check_compose_associativity()| (p | q) | r behaves like p | (q | r)                |
/// | check_identity_laws()        | identity_prism() is a unit of composition           |
///
/// Every violation is logged to stderr when LAGER_OPTICS_VERBOSE_LOG is on.
///
/// Example:
/// @code
/// std::vector<Shape> shapes = {Circle{1.0}, Square{2.0}};
/// std::vector<Circle> circles = {Circle{3.0}};
/// auto report = check_prism_laws(circle, shapes, circles, grow);
/// report.throw_if_failed();
/// @endcode

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/api.h>
#include <lager_optics/concepts.h>
#include <lager_optics/effect.h>
#include <lager_optics/either.h>
#include <lager_optics/prism.h>
#include <lager_optics/prisms.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <sstream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace lager_optics {

// ============================================================
// Law names
// ============================================================

namespace law {
inline constexpr std::string_view round_trip_on_match = "round_trip_on_match";
inline constexpr std::string_view reconstruct_then_match = "reconstruct_then_match";
inline constexpr std::string_view no_match_inert = "no_match_inert";
inline constexpr std::string_view modify_set_consistency = "modify_set_consistency";
inline constexpr std::string_view modify_optional_consistency = "modify_optional_consistency";
inline constexpr std::string_view fold_view = "fold_view";
inline constexpr std::string_view setter_view = "setter_view";
inline constexpr std::string_view traversal_view = "traversal_view";
inline constexpr std::string_view optional_view = "optional_view";
inline constexpr std::string_view compose_associativity = "compose_associativity";
inline constexpr std::string_view left_identity = "left_identity";
inline constexpr std::string_view right_identity = "right_identity";
} // namespace law

// ============================================================
// LawReport
// ============================================================

struct LawViolation {
    std::string law;
    std::size_t sample_index = 0;
    std::string detail;
};

class LAGER_OPTICS_CLASS LawViolationError : public std::runtime_error {
public:
    explicit LawViolationError(const std::string& what) : std::runtime_error(what) {}
};

struct LAGER_OPTICS_CLASS LawReport {
    std::string subject;            // Name of the check that produced the report
    std::size_t checked = 0;        // Number of individual expectations evaluated
    std::size_t failed = 0;         // Number that did not hold
    std::vector<LawViolation> violations; // First LAGER_OPTICS_LAW_REPORT_LIMIT failures

    LawReport() = default;
    explicit LawReport(std::string subject_name) : subject(std::move(subject_name)) {}

    [[nodiscard]] bool passed() const noexcept { return failed == 0; }
    explicit operator bool() const noexcept { return passed(); }

    /// Count one expectation; on failure build the detail text and record it
    template<typename DetailFn>
    void expect(bool ok, std::string_view law_name, std::size_t sample_index, DetailFn&& detail) {
        ++checked;
        if (!ok) {
            record(law_name, sample_index, std::forward<DetailFn>(detail)());
        }
    }

    void record(std::string_view law_name, std::size_t sample_index, std::string detail);

    /// True if at least one recorded violation is of the given law
    [[nodiscard]] bool violated(std::string_view law_name) const;

    [[nodiscard]] std::string to_string() const;

    /// @throws LawViolationError if any expectation failed
    void throw_if_failed() const;
};

namespace detail {

template<typename X>
std::string describe(const X& x) {
    if constexpr (requires(std::ostream& os) { os << x; }) {
        std::ostringstream os;
        os << x;
        return os.str();
    } else {
        return "<unprintable>";
    }
}

template<typename X, typename Eq>
bool same_option(const Eq& eq, const std::optional<X>& a, const std::optional<X>& b) {
    if (a.has_value() != b.has_value()) return false;
    return !a || eq(*a, *b);
}

template<typename L, typename R, typename EqL, typename EqR>
bool same_either(const EqL& eq_l, const EqR& eq_r, const Either<L, R>& a, const Either<L, R>& b) {
    if (a.is_left() != b.is_left()) return false;
    if (a.is_left()) return eq_l(a.left_value(), b.left_value());
    return eq_r(a.right_value(), b.right_value());
}

} // namespace detail

// ============================================================
// Prism laws
// ============================================================

/// @brief Check laws 1-3 and the modify/set consistency on samples
/// @param sources Values to match against (mix matching and non-matching ones)
/// @param foci    Values to reconstruct from and to set
/// @param fn      A pure A -> A update used for modify checks
template<typename S, typename A, typename Fn,
         typename EqS = std::equal_to<>, typename EqA = std::equal_to<>>
    requires FocusTransformer<Fn&, A, A> && EqualityComparator<EqS, S> && EqualityComparator<EqA, A>
[[nodiscard]] LawReport check_prism_laws(const Prism<S, A>& prism,
                                         std::type_identity_t<std::span<const S>> sources,
                                         std::type_identity_t<std::span<const A>> foci,
                                         Fn&& fn, EqS eq_s = {}, EqA eq_a = {}) {
    LawReport report{"check_prism_laws"};

    for (std::size_t i = 0; i < sources.size(); ++i) {
        const S& s = sources[i];
        auto matched = prism.try_match(s);

        if (matched.is_right()) {
            report.expect(eq_s(prism.reconstruct(matched.right_value()), s), law::round_trip_on_match, i,
                          [&] { return "reconstruct(match(s)) != s for s = " + detail::describe(s); });

            auto modified = prism.modify_with(s, fn);
            auto optionally_modified = prism.modify_optional(s, fn);
            report.expect(optionally_modified.has_value() && eq_s(*optionally_modified, modified),
                          law::modify_optional_consistency, i,
                          [&] { return "modify_optional disagrees with modify_with for s = " + detail::describe(s); });
        } else {
            const S& unchanged = matched.left_value();
            report.expect(eq_s(unchanged, s), law::no_match_inert, i,
                          [&] { return "try_match altered non-matching s = " + detail::describe(s); });
            report.expect(eq_s(prism.modify_with(s, fn), unchanged), law::no_match_inert, i,
                          [&] { return "modify_with changed non-matching s = " + detail::describe(s); });
            report.expect(!prism.modify_optional(s, fn).has_value(), law::no_match_inert, i,
                          [&] { return "modify_optional matched non-matching s = " + detail::describe(s); });
            for (const A& b : foci) {
                report.expect(eq_s(prism.set_with(s, b), unchanged), law::no_match_inert, i,
                              [&] { return "set_with changed non-matching s = " + detail::describe(s); });
                report.expect(!prism.set_optional(s, b).has_value(), law::no_match_inert, i,
                              [&] { return "set_optional matched non-matching s = " + detail::describe(s); });
            }
        }

        for (const A& b : foci) {
            report.expect(eq_s(prism.set_with(s, b), prism.modify_with(s, [&b](const A&) { return b; })),
                          law::modify_set_consistency, i,
                          [&] { return "set_with(s, b) != modify_with(s, _ -> b) for b = " + detail::describe(b); });
        }
    }

    for (std::size_t j = 0; j < foci.size(); ++j) {
        auto rematched = prism.try_match(prism.reconstruct(foci[j]));
        report.expect(rematched.is_right() && eq_a(rematched.right_value(), foci[j]), law::reconstruct_then_match, j,
                      [&] { return "try_match(reconstruct(b)) != Right(b) for b = " + detail::describe(foci[j]); });
    }

    return report;
}

/// @brief Check that every weaker view behaves like the Prism itself
template<typename S, typename A, typename Fn,
         typename EqS = std::equal_to<>, typename EqA = std::equal_to<>>
    requires FocusTransformer<Fn&, A, A> && EqualityComparator<EqS, S> && EqualityComparator<EqA, A>
[[nodiscard]] LawReport check_prism_views(const Prism<S, A>& prism,
                                          std::type_identity_t<std::span<const S>> sources,
                                          std::type_identity_t<std::span<const A>> foci,
                                          Fn&& fn, EqS eq_s = {}, EqA eq_a = {}) {
    LawReport report{"check_prism_views"};

    const auto fold = prism.as_fold();
    const auto setter = prism.as_setter();
    const auto traversal = prism.as_traversal();
    const auto optional = prism.as_optional();
    auto lifted = [&fn](const A& a) { return std::optional<A>{std::invoke(fn, a)}; };

    for (std::size_t i = 0; i < sources.size(); ++i) {
        const S& s = sources[i];
        const auto expected_match = prism.match_option(s);
        const S expected_modify = prism.modify_with(s, fn);
        const auto expected_effect = prism.template modify_with_effect<optional_effect>(s, lifted);
        auto describe_s = [&] { return "s = " + detail::describe(s); };

        // Fold
        const auto all = fold.get_all(s);
        report.expect(all.size() == (expected_match ? 1u : 0u) && detail::same_option(eq_a, fold.first(s), expected_match),
                      law::fold_view, i, describe_s);

        // Setter
        report.expect(eq_s(setter.modify(s, fn), expected_modify), law::setter_view, i, describe_s);

        // Traversal
        report.expect(eq_s(traversal.modify(s, fn), expected_modify), law::traversal_view, i, describe_s);
        report.expect(eq_s(traversal.template modify_with_effect<identity_effect>(s, fn), expected_modify),
                      law::traversal_view, i, describe_s);
        report.expect(detail::same_option(eq_s, traversal.template modify_with_effect<optional_effect>(s, lifted),
                                          expected_effect),
                      law::traversal_view, i, describe_s);

        // Optional
        report.expect(detail::same_either(eq_s, eq_a, optional.get_or_modify(s), prism.try_match(s)),
                      law::optional_view, i, describe_s);
        report.expect(detail::same_option(eq_a, optional.get_option(s), expected_match), law::optional_view, i, describe_s);
        report.expect(eq_s(optional.modify(s, fn), expected_modify), law::optional_view, i, describe_s);
        report.expect(detail::same_option(eq_s, optional.template modify_with_effect<optional_effect>(s, lifted),
                                          expected_effect),
                      law::optional_view, i, describe_s);

        for (const A& b : foci) {
            const S expected_set = prism.set_with(s, b);
            report.expect(eq_s(setter.set(s, b), expected_set), law::setter_view, i, describe_s);
            report.expect(eq_s(traversal.set(s, b), expected_set), law::traversal_view, i, describe_s);
            report.expect(eq_s(optional.set(s, b), expected_set), law::optional_view, i, describe_s);
        }
    }

    return report;
}

// ============================================================
// Composition laws
// ============================================================

/// @brief Check that (p | q) | r and p | (q | r) are observably identical
/// @param foci Innermost foci used for reconstruct comparisons
/// @param fn   A pure C -> C update used for modify comparisons
template<typename S, typename A, typename B, typename C, typename Fn,
         typename EqS = std::equal_to<>, typename EqC = std::equal_to<>>
    requires FocusTransformer<Fn&, C, C> && EqualityComparator<EqS, S> && EqualityComparator<EqC, C>
[[nodiscard]] LawReport check_compose_associativity(const Prism<S, A>& p, const Prism<A, B>& q, const Prism<B, C>& r,
                                                    std::type_identity_t<std::span<const S>> sources,
                                                    std::type_identity_t<std::span<const C>> foci,
                                                    Fn&& fn, EqS eq_s = {}, EqC eq_c = {}) {
    LawReport report{"check_compose_associativity"};

    const Prism<S, C> left_nested = (p | q) | r;
    const Prism<S, C> right_nested = p | (q | r);

    for (std::size_t i = 0; i < sources.size(); ++i) {
        const S& s = sources[i];
        auto describe_s = [&] { return "s = " + detail::describe(s); };
        report.expect(detail::same_either(eq_s, eq_c, left_nested.try_match(s), right_nested.try_match(s)),
                      law::compose_associativity, i, describe_s);
        report.expect(eq_s(left_nested.modify_with(s, fn), right_nested.modify_with(s, fn)),
                      law::compose_associativity, i, describe_s);
    }
    for (std::size_t j = 0; j < foci.size(); ++j) {
        report.expect(eq_s(left_nested.reconstruct(foci[j]), right_nested.reconstruct(foci[j])),
                      law::compose_associativity, j,
                      [&] { return "reconstruct differs for c = " + detail::describe(foci[j]); });
    }

    return report;
}

/// @brief Check that identity_prism() is a left and right unit of composition for p
template<typename S, typename A, typename EqS = std::equal_to<>, typename EqA = std::equal_to<>>
    requires EqualityComparator<EqS, S> && EqualityComparator<EqA, A>
[[nodiscard]] LawReport check_identity_laws(const Prism<S, A>& p,
                                            std::type_identity_t<std::span<const S>> sources,
                                            std::type_identity_t<std::span<const A>> foci,
                                            EqS eq_s = {}, EqA eq_a = {}) {
    LawReport report{"check_identity_laws"};

    const Prism<S, A> left_unit = identity_prism<S>() | p;
    const Prism<S, A> right_unit = p | identity_prism<A>();

    for (std::size_t i = 0; i < sources.size(); ++i) {
        const S& s = sources[i];
        auto describe_s = [&] { return "s = " + detail::describe(s); };
        const auto expected = p.try_match(s);
        report.expect(detail::same_either(eq_s, eq_a, left_unit.try_match(s), expected), law::left_identity, i, describe_s);
        report.expect(detail::same_either(eq_s, eq_a, right_unit.try_match(s), expected), law::right_identity, i, describe_s);
    }
    for (std::size_t j = 0; j < foci.size(); ++j) {
        const S expected = p.reconstruct(foci[j]);
        auto describe_b = [&] { return "b = " + detail::describe(foci[j]); };
        report.expect(eq_s(left_unit.reconstruct(foci[j]), expected), law::left_identity, j, describe_b);
        report.expect(eq_s(right_unit.reconstruct(foci[j]), expected), law::right_identity, j, describe_b);
    }

    return report;
}

} // namespace lager_optics
