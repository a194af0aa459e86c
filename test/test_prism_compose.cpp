// test_prism_compose.cpp - Tests for composing a Prism with every optic kind
// Prism | Prism nesting, associativity, identity, result kinds

#include <catch2/catch_all.hpp>
#include <lager_optics/category.h>
#include <lager_optics/effect.h>
#include <lager_optics/monoid.h>
#include <lager_optics/prism.h>
#include <lager_optics/prisms.h>

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

using namespace lager_optics;

namespace {

using IntOrText = std::variant<int, std::string>;

struct Circle {
    int radius = 0;
    int center = 0;
    bool operator==(const Circle&) const = default;
};

struct Square {
    int side = 0;
    bool operator==(const Square&) const = default;
};

using Shape = std::variant<Circle, Square>;

Prism<IntOrText, int> int_case() {
    return alternative<int, IntOrText>();
}

// Even integers, focus is the integer itself
Prism<int, int> even() {
    return make_prism<int, int>(
        [](int i) -> std::optional<int> {
            if (i % 2 == 0) return i;
            return std::nullopt;
        },
        [](int i) { return i; });
}

// Even integers, focus is half of the integer
Prism<int, int> halved() {
    return make_prism<int, int>(
        [](int i) -> std::optional<int> {
            if (i % 2 == 0) return i / 2;
            return std::nullopt;
        },
        [](int h) { return h * 2; });
}

Prism<int, int> non_negative() {
    return make_prism<int, int>(
        [](int i) -> std::optional<int> {
            if (i >= 0) return i;
            return std::nullopt;
        },
        [](int i) { return i; });
}

Lens<Circle, int> radius() {
    return {[](const Circle& c) { return c.radius; },
            [](const Circle& c, int r) { return Circle{r, c.center}; }};
}

Optional<Circle, int> positive_radius() {
    return {[](const Circle& c) -> Either<Circle, int> {
                if (c.radius > 0) return right(c.radius);
                return left(c);
            },
            [](const Circle& c, int r) { return c.radius > 0 ? Circle{r, c.center} : c; }};
}

} // namespace

// ============================================================
// Prism | Prism
// ============================================================

TEST_CASE("nested prism keeps the outer variant on inner mismatch", "[compose][prism]") {
    auto even_int = int_case() | even();
    STATIC_REQUIRE(std::is_same_v<decltype(even_int), Prism<IntOrText, int>>);

    SECTION("both match") {
        REQUIRE(even_int.try_match(IntOrText{4}).right_value() == 4);
        REQUIRE(even_int.modify_with(IntOrText{4}, [](int x) { return x + 2; }) == IntOrText{6});
    }

    SECTION("inner mismatch rebuilds the outer alternative") {
        auto matched = even_int.try_match(IntOrText{3});
        REQUIRE(matched.is_left());
        REQUIRE(matched.left_value() == IntOrText{3});
        REQUIRE(even_int.modify_with(IntOrText{3}, [](int x) { return x + 2; }) == IntOrText{3});
    }

    SECTION("outer mismatch passes through") {
        auto matched = even_int.try_match(IntOrText{std::string{"a"}});
        REQUIRE(matched.is_left());
        REQUIRE(matched.left_value() == IntOrText{std::string{"a"}});
    }

    SECTION("reconstruct composes inner then outer") {
        REQUIRE(even_int.reconstruct(8) == IntOrText{8});
        auto half_of_int = int_case() | halved();
        REQUIRE(half_of_int.reconstruct(8) == IntOrText{16});
        REQUIRE(half_of_int.match_option(IntOrText{16}) == std::optional<int>{8});
    }
}

TEST_CASE("prism composition is associative", "[compose][prism][associativity]") {
    auto p = int_case();
    auto q = halved();
    auto r = non_negative();

    auto left_nested = (p | q) | r;
    auto right_nested = p | (q | r);

    auto input = GENERATE(as<IntOrText>{}, IntOrText{8}, IntOrText{-8}, IntOrText{7}, IntOrText{0},
                          IntOrText{std::string{"x"}});
    auto inc = [](int x) { return x + 1; };

    INFO("index " << input.index());
    REQUIRE(left_nested.try_match(input) == right_nested.try_match(input));
    REQUIRE(left_nested.modify_with(input, inc) == right_nested.modify_with(input, inc));
    REQUIRE(left_nested.set_optional(input, 5) == right_nested.set_optional(input, 5));
    REQUIRE(left_nested.reconstruct(3) == right_nested.reconstruct(3));
}

TEST_CASE("identity prism is a unit", "[compose][prism][category]") {
    auto p = int_case() | even();
    auto left_unit = prism_category::compose(p, prism_category::id<IntOrText>());
    auto right_unit = prism_category::compose(prism_category::id<int>(), p);

    for (const IntOrText& s : {IntOrText{2}, IntOrText{3}, IntOrText{std::string{"b"}}}) {
        REQUIRE(left_unit.try_match(s) == p.try_match(s));
        REQUIRE(right_unit.try_match(s) == p.try_match(s));
    }
    REQUIRE(left_unit.reconstruct(6) == p.reconstruct(6));
    REQUIRE(right_unit.reconstruct(6) == p.reconstruct(6));
}

TEST_CASE("prism_category compose is right-to-left", "[compose][category]") {
    // compose(f, g) runs g first, like function composition
    auto composed = prism_category::compose(halved(), int_case());
    REQUIRE(composed.match_option(IntOrText{10}) == std::optional<int>{5});
    REQUIRE(composed.reconstruct(5) == IntOrText{10});
}

// ============================================================
// Prism with the other kinds
// ============================================================

TEST_CASE("prism | iso stays a prism", "[compose][iso]") {
    Iso<int, std::string> as_text{[](const int& i) { return std::to_string(i); },
                                  [](std::string s) { return std::stoi(s); }};
    auto text = int_case() | as_text;
    STATIC_REQUIRE(optic_kind_v<decltype(text)> == OpticKind::Prism);

    REQUIRE(text.match_option(IntOrText{42}) == std::optional<std::string>{"42"});
    REQUIRE_FALSE(text.match_option(IntOrText{std::string{"42"}}).has_value());
    REQUIRE(text.reconstruct("7") == IntOrText{7});
}

TEST_CASE("prism | iso with a type-changing update", "[compose][iso][polymorphic]") {
    BasicIso<int, std::string, long, std::string> widen{
        [](const int& i) { return static_cast<long>(i); },
        [](std::string s) { return s; }};
    auto p = some<int, std::string>() | widen;
    STATIC_REQUIRE(std::is_same_v<decltype(p), BasicPrism<std::optional<int>, std::optional<std::string>, long, std::string>>);

    auto out = p.modify_with(std::optional<int>{12}, [](long l) { return std::to_string(l * 2); });
    REQUIRE(out == std::optional<std::string>{"24"});
    REQUIRE_FALSE(p.modify_with(std::optional<int>{}, [](long l) { return std::to_string(l); }).has_value());
}

TEST_CASE("prism | prism with a type-changing update", "[compose][prism][polymorphic]") {
    using Outer = std::optional<std::optional<int>>;
    using Rebuilt = std::optional<std::optional<std::string>>;

    auto p = some<std::optional<int>, std::optional<std::string>>() | some<int, std::string>();
    STATIC_REQUIRE(std::is_same_v<decltype(p), BasicPrism<Outer, Rebuilt, int, std::string>>);
    auto show = [](int i) { return std::to_string(i); };

    SECTION("inner mismatch is rebuilt under the outer layer") {
        const Outer inner_empty{std::optional<int>{}};
        auto matched = p.try_match(inner_empty);
        REQUIRE(matched.is_left());
        REQUIRE(matched.left_value() == Rebuilt{std::optional<std::string>{}});
        REQUIRE(p.modify_with(inner_empty, show) == Rebuilt{std::optional<std::string>{}});
        REQUIRE_FALSE(p.modify_optional(inner_empty, show).has_value());
    }

    SECTION("outer mismatch stays empty") {
        const Outer outer_empty{};
        REQUIRE(p.try_match(outer_empty).left_value() == Rebuilt{});
        REQUIRE(p.modify_with(outer_empty, show) == Rebuilt{});
    }

    SECTION("match and reconstruct") {
        const Outer full{std::optional<int>{7}};
        REQUIRE(p.try_match(full).right_value() == 7);
        REQUIRE(p.modify_with(full, show) == Rebuilt{std::optional<std::string>{"7"}});
        REQUIRE(p.reconstruct("x") == Rebuilt{std::optional<std::string>{"x"}});
    }
}

TEST_CASE("prism | lens gives an optional", "[compose][lens]") {
    auto circle_radius = alternative<Circle, Shape>() | radius();
    STATIC_REQUIRE(optic_kind_v<decltype(circle_radius)> == OpticKind::Optional);

    const Shape circle = Circle{3, 1};
    const Shape square = Square{4};

    REQUIRE(circle_radius.get_option(circle) == std::optional<int>{3});
    REQUIRE_FALSE(circle_radius.get_option(square).has_value());
    REQUIRE(circle_radius.set(circle, 5) == Shape{Circle{5, 1}});
    REQUIRE(circle_radius.set(square, 5) == square);
    REQUIRE(circle_radius.modify(circle, [](int r) { return r * 2; }) == Shape{Circle{6, 1}});
    REQUIRE(circle_radius.get_or_modify(square).left_value() == square);
}

TEST_CASE("prism | optional gives an optional", "[compose][optional]") {
    auto positive = alternative<Circle, Shape>() | positive_radius();
    STATIC_REQUIRE(optic_kind_v<decltype(positive)> == OpticKind::Optional);

    const Shape flat = Circle{0, 2};
    const Shape round = Circle{4, 2};

    SECTION("both levels match") {
        REQUIRE(positive.get_option(round) == std::optional<int>{4});
        REQUIRE(positive.set(round, 9) == Shape{Circle{9, 2}});
    }

    SECTION("inner mismatch keeps the whole") {
        auto matched = positive.get_or_modify(flat);
        REQUIRE(matched.is_left());
        REQUIRE(matched.left_value() == flat);
        REQUIRE(positive.set(flat, 9) == flat);
    }

    SECTION("outer mismatch keeps the whole") {
        REQUIRE_FALSE(positive.get_option(Shape{Square{1}}).has_value());
        REQUIRE(positive.set(Shape{Square{1}}, 9) == Shape{Square{1}});
    }
}

TEST_CASE("prism | traversal gives a traversal", "[compose][traversal]") {
    auto elements = some<immer::vector<int>>() | each<int>();
    STATIC_REQUIRE(optic_kind_v<decltype(elements)> == OpticKind::Traversal);

    const std::optional<immer::vector<int>> full = immer::vector<int>{1, 2, 3};
    const std::optional<immer::vector<int>> none;

    REQUIRE(elements.get_all(full).size() == 3);
    REQUIRE(elements.get_all(none).empty());
    REQUIRE(elements.modify(full, [](int i) { return i * i; }) == std::optional<immer::vector<int>>{immer::vector<int>{1, 4, 9}});
    REQUIRE_FALSE(elements.modify(none, [](int i) { return i * i; }).has_value());

    SECTION("effectful modify through both levels") {
        auto checked = elements.modify_with_effect<optional_effect>(full, [](int i) -> std::optional<int> {
            if (i > 0) return -i;
            return std::nullopt;
        });
        REQUIRE(checked == std::optional<std::optional<immer::vector<int>>>{immer::vector<int>{-1, -2, -3}});
    }
}

TEST_CASE("prism | setter gives a setter", "[compose][setter]") {
    Setter<Circle, int> center_setter{[](const Circle& c, const std::function<int(int)>& fn) {
        return Circle{c.radius, fn(c.center)};
    }};
    auto shift = alternative<Circle, Shape>() | center_setter;
    STATIC_REQUIRE(optic_kind_v<decltype(shift)> == OpticKind::Setter);

    REQUIRE(shift.modify(Shape{Circle{1, 1}}, [](int c) { return c + 10; }) == Shape{Circle{1, 11}});
    REQUIRE(shift.set(Shape{Square{2}}, 0) == Shape{Square{2}});
}

TEST_CASE("prism | fold and prism | getter give a fold", "[compose][fold][getter]") {
    Fold<Circle, int> numbers{[](const Circle& c) { return immer::vector<int>{c.radius, c.center}; }};
    Getter<Circle, int> area_ish{[](const Circle& c) { return c.radius * c.radius; }};

    auto all_numbers = alternative<Circle, Shape>() | numbers;
    auto area = alternative<Circle, Shape>() | area_ish;
    STATIC_REQUIRE(optic_kind_v<decltype(all_numbers)> == OpticKind::Fold);
    STATIC_REQUIRE(optic_kind_v<decltype(area)> == OpticKind::Fold);

    REQUIRE(all_numbers.get_all(Shape{Circle{2, 5}}) == immer::vector<int>{2, 5});
    REQUIRE(all_numbers.fold_map<sum_monoid<int>>(Shape{Circle{2, 5}}, [](int i) { return i; }) == 7);
    REQUIRE(all_numbers.is_empty(Shape{Square{2}}));

    REQUIRE(area.first(Shape{Circle{3, 0}}) == std::optional<int>{9});
    REQUIRE_FALSE(area.first(Shape{Square{3}}).has_value());
}

TEST_CASE("static result kinds agree with compose_kind", "[compose][kind]") {
    auto p = int_case();
    Iso<int, int> iso{[](const int& i) { return i; }, [](int i) { return i; }};
    Lens<int, int> lens{[](const int& i) { return i; }, [](const int&, int i) { return i; }};

    STATIC_REQUIRE(compose_kind(OpticKind::Prism, OpticKind::Prism) == optic_kind_v<decltype(p | even())>);
    STATIC_REQUIRE(compose_kind(OpticKind::Prism, OpticKind::Iso) == optic_kind_v<decltype(p | iso)>);
    STATIC_REQUIRE(compose_kind(OpticKind::Prism, OpticKind::Lens) == optic_kind_v<decltype(p | lens)>);
    STATIC_REQUIRE(compose_kind(OpticKind::Prism, OpticKind::Optional) ==
                   optic_kind_v<decltype(p | lens.as_optional())>);
}
