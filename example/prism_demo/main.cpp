// main.cpp
// Prism Example - focusing on one alternative of a sum type
//
// This example walks through:
//
// Part 1: Core operations on a variant alternative
// Part 2: Composition with prisms, lenses and traversals
// Part 3: Weaker views and effectful updates
// Part 4: Checking the laws of a hand-written prism
// Part 5: Driving a lager state through a prism

#include <lager_optics/lager_optics.h>

#include <lager/cursor.hpp>
#include <lager/state.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace lager_optics;

// ============================================================
// Domain
// ============================================================

struct Circle
{
    double radius = 0.0;
    bool operator==(const Circle&) const = default;
};

struct Polygon
{
    immer::vector<double> sides;
    bool operator==(const Polygon&) const = default;
};

using Shape = std::variant<Circle, Polygon>;

std::ostream& operator<<(std::ostream& os, const Shape& shape)
{
    if (const auto* c = std::get_if<Circle>(&shape)) {
        return os << "Circle{" << c->radius << "}";
    }
    os << "Polygon{";
    const char* sep = "";
    for (double side : std::get<Polygon>(shape).sides) {
        os << sep << side;
        sep = ", ";
    }
    return os << "}";
}

Lens<Circle, double> radius_lens()
{
    return {[](const Circle& c) { return c.radius; },
            [](const Circle&, double r) { return Circle{r}; }};
}

Lens<Polygon, immer::vector<double>> sides_lens()
{
    return {[](const Polygon& p) { return p.sides; },
            [](const Polygon&, immer::vector<double> sides) { return Polygon{std::move(sides)}; }};
}

// ============================================================
// Parts
// ============================================================

void core_operations()
{
    std::cout << "\n=== Part 1: Core operations ===\n";

    const Prism<Shape, Circle> circle = alternative<Circle, Shape>();
    const Shape round = Circle{1.5};
    const Shape square = Polygon{{2.0, 2.0, 2.0, 2.0}};
    auto grow = [](Circle c) { return Circle{c.radius * 2}; };

    std::cout << "is_matching(" << round << ") = " << circle.is_matching(round) << "\n";
    std::cout << "is_matching(" << square << ") = " << circle.is_matching(square) << "\n";
    std::cout << "modify_with(" << round << ", grow) = " << circle.modify_with(round, grow) << "\n";
    std::cout << "modify_with(" << square << ", grow) = " << circle.modify_with(square, grow) << "\n";
    std::cout << "modify_optional(" << square << ", grow) has value: "
              << circle.modify_optional(square, grow).has_value() << "\n";
    std::cout << "reconstruct(Circle{3}) = " << circle.reconstruct(Circle{3}) << "\n";
}

void composition()
{
    std::cout << "\n=== Part 2: Composition ===\n";

    const Shape round = Circle{1.5};
    const Shape triangle = Polygon{{3.0, 4.0, 5.0}};

    // Prism | Lens -> Optional
    auto radius = alternative<Circle, Shape>() | radius_lens();
    std::cout << "kind of circle | radius: " << optic_kind_v<decltype(radius)> << "\n";
    std::cout << "radius of " << round << " = " << radius.get_option(round).value_or(-1) << "\n";
    std::cout << "radius of " << triangle << " = " << radius.get_option(triangle).value_or(-1) << "\n";

    // Prism | Lens | Traversal -> Traversal
    auto sides = (alternative<Polygon, Shape>() | sides_lens()).as_traversal() | each<double>();
    std::cout << "kind of polygon | sides | each: " << optic_kind_v<decltype(sides)> << "\n";
    std::cout << "perimeter of " << triangle << " = "
              << sides.fold_map<sum_monoid<double>>(triangle, [](double s) { return s; }) << "\n";
    std::cout << "scaled " << triangle << " = " << sides.modify(triangle, [](double s) { return s * 10; }) << "\n";

    // Prism | Prism -> Prism
    auto big_circle = alternative<Circle, Shape>() |
                      make_prism<Circle, Circle>(
                          [](const Circle& c) -> std::optional<Circle> {
                              if (c.radius >= 10) return c;
                              return std::nullopt;
                          },
                          [](Circle c) { return c; });
    std::cout << "big_circle matches " << round << ": " << big_circle.is_matching(round) << "\n";
    std::cout << "big_circle matches Circle{12}: " << big_circle.is_matching(Shape{Circle{12}}) << "\n";
}

void views_and_effects()
{
    std::cout << "\n=== Part 3: Views and effects ===\n";

    const Prism<Shape, Circle> circle = alternative<Circle, Shape>();
    const Shape round = Circle{4.0};

    auto fold = circle.as_fold();
    std::cout << "as_fold().length(" << round << ") = " << fold.length(round) << "\n";

    // Fails the whole update if the new radius would be negative
    auto shrink = [](Circle c) -> std::optional<Circle> {
        if (c.radius < 5) return std::nullopt;
        return Circle{c.radius - 5};
    };
    auto shrunk = circle.modify_with_effect<optional_effect>(round, shrink);
    std::cout << "shrink(" << round << ") succeeded: " << shrunk.has_value() << "\n";

    auto candidates = circle.as_traversal().modify_with_effect<vector_effect>(
        round, [](Circle c) { return immer::vector<Circle>{Circle{c.radius / 2}, Circle{c.radius * 2}}; });
    std::cout << "candidate resizes:";
    for (const auto& s : candidates) {
        std::cout << " " << s;
    }
    std::cout << "\n";
}

void law_checking()
{
    std::cout << "\n=== Part 4: Law checking ===\n";

    // Rounds the radius: not lawful, the round trip loses the fraction
    auto rounded = make_prism<Shape, int>(
        [](const Shape& s) -> std::optional<int> {
            if (const auto* c = std::get_if<Circle>(&s)) return static_cast<int>(c->radius);
            return std::nullopt;
        },
        [](int r) { return Shape{Circle{static_cast<double>(r)}}; });

    const std::vector<Shape> shapes = {Circle{1.0}, Circle{2.5}, Polygon{{1.0}}};
    const std::vector<int> radii = {1, 7};

    auto report = check_prism_laws(rounded, shapes, radii, [](int r) { return r + 1; });
    std::cout << report.to_string() << "\n";

    try {
        report.throw_if_failed();
    } catch (const LawViolationError&) {
        std::cout << "caught LawViolationError\n";
    }
}

void lager_state()
{
    std::cout << "\n=== Part 5: lager state ===\n";

    auto state = lager::make_state(Shape{Circle{1.0}}, lager::automatic_tag{});
    lager::cursor<std::optional<Circle>> circle = state.zoom(to_lager_lens(alternative<Circle, Shape>()));

    circle.set(std::optional<Circle>{Circle{6.0}});
    std::cout << "after set through cursor: " << state.get() << "\n";

    state.set(Shape{Polygon{{1.0, 1.0, 1.0}}});
    std::cout << "cursor sees a circle: " << circle.get().has_value() << "\n";
}

int main()
{
    std::cout << std::boolalpha;

    core_operations();
    composition();
    views_and_effects();
    law_checking();
    lager_state();

    return 0;
}
