// test_lager_adapters.cpp - Tests for lager interoperability
// to_lager_lens, from_lager_lens, from_lager_optional_lens, cursor zooming

#include <catch2/catch_all.hpp>
#include <lager_optics/lager_adapters.h>
#include <lager_optics/prisms.h>

#include <lager/cursor.hpp>
#include <lager/lenses.hpp>
#include <lager/lenses/attr.hpp>
#include <lager/state.hpp>
#include <zug/compose.hpp>

#include <optional>
#include <string>
#include <variant>

using namespace lager_optics;

namespace {

struct Circle {
    int radius = 0;
    bool operator==(const Circle&) const = default;
};

struct Square {
    int side = 0;
    bool operator==(const Square&) const = default;
};

using Shape = std::variant<Circle, Square>;

struct Document {
    std::string title;
    Shape shape;
    std::optional<std::string> note;
    bool operator==(const Document&) const = default;
};

Prism<Shape, Circle> circle() {
    return alternative<Circle, Shape>();
}

} // namespace

// ============================================================
// lager_optics -> lager
// ============================================================

TEST_CASE("prism as a lager lens onto an optional", "[lager][to_lager]") {
    auto lens = to_lager_lens(circle());
    const Shape round = Circle{2};
    const Shape boxy = Square{3};

    SECTION("view") {
        REQUIRE(lager::view(lens, round) == std::optional<Circle>{Circle{2}});
        REQUIRE_FALSE(lager::view(lens, boxy).has_value());
    }

    SECTION("set an engaged part") {
        REQUIRE(lager::set(lens, round, std::optional<Circle>{Circle{7}}) == Shape{Circle{7}});
        REQUIRE(lager::set(lens, boxy, std::optional<Circle>{Circle{7}}) == boxy);
    }

    SECTION("set an empty part leaves the whole") {
        REQUIRE(lager::set(lens, round, std::optional<Circle>{}) == round);
        // so viewing after an empty write still finds the old focus
        REQUIRE(lager::view(lens, lager::set(lens, round, std::optional<Circle>{})) ==
                std::optional<Circle>{Circle{2}});
    }

    SECTION("over") {
        auto grow = [](std::optional<Circle> c) {
            if (c) c->radius *= 10;
            return c;
        };
        REQUIRE(lager::over(lens, round, grow) == Shape{Circle{20}});
        REQUIRE(lager::over(lens, boxy, grow) == boxy);
    }
}

TEST_CASE("prism lens composes with lager lenses", "[lager][to_lager][compose]") {
    auto doc_circle = zug::comp(lager::lenses::attr(&Document::shape), to_lager_lens(circle()));
    const Document doc{"drawing", Circle{1}, std::nullopt};

    REQUIRE(lager::view(doc_circle, doc) == std::optional<Circle>{Circle{1}});

    auto updated = lager::set(doc_circle, doc, std::optional<Circle>{Circle{4}});
    REQUIRE(updated.title == "drawing");
    REQUIRE(updated.shape == Shape{Circle{4}});
}

TEST_CASE("lens as a lager lens", "[lager][to_lager]") {
    Lens<Circle, int> radius{[](const Circle& c) { return c.radius; },
                             [](const Circle&, int r) { return Circle{r}; }};
    auto lens = to_lager_lens(radius);

    REQUIRE(lager::view(lens, Circle{3}) == 3);
    REQUIRE(lager::set(lens, Circle{3}, 8) == Circle{8});
}

TEST_CASE("prism lens drives a zoomed cursor", "[lager][cursor]") {
    auto state = lager::make_state(Shape{Circle{1}}, lager::automatic_tag{});
    lager::cursor<std::optional<Circle>> focus = state.zoom(to_lager_lens(circle()));

    REQUIRE(focus.get() == std::optional<Circle>{Circle{1}});

    focus.set(std::optional<Circle>{Circle{5}});
    REQUIRE(state.get() == Shape{Circle{5}});

    state.set(Shape{Square{2}});
    REQUIRE_FALSE(focus.get().has_value());

    // Writing through a non-matching focus is inert
    focus.set(std::optional<Circle>{Circle{9}});
    REQUIRE(state.get() == Shape{Square{2}});
}

// ============================================================
// lager -> lager_optics
// ============================================================

TEST_CASE("lager lens as a Lens", "[lager][from_lager]") {
    auto title = from_lager_lens<Document, std::string>(lager::lenses::attr(&Document::title));
    const Document doc{"a", Square{1}, std::nullopt};

    REQUIRE(title.get(doc) == "a");
    REQUIRE(title.set(doc, "b").title == "b");
    REQUIRE(title.modify(doc, [](std::string s) { return s + "!"; }).title == "a!");
}

TEST_CASE("lager lens composed with a prism", "[lager][from_lager][compose]") {
    auto shape = from_lager_lens<Document, Shape>(lager::lenses::attr(&Document::shape));
    Optional<Document, Circle> doc_circle = shape.as_optional() | circle().as_optional();

    const Document round{"r", Circle{2}, std::nullopt};
    const Document boxy{"b", Square{2}, std::nullopt};

    REQUIRE(doc_circle.get_option(round) == std::optional<Circle>{Circle{2}});
    REQUIRE_FALSE(doc_circle.get_option(boxy).has_value());
    REQUIRE(doc_circle.set(round, Circle{6}).shape == Shape{Circle{6}});
    REQUIRE(doc_circle.set(boxy, Circle{6}) == boxy);
}

TEST_CASE("lager lens onto an optional as an Optional", "[lager][from_lager]") {
    auto note = from_lager_optional_lens<Document, std::string>(lager::lenses::attr(&Document::note));
    const Document with_note{"t", Circle{1}, std::string{"hello"}};
    const Document without_note{"t", Circle{1}, std::nullopt};

    REQUIRE(note.get_option(with_note) == std::optional<std::string>{"hello"});
    REQUIRE_FALSE(note.get_option(without_note).has_value());
    REQUIRE(note.get_or_modify(without_note).left_value() == without_note);

    REQUIRE(note.set(with_note, "bye").note == std::optional<std::string>{"bye"});
    REQUIRE(note.set(without_note, "bye") == without_note);
    REQUIRE(note.modify(with_note, [](std::string s) { return s + "!"; }).note == std::optional<std::string>{"hello!"});
}
