#include <czt/test_base.hpp>

#include "core/placement.hpp"

using namespace lens;

static Window_Geometry make_geometry(uint64_t columns, bool wrap) {
    Window_Geometry geometry;
    geometry.columns = columns;
    geometry.gutter_columns = 4;
    geometry.wrap_long_lines = wrap;
    geometry.command_line = false;
    return geometry;
}

TEST_CASE("remaining_columns no wrap") {
    CHECK(remaining_columns(0, 80, false) == 80);
    CHECK(remaining_columns(30, 80, false) == 50);
    CHECK(remaining_columns(80, 80, false) == 0);
    CHECK(remaining_columns(200, 80, false) == 0);
}

TEST_CASE("remaining_columns wrap") {
    CHECK(remaining_columns(30, 80, true) == 50);
    CHECK(remaining_columns(80, 80, true) == 0);
    CHECK(remaining_columns(81, 80, true) == 79);
    CHECK(remaining_columns(170, 80, true) == 70);
    CHECK(remaining_columns(0, 80, true) == 0);
}

TEST_CASE("remaining_columns window narrower than the gutter") {
    CHECK(remaining_columns(10, 0, false) == 0);
    CHECK(remaining_columns(10, -3, true) == 0);
}

TEST_CASE("fits_inline needs a spare column") {
    Window_Geometry geometry = make_geometry(44, false);
    CHECK(fits_inline(30, geometry, 9));
    CHECK_FALSE(fits_inline(30, geometry, 10));
    CHECK_FALSE(fits_inline(30, geometry, 11));
}

TEST_CASE("decide_placement") {
    Match_Span span = {{3, 5}, {3, 9}};
    Window_Geometry geometry = make_geometry(44, false);

    Placement_Decision decision = decide_placement(Float_When::AUTO, span, 10, geometry, 8);
    CHECK(decision.mode == Placement_Mode::INLINE);
    CHECK(decision.anchor == span.start);

    decision = decide_placement(Float_When::AUTO, span, 35, geometry, 8);
    CHECK(decision.mode == Placement_Mode::FLOATING);
    CHECK(decision.anchor.line == 3);
    CHECK(decision.anchor.column == 10);

    decision = decide_placement(Float_When::ALWAYS, span, 10, geometry, 8);
    CHECK(decision.mode == Placement_Mode::FLOATING);

    decision = decide_placement(Float_When::NEVER, span, 35, geometry, 8);
    CHECK(decision.mode == Placement_Mode::INLINE);
}

TEST_CASE("decide_placement command line window is always inline") {
    Match_Span span = {{1, 1}, {1, 3}};
    Window_Geometry geometry = make_geometry(44, false);
    geometry.command_line = true;

    Placement_Decision decision = decide_placement(Float_When::ALWAYS, span, 10, geometry, 8);
    CHECK(decision.mode == Placement_Mode::INLINE);
}
