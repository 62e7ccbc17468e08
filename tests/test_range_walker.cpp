#include <czt/test_base.hpp>

#include <cz/defer.hpp>
#include <cz/heap.hpp>
#include "core/range_walker.hpp"

using namespace lens;

namespace {
struct Walk {
    cz::Vector<Lens_Entry> entries = {};
    Nearest_Info nearest;

    ~Walk() { entries.drop(cz::heap_allocator()); }

    void run(cz::Slice<Match_Span> spans,
             Position point,
             bool forward,
             Visible_Range viewport,
             Fold_Range fold = no_fold) {
        Match_Index index = {spans};
        Cursor_State cursor = {point, forward};
        REQUIRE(resolve_nearest(index, cursor, viewport, fold, &nearest));
        walk_lens_range(index, nearest, &entries);
    }

    void check_entry(size_t i, uint64_t line, size_t match_index, int64_t relative_index) {
        REQUIRE(i < entries.len);
        CHECK(entries[i].line == line);
        CHECK(entries[i].match_index == match_index);
        CHECK(entries[i].relative_index == relative_index);
        CHECK_FALSE(entries[i].nearest);
    }
};
}

TEST_CASE("walk_lens_range matches on one line collapse into the last") {
    Match_Span spans[] = {
        {{1, 1}, {1, 4}},
        {{5, 3}, {5, 6}},
        {{5, 10}, {5, 13}},
    };

    Walk walk;
    walk.run(spans, {1, 1}, true, {1, 20});
    CHECK(walk.nearest.index == 0);
    CHECK(walk.nearest.relative_index == 0);
    REQUIRE(walk.entries.len == 1);
    walk.check_entry(0, 5, 2, 2);
}

TEST_CASE("walk_lens_range one match per line") {
    Match_Span spans[] = {
        {{1, 1}, {1, 3}}, {{2, 1}, {2, 3}}, {{4, 1}, {4, 3}},
        {{5, 1}, {5, 3}}, {{6, 1}, {6, 3}},
    };

    Walk walk;
    walk.run(spans, {3, 1}, true, {1, 20});
    CHECK(walk.nearest.index == 2);
    CHECK(walk.nearest.relative_index == 1);
    REQUIRE(walk.entries.len == 4);
    walk.check_entry(0, 1, 0, -2);
    walk.check_entry(1, 2, 1, -1);
    walk.check_entry(2, 5, 3, 2);
    walk.check_entry(3, 6, 4, 3);
}

TEST_CASE("walk_lens_range backward search") {
    Match_Span spans[] = {
        {{1, 1}, {1, 3}}, {{2, 1}, {2, 3}}, {{4, 1}, {4, 3}},
        {{5, 1}, {5, 3}}, {{6, 1}, {6, 3}},
    };

    Walk walk;
    walk.run(spans, {3, 1}, false, {1, 20});
    CHECK(walk.nearest.index == 1);
    CHECK(walk.nearest.relative_index == -1);
    REQUIRE(walk.entries.len == 4);
    walk.check_entry(0, 1, 0, -2);
    walk.check_entry(1, 4, 2, 1);
    walk.check_entry(2, 5, 3, 2);
    walk.check_entry(3, 6, 4, 3);
}

TEST_CASE("walk_lens_range stays inside the viewport") {
    Match_Span spans[] = {
        {{1, 1}, {1, 3}}, {{2, 1}, {2, 3}}, {{4, 1}, {4, 3}},
        {{5, 1}, {5, 3}}, {{6, 1}, {6, 3}},
    };

    Walk walk;
    walk.run(spans, {3, 1}, true, {2, 5});
    REQUIRE(walk.entries.len == 2);
    walk.check_entry(0, 2, 1, -1);
    walk.check_entry(1, 5, 3, 2);
}

TEST_CASE("walk_lens_range lines are unique and sorted") {
    Match_Span spans[] = {
        {{1, 1}, {1, 2}},  {{1, 5}, {1, 6}},  {{2, 1}, {2, 2}},   {{3, 1}, {3, 2}},
        {{3, 4}, {3, 5}},  {{3, 8}, {3, 9}},  {{7, 1}, {7, 2}},   {{8, 1}, {8, 2}},
        {{8, 3}, {8, 4}},  {{9, 1}, {9, 2}},  {{12, 1}, {12, 2}}, {{15, 1}, {15, 2}},
    };

    for (uint64_t line = 1; line <= 16; ++line) {
        for (int forward = 0; forward < 2; ++forward) {
            Walk walk;
            Visible_Range viewport = {2, 12};
            walk.run(spans, {line, 3}, forward, viewport);
            uint64_t nearest_line = spans[walk.nearest.index].start.line;
            for (size_t i = 0; i < walk.entries.len; ++i) {
                CHECK(viewport.contains(walk.entries[i].line));
                CHECK(walk.entries[i].line != nearest_line);
                CHECK(spans[walk.entries[i].match_index].start.line == walk.entries[i].line);
                if (i > 0) {
                    CHECK(walk.entries[i - 1].line < walk.entries[i].line);
                }
            }
        }
    }
}

TEST_CASE("walk_lens_range skips matches in the cursor's fold") {
    Match_Span spans[] = {
        {{1, 1}, {1, 3}}, {{3, 1}, {3, 3}}, {{4, 1}, {4, 3}},
        {{5, 1}, {5, 3}}, {{8, 1}, {8, 3}},
    };

    Walk walk;
    walk.run(spans, {5, 10}, false, {1, 20}, {3, 5});
    CHECK(walk.nearest.index == 3);
    CHECK(walk.nearest.relative_index == -1);
    REQUIRE(walk.entries.len == 2);
    walk.check_entry(0, 1, 0, -1);
    walk.check_entry(1, 8, 4, 1);
}

TEST_CASE("walk_lens_range skips the cursor's fold searching forward") {
    Match_Span spans[] = {
        {{1, 1}, {1, 3}}, {{3, 1}, {3, 3}}, {{4, 1}, {4, 3}},
        {{5, 1}, {5, 3}}, {{8, 1}, {8, 3}},
    };

    Walk walk;
    walk.run(spans, {3, 1}, true, {1, 20}, {3, 5});
    CHECK(walk.nearest.index == 1);
    CHECK(walk.nearest.relative_index == 0);
    REQUIRE(walk.entries.len == 2);
    walk.check_entry(0, 1, 0, -1);
    walk.check_entry(1, 8, 4, 1);
}

TEST_CASE("walk_lens_range single match") {
    Match_Span spans[] = {
        {{4, 2}, {4, 5}},
    };

    Walk walk;
    walk.run(spans, {1, 1}, true, {1, 20});
    CHECK(walk.nearest.index == 0);
    CHECK(walk.entries.len == 0);
}
