#include <czt/test_base.hpp>

#include "core/match_index.hpp"

using namespace lens;

TEST_CASE("Match_Index lines") {
    static Match_Span spans[] = {
        {{1, 1}, {1, 4}},
        {{5, 3}, {6, 1}},
        {{5, 10}, {5, 13}},
    };
    Match_Index index = {spans};
    REQUIRE(index.len() == 3);
    CHECK(index.line_of(0) == 1);
    CHECK(index.line_of(1) == 5);
    CHECK(index.line_of(2) == 5);
    CHECK(index[1].end.line == 6);
    CHECK(index[1].end.column == 1);
    index.check_ordering();
}

TEST_CASE("compare_positions") {
    CHECK(compare_positions({1, 5}, {2, 1}) < 0);
    CHECK(compare_positions({2, 1}, {1, 5}) > 0);
    CHECK(compare_positions({3, 2}, {3, 7}) < 0);
    CHECK(compare_positions({3, 7}, {3, 7}) == 0);
}
