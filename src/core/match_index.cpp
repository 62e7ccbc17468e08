#include "match_index.hpp"

#include <tracy/Tracy.hpp>

namespace lens {

void Match_Index::check_ordering() const {
    ZoneScoped;

    for (size_t i = 1; i < spans.len; ++i) {
        CZ_ASSERT(compare_positions(spans[i - 1].start, spans[i].start) < 0);
    }
}

}
