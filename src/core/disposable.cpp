#include "disposable.hpp"

#include <cz/defer.hpp>
#include <cz/heap.hpp>

namespace lens {

void dispose_all(cz::Vector<Disposable>* disposables) {
    cz::Vector<Disposable> pending = *disposables;
    *disposables = {};
    CZ_DEFER(pending.drop(cz::heap_allocator()));

    for (size_t i = 0; i < pending.len; ++i) {
        pending[i].dispose(pending[i].data);
    }
}

}
