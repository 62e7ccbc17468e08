#pragma once

#include <cz/vector.hpp>

namespace lens {

/// Undoes something when disposed: unsubscribes a listener, clears state, etc.
struct Disposable {
    void (*dispose)(void* data);
    void* data;
};

/// Dispose every element in order.  `disposables` is emptied before
/// the first one runs so disposing again from inside one is a no-op.
void dispose_all(cz::Vector<Disposable>* disposables);

}
