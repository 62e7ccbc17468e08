#pragma once

#include <stdint.h>
#include <cz/vector.hpp>
#include "core/disposable.hpp"

namespace lens {

namespace Event_Type_ {
enum Event_Type {
    CURSOR_MOVED,
    TEXT_CHANGED,
    TEXT_CHANGED_INSERT,
    /// A terminal buffer went into insert mode.
    TERM_ENTER,
    /// The search pattern or its direction changed.
    REGION_CHANGED,

    // Special value representing the number of values in the enum.
    length,
};
}
using Event_Type_::Event_Type;

struct Event_Listener {
    uint64_t id;
    void (*callback)(void* data);
    void* data;
};

/// The host emits editor events here and the engine listens to them.
struct Event_Bus {
    cz::Vector<Event_Listener> listeners[Event_Type::length];
    uint64_t next_id;

    uint64_t subscribe(Event_Type type, void (*callback)(void* data), void* data);

    /// Returns `false` if `id` isn't subscribed to `type`.
    bool unsubscribe(Event_Type type, uint64_t id);

    /// Invoke the listeners of `type` in the order they subscribed.  Listeners that
    /// are unsubscribed by an earlier listener during the emit are not invoked.
    void emit(Event_Type type);

    void drop();
};

/// Subscribe to `type` and push a `Disposable` that unsubscribes onto `disposables`.
void subscribe(Event_Bus* bus,
               Event_Type type,
               void (*callback)(void* data),
               void* data,
               cz::Vector<Disposable>* disposables);

}
