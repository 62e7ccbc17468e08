#include "event.hpp"

#include <cz/assert.hpp>
#include <cz/defer.hpp>
#include <cz/heap.hpp>
#include <tracy/Tracy.hpp>

namespace lens {

uint64_t Event_Bus::subscribe(Event_Type type, void (*callback)(void* data), void* data) {
    Event_Listener listener;
    listener.id = ++next_id;
    listener.callback = callback;
    listener.data = data;

    listeners[type].reserve(cz::heap_allocator(), 1);
    listeners[type].push(listener);
    return listener.id;
}

static bool find_listener(cz::Slice<Event_Listener> listeners, uint64_t id, size_t* index) {
    for (size_t i = 0; i < listeners.len; ++i) {
        if (listeners[i].id == id) {
            *index = i;
            return true;
        }
    }
    return false;
}

bool Event_Bus::unsubscribe(Event_Type type, uint64_t id) {
    size_t index;
    if (!find_listener(listeners[type], id, &index)) {
        return false;
    }
    listeners[type].remove(index);
    return true;
}

void Event_Bus::emit(Event_Type type) {
    ZoneScoped;

    if (listeners[type].len == 0) {
        return;
    }

    // Listeners can subscribe and unsubscribe while we iterate so walk over a copy.
    cz::Vector<Event_Listener> snapshot = listeners[type].clone(cz::heap_allocator());
    CZ_DEFER(snapshot.drop(cz::heap_allocator()));

    for (size_t i = 0; i < snapshot.len; ++i) {
        size_t index;
        if (!find_listener(listeners[type], snapshot[i].id, &index)) {
            continue;
        }
        snapshot[i].callback(snapshot[i].data);
    }
}

void Event_Bus::drop() {
    for (size_t i = 0; i < Event_Type::length; ++i) {
        listeners[i].drop(cz::heap_allocator());
    }
}

namespace subscription_impl {
struct Data {
    Event_Bus* bus;
    Event_Type type;
    uint64_t id;
};
}
using namespace subscription_impl;

static void subscription_dispose(void* _data) {
    Data* data = (Data*)_data;
    data->bus->unsubscribe(data->type, data->id);
    cz::heap_allocator().dealloc(data);
}

void subscribe(Event_Bus* bus,
               Event_Type type,
               void (*callback)(void* data),
               void* data,
               cz::Vector<Disposable>* disposables) {
    Data* subscription = cz::heap_allocator().alloc<Data>();
    CZ_ASSERT(subscription);
    subscription->bus = bus;
    subscription->type = type;
    subscription->id = bus->subscribe(type, callback, data);

    Disposable disposable;
    disposable.dispose = subscription_dispose;
    disposable.data = subscription;
    disposables->reserve(cz::heap_allocator(), 1);
    disposables->push(disposable);
}

}
