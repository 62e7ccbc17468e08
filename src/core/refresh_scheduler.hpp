#pragma once

#include <stdint.h>
#include <chrono>
#include "core/job.hpp"

namespace lens {

/// Coalesces bursts of refresh requests into one call of `callback` once requests
/// have stopped arriving for `delay`.  Forced requests skip the wait.
///
/// The pending call is a job on `jobs` tagged with `generation`.  Cancelling bumps
/// the generation so a job that is already queued becomes stale and does nothing.
struct Refresh_Scheduler {
    enum State {
        IDLE,
        PENDING,
        CANCELLED,
    };

    State state;
    uint64_t generation;
    bool force;
    Time_Point deadline;
    std::chrono::milliseconds delay;

    Job_Queue* jobs;
    void (*callback)(bool force, void* data);
    void* callback_data;

    void init(Job_Queue* jobs,
              std::chrono::milliseconds delay,
              void (*callback)(bool force, void* data),
              void* callback_data);

    /// Allow requests again after `cancel`.
    void arm();

    /// Ask for a refresh.  If `force` then any pending call is dropped and
    /// `callback` is invoked before returning.  Otherwise the call is
    /// postponed until `delay` after the latest request.
    void request(bool force, Time_Point now);

    /// Drop the pending call and ignore requests until `arm` is called.
    void cancel();

    bool is_pending() const { return state == PENDING; }
    bool is_cancelled() const { return state == CANCELLED; }
};

}
