#pragma once

#include <chrono>
#include <cz/vector.hpp>

namespace lens {

typedef std::chrono::steady_clock::time_point Time_Point;

/// Where the engine gets the current time from.  Tests use a fake one.
struct Clock {
    Time_Point (*now)(void* data);
    void* data;

    Time_Point get() const { return now(data); }
};

/// A `Clock` reading `std::chrono::steady_clock`.
Clock steady_clock();

namespace Job_Tick_Result_ {
/// The result of a `tick` call on a job.
enum Job_Tick_Result {
    /// The job has finished.  It will be removed from the job list.
    FINISHED,
    /// The job has made some progress.  It will be re-scheduled to do more work.
    MADE_PROGRESS,
    /// The job is waiting on a deadline.  It will be ticked again next frame.
    STALLED,
};
}
using Job_Tick_Result_::Job_Tick_Result;

/// A `Synchronous_Job` represents a task to be performed on the main thread inbetween
/// events.  This is how work is deferred: a timer is a job that stalls until its deadline.
struct Synchronous_Job {
    /// Run one tick of the job.
    Job_Tick_Result (*tick)(Time_Point now, void* data);

    /// Cleanup the job because it is forcibly no longer going to be ran.
    ///
    /// This is invoked when the queue is dropped.  This is not invoked when the task
    /// finishes (`tick` returns `Job_Tick_Result::FINISHED`); the job must clean
    /// itself up in that case.
    void (*kill)(void* data);

    void* data;
};

struct Job_Queue {
    cz::Vector<Synchronous_Job> jobs;

    /// The job will first be ticked by the next call to `run`.
    void add(Synchronous_Job job);

    /// Tick every job that was queued before this call.  Jobs added while
    /// running are left for the next call.  Returns `true` if any job ran.
    bool run(Time_Point now);

    /// Kill all pending jobs.
    void drop();
};

/// Run `callback` on the next tick of the queue.
void defer_to_next_tick(Job_Queue* queue, void (*callback)(void* data), void* data);

}
