#include "refresh_scheduler.hpp"

#include <cz/assert.hpp>
#include <cz/heap.hpp>
#include <tracy/Tracy.hpp>

namespace lens {

namespace refresh_scheduler_impl {
struct Data {
    Refresh_Scheduler* scheduler;
    uint64_t generation;
};
}
using namespace refresh_scheduler_impl;

static Job_Tick_Result refresh_scheduler_job_tick(Time_Point now, void* _data) {
    Data* data = (Data*)_data;
    Refresh_Scheduler* scheduler = data->scheduler;

    // Cancelled or superseded by a forced request.
    if (scheduler->generation != data->generation ||
        scheduler->state != Refresh_Scheduler::PENDING) {
        cz::heap_allocator().dealloc(data);
        return Job_Tick_Result::FINISHED;
    }

    if (now < scheduler->deadline) {
        return Job_Tick_Result::STALLED;
    }

    cz::heap_allocator().dealloc(data);

    ZoneScopedN("refresh_scheduler fire");

    scheduler->state = Refresh_Scheduler::IDLE;
    ++scheduler->generation;
    bool force = scheduler->force;
    scheduler->callback(force, scheduler->callback_data);
    scheduler->force = false;
    return Job_Tick_Result::FINISHED;
}

static void refresh_scheduler_job_kill(void* _data) {
    cz::heap_allocator().dealloc((Data*)_data);
}

void Refresh_Scheduler::init(Job_Queue* jobs,
                             std::chrono::milliseconds delay,
                             void (*callback)(bool force, void* data),
                             void* callback_data) {
    this->state = IDLE;
    this->generation = 0;
    this->force = false;
    this->deadline = {};
    this->delay = delay;
    this->jobs = jobs;
    this->callback = callback;
    this->callback_data = callback_data;
}

void Refresh_Scheduler::arm() {
    if (state == CANCELLED) {
        state = IDLE;
    }
}

void Refresh_Scheduler::request(bool force, Time_Point now) {
    if (state == CANCELLED) {
        return;
    }

    if (force) {
        // Invalidate the pending job, if any.
        ++generation;
        state = IDLE;
        this->force = false;
        callback(true, callback_data);
        return;
    }

    this->force = force;
    deadline = now + delay;
    if (state == PENDING) {
        return;
    }

    state = PENDING;

    Data* data = cz::heap_allocator().alloc<Data>();
    CZ_ASSERT(data);
    data->scheduler = this;
    data->generation = generation;

    Synchronous_Job job;
    job.tick = refresh_scheduler_job_tick;
    job.kill = refresh_scheduler_job_kill;
    job.data = data;
    jobs->add(job);
}

void Refresh_Scheduler::cancel() {
    if (state != CANCELLED) {
        ++generation;
    }
    state = CANCELLED;
    force = false;
}

}
