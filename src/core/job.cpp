#include "job.hpp"

#include <cz/assert.hpp>
#include <cz/heap.hpp>
#include <tracy/Tracy.hpp>

namespace lens {

static Time_Point steady_clock_now(void*) {
    return std::chrono::steady_clock::now();
}

Clock steady_clock() {
    Clock clock;
    clock.now = steady_clock_now;
    clock.data = nullptr;
    return clock;
}

void Job_Queue::add(Synchronous_Job job) {
    jobs.reserve(cz::heap_allocator(), 1);
    jobs.push(job);
}

bool Job_Queue::run(Time_Point now) {
    ZoneScoped;

    bool ran_any_jobs = false;

    size_t end = jobs.len;
    for (size_t i = 0; i < end;) {
        ran_any_jobs = true;
        // Copy because the tick can add jobs and reallocate.
        Synchronous_Job job = jobs[i];
        Job_Tick_Result result = job.tick(now, job.data);
        if (result == Job_Tick_Result::FINISHED) {
            jobs.remove(i);
            --end;
            continue;
        }
        ++i;
    }

    return ran_any_jobs;
}

void Job_Queue::drop() {
    for (size_t i = 0; i < jobs.len; ++i) {
        jobs[i].kill(jobs[i].data);
    }
    jobs.drop(cz::heap_allocator());
}

struct Next_Tick_Job_Data {
    void (*callback)(void* data);
    void* data;
};

static Job_Tick_Result next_tick_job_tick(Time_Point, void* _data) {
    Next_Tick_Job_Data* data = (Next_Tick_Job_Data*)_data;
    data->callback(data->data);
    cz::heap_allocator().dealloc(data);
    return Job_Tick_Result::FINISHED;
}

static void next_tick_job_kill(void* _data) {
    Next_Tick_Job_Data* data = (Next_Tick_Job_Data*)_data;
    cz::heap_allocator().dealloc(data);
}

void defer_to_next_tick(Job_Queue* queue, void (*callback)(void* data), void* data) {
    Next_Tick_Job_Data* job_data = cz::heap_allocator().alloc<Next_Tick_Job_Data>();
    CZ_ASSERT(job_data);
    job_data->callback = callback;
    job_data->data = data;

    Synchronous_Job job;
    job.tick = next_tick_job_tick;
    job.kill = next_tick_job_kill;
    job.data = job_data;
    queue->add(job);
}

}
