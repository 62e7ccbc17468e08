#include <czt/test_base.hpp>

#include <cz/defer.hpp>
#include "core/job.hpp"

using namespace lens;

namespace {
struct Counter {
    int ticks;
    int kills;
    int stall_for;
};
}

static Job_Tick_Result counter_tick(Time_Point, void* _counter) {
    Counter* counter = (Counter*)_counter;
    ++counter->ticks;
    if (counter->stall_for > 0) {
        --counter->stall_for;
        return Job_Tick_Result::STALLED;
    }
    return Job_Tick_Result::FINISHED;
}

static void counter_kill(void* _counter) {
    Counter* counter = (Counter*)_counter;
    ++counter->kills;
}

static Synchronous_Job counter_job(Counter* counter) {
    Synchronous_Job job;
    job.tick = counter_tick;
    job.kill = counter_kill;
    job.data = counter;
    return job;
}

TEST_CASE("Job_Queue runs jobs until they finish") {
    Job_Queue queue = {};
    CZ_DEFER(queue.drop());

    Counter counter = {0, 0, 2};
    queue.add(counter_job(&counter));

    Time_Point now = {};
    CHECK(queue.run(now));
    CHECK(queue.run(now));
    CHECK(queue.run(now));
    CHECK(counter.ticks == 3);
    CHECK(queue.jobs.len == 0);

    CHECK_FALSE(queue.run(now));
    CHECK(counter.ticks == 3);
    CHECK(counter.kills == 0);
}

TEST_CASE("Job_Queue drop kills pending jobs") {
    Counter counter = {0, 0, 100};
    {
        Job_Queue queue = {};
        queue.add(counter_job(&counter));
        queue.run({});
        queue.drop();
    }
    CHECK(counter.ticks == 1);
    CHECK(counter.kills == 1);
}

static void increment(void* value) {
    ++*(int*)value;
}

static void defer_increment(void* _queue_and_value) {
    void** queue_and_value = (void**)_queue_and_value;
    increment(queue_and_value[1]);
    defer_to_next_tick((Job_Queue*)queue_and_value[0], increment, queue_and_value[1]);
}

TEST_CASE("defer_to_next_tick jobs added while running wait for the next run") {
    Job_Queue queue = {};
    CZ_DEFER(queue.drop());

    int value = 0;
    void* queue_and_value[] = {&queue, &value};
    defer_to_next_tick(&queue, defer_increment, queue_and_value);
    CHECK(value == 0);

    queue.run({});
    CHECK(value == 1);
    CHECK(queue.jobs.len == 1);

    queue.run({});
    CHECK(value == 2);
    CHECK(queue.jobs.len == 0);
}

TEST_CASE("defer_to_next_tick killed without running") {
    int value = 0;
    Job_Queue queue = {};
    defer_to_next_tick(&queue, increment, &value);
    queue.drop();
    CHECK(value == 0);
}
