/**
 * @file test_timer_queue.cpp
 * @brief Unit tests for Aegis::TimerQueue and Aegis::ScopedTimers.
 * @author Aegis Project
 * @date 2026
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "aegis/timer_queue.hpp"
#include "fakes.hpp"

#include <memory>
#include <vector>

using namespace Aegis;
using namespace AegisTest;

TEST_CASE("TimerQueue runs callbacks once their deadline passes", "[TimerQueue]") {
    ManualClock clock;
    TimerQueue queue(clock);
    int fired = 0;

    queue.schedule(1000, [&]() { ++fired; });
    REQUIRE(queue.pending() == 1);

    REQUIRE(queue.runDue() == 0);
    clock.advance(999);
    REQUIRE(queue.runDue() == 0);
    clock.advance(1);
    REQUIRE(queue.runDue() == 1);
    REQUIRE(fired == 1);
    REQUIRE(queue.pending() == 0);

    clock.advance(5000);
    REQUIRE(queue.runDue() == 0);
    REQUIRE(fired == 1);
}

TEST_CASE("TimerQueue runs due callbacks in deadline order", "[TimerQueue]") {
    ManualClock clock;
    TimerQueue queue(clock);
    std::vector<int> order;

    queue.schedule(300, [&]() { order.push_back(3); });
    queue.schedule(100, [&]() { order.push_back(1); });
    queue.schedule(200, [&]() { order.push_back(2); });
    REQUIRE(queue.nextDeadline() == clock.nowMs() + 100);

    clock.advance(1000);
    queue.runDue();
    REQUIRE(order == std::vector<int>{1, 2, 3});
    REQUIRE_FALSE(queue.nextDeadline().has_value());
}

TEST_CASE("TimerQueue::cancel drops a pending callback", "[TimerQueue]") {
    ManualClock clock;
    TimerQueue queue(clock);
    int fired = 0;

    TimerId id = queue.schedule(10, [&]() { ++fired; });
    REQUIRE(queue.isPending(id));
    REQUIRE(queue.cancel(id));
    REQUIRE_FALSE(queue.isPending(id));
    REQUIRE_FALSE(queue.cancel(id));

    clock.advance(100);
    queue.runDue();
    REQUIRE(fired == 0);
}

TEST_CASE("TimerQueue callbacks may schedule further callbacks", "[TimerQueue]") {
    ManualClock clock;
    TimerQueue queue(clock);
    int ticks = 0;

    std::function<void()> tick = [&]() {
        ++ticks;
        if (ticks < 3) queue.schedule(1000, tick);
    };
    queue.schedule(1000, tick);

    for (int i = 0; i < 5; ++i) {
        clock.advance(1000);
        queue.runDue();
    }
    REQUIRE(ticks == 3);

    // A zero delay runs in the same pass
    int immediate = 0;
    queue.schedule(0, [&]() { queue.schedule(0, [&]() { ++immediate; }); });
    REQUIRE(queue.runDue() == 2);
    REQUIRE(immediate == 1);
}

TEST_CASE("ScopedTimers cancels what it owns on destruction", "[ScopedTimers]") {
    ManualClock clock;
    TimerQueue queue(clock);
    int fired = 0;

    queue.schedule(500, [&]() { ++fired; });
    {
        ScopedTimers scoped(queue);
        scoped.schedule(500, [&]() { fired += 10; });
        scoped.schedule(600, [&]() { fired += 100; });
        REQUIRE(scoped.active() == 2);
        REQUIRE(queue.pending() == 3);
    }
    REQUIRE(queue.pending() == 1);

    clock.advance(1000);
    queue.runDue();
    REQUIRE(fired == 1);
}

TEST_CASE("ScopedTimers forgets timers that already ran", "[ScopedTimers]") {
    ManualClock clock;
    TimerQueue queue(clock);
    ScopedTimers scoped(queue);
    int fired = 0;

    TimerId id = scoped.schedule(100, [&]() { ++fired; });
    clock.advance(100);
    queue.runDue();

    REQUIRE(fired == 1);
    REQUIRE(scoped.active() == 0);
    REQUIRE_FALSE(scoped.cancel(id));
}

TEST_CASE("ScopedTimers::cancelAll leaves foreign timers alone", "[ScopedTimers]") {
    ManualClock clock;
    TimerQueue queue(clock);
    ScopedTimers a(queue);
    ScopedTimers b(queue);

    a.schedule(100, []() {});
    TimerId kept = b.schedule(100, []() {});

    REQUIRE_FALSE(a.cancel(kept));
    a.cancelAll();
    REQUIRE(a.active() == 0);
    REQUIRE(b.active() == 1);
    REQUIRE(queue.isPending(kept));
}
