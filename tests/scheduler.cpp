////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "tools.hpp"
#include "pfs/pixwire/scheduler.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono;

TEST_CASE("idle tasks run in order") {
    pixwire::thread_scheduler sched;
    std::mutex mtx;
    std::vector<int> order;
    std::atomic_int counter {0};

    for (int i = 0; i < 10; i++) {
        sched.idle_add([i, & mtx, & order, & counter] () {
            std::lock_guard<std::mutex> locker{mtx};
            order.push_back(i);
            ++counter;
        });
    }

    REQUIRE(tools::wait_atomic_counter(counter, 10));

    std::lock_guard<std::mutex> locker{mtx};
    CHECK_EQ(order, std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9});
}

TEST_CASE("timeout") {
    pixwire::thread_scheduler sched;
    std::atomic_bool fired {false};
    std::atomic_bool early {false};
    auto start = steady_clock::now();
    steady_clock::time_point fired_at;

    sched.timeout_add(milliseconds{200}, [& fired, & fired_at] () {
        fired_at = steady_clock::now();
        fired = true;
        return false;
    });

    // Idle task does not wait for the timer
    sched.idle_add([& early, & fired] () { early = !fired.load(); });

    REQUIRE(tools::wait_atomic_bool(fired));
    CHECK(early.load());
    CHECK_GE(duration_cast<milliseconds>(fired_at - start).count(), 200);
}

TEST_CASE("repeating task") {
    pixwire::thread_scheduler sched;
    std::atomic_int counter {0};

    sched.timeout_add(milliseconds{10}, [& counter] () {
        return ++counter < 3;
    });

    REQUIRE(tools::wait_atomic_counter(counter, 3));
    tools::sleep_ms(100);
    CHECK_EQ(counter.load(), 3);
    CHECK_EQ(sched.pending(), 0);
}

TEST_CASE("failed task") {
    pixwire::thread_scheduler sched;
    std::atomic_bool next_done {false};

    sched.idle_add([] () { throw std::runtime_error {"task failure"}; });
    sched.idle_add([& next_done] () { next_done = true; });

    CHECK(tools::wait_atomic_bool(next_done));
}

TEST_CASE("context") {
    pixwire::thread_scheduler sched;
    std::atomic_bool in_context {false};
    std::atomic_bool done {false};

    CHECK_FALSE(sched.in_context());

    sched.idle_add([& sched, & in_context, & done] () {
        in_context = sched.in_context();
        done = true;
    });

    REQUIRE(tools::wait_atomic_bool(done));
    CHECK(in_context.load());
}

TEST_CASE("interrupt") {
    pixwire::thread_scheduler sched;
    std::atomic_bool fired {false};

    sched.timeout_add(milliseconds{100}, [& fired] () { fired = true; return false; });
    CHECK_EQ(sched.pending(), 1);

    sched.interrupt();
    CHECK(sched.interrupted());
    CHECK_EQ(sched.pending(), 0);

    sched.idle_add([& fired] () { fired = true; });
    CHECK_EQ(sched.pending(), 0);

    tools::sleep_ms(200);
    CHECK_FALSE(fired.load());
}

TEST_CASE("tasks posted after interrupt") {
    std::atomic_bool released {false};
    std::thread::id released_by;

    {
        pixwire::thread_scheduler sched;
        sched.interrupt();

        std::shared_ptr<int> capture {new int {0}, [& released, & released_by] (int * p) {
            released_by = std::this_thread::get_id();
            released = true;
            delete p;
        }};

        std::thread poster {[& sched, capture] () mutable {
            sched.idle_add([capture] () {});
            capture.reset();
        }};

        capture.reset();
        poster.join();

        // Held by the scheduler, not released on the posting thread
        CHECK_FALSE(released.load());
    }

    CHECK(released.load());
    CHECK(released_by == std::this_thread::get_id());
}
