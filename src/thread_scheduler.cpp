////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/scheduler.hpp"
#include "pfs/pixwire/tag.hpp"
#include <pfs/log.hpp>
#include <algorithm>
#include <exception>

PIXWIRE__NAMESPACE_BEGIN

namespace {

// Earliest deadline on top, FIFO for equal deadlines
struct task_later
{
    template <typename T>
    bool operator () (T const & a, T const & b) const
    {
        if (a.deadline != b.deadline)
            return a.deadline > b.deadline;

        return a.seq > b.seq;
    }
};

} // namespace

thread_scheduler::thread_scheduler ()
{
    _thread = std::thread {& thread_scheduler::run, this};
}

thread_scheduler::~thread_scheduler ()
{
    interrupt();

    if (_thread.joinable()) {
        if (in_context())
            _thread.detach();
        else
            _thread.join();
    }

    // Destructors of the captures may post new tasks
    for (;;) {
        std::vector<task> discarded;

        {
            std::unique_lock<std::mutex> locker{_mtx};
            discarded.swap(_discarded);
        }

        if (discarded.empty())
            break;
    }
}

void thread_scheduler::push (task && t)
{
    std::unique_lock<std::mutex> locker{_mtx};

    // Not released on the posting thread, it may be an I/O thread of the task owner
    if (interrupted()) {
        _discarded.push_back(std::move(t));
        return;
    }

    t.seq = _seq++;
    _tasks.push_back(std::move(t));
    std::push_heap(_tasks.begin(), _tasks.end(), task_later{});
    _cv.notify_one();
}

void thread_scheduler::idle_add (callback_t<void ()> fn)
{
    task t;
    t.deadline = current_timepoint();
    t.interval = std::chrono::milliseconds{0};
    t.fn = [fn] () { fn(); return false; };
    push(std::move(t));
}

void thread_scheduler::timeout_add (std::chrono::milliseconds delay, callback_t<bool ()> fn)
{
    task t;
    t.deadline = future_timepoint(delay);
    t.interval = delay;
    t.fn = std::move(fn);
    push(std::move(t));
}

void thread_scheduler::interrupt ()
{
    std::vector<task> discarded;

    {
        std::unique_lock<std::mutex> locker{_mtx};
        interruptable::interrupt();
        discarded.swap(_tasks);
        _cv.notify_all();
    }

    // Captures may own objects whose destructors post new tasks
    discarded.clear();
}

std::size_t thread_scheduler::pending ()
{
    std::unique_lock<std::mutex> locker{_mtx};
    return _tasks.size();
}

void thread_scheduler::execute (task t)
{
    bool repeat = false;

    try {
        repeat = t.fn();
    } catch (std::exception const & ex) {
        LOGE(SCHEDULER_TAG, "scheduled task failure: {}", ex.what());
    }

    if (repeat) {
        t.deadline = future_timepoint(t.interval);
        push(std::move(t));
    }

    // Task and its captures are destroyed here, outside the lock
}

void thread_scheduler::run ()
{
    LOGD(SCHEDULER_TAG, "scheduler thread started");

    std::unique_lock<std::mutex> locker{_mtx};

    while (!interrupted()) {
        if (_tasks.empty()) {
            _cv.wait(locker);
            continue;
        }

        auto deadline = _tasks.front().deadline;

        if (current_timepoint() < deadline) {
            _cv.wait_until(locker, deadline);
            continue;
        }

        std::pop_heap(_tasks.begin(), _tasks.end(), task_later{});
        task t = std::move(_tasks.back());
        _tasks.pop_back();

        locker.unlock();
        execute(std::move(t));
        locker.lock();
    }

    LOGD(SCHEDULER_TAG, "scheduler thread finished");
}

PIXWIRE__NAMESPACE_END
