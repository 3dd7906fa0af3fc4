////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include "callback.hpp"
#include "chrono.hpp"
#include "exports.hpp"
#include "interruptable.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

PIXWIRE__NAMESPACE_BEGIN

/**
 * Main (application) execution context.
 *
 * Protocol uses it for everything that must not run on the I/O threads: delivery of the
 * synthetic connection-lost packet, delayed hangups and flush-then-close steps.
 */
class scheduler
{
public:
    virtual ~scheduler () {}

    /**
     * Runs @a fn as soon as possible on the main context.
     */
    virtual void idle_add (callback_t<void ()> fn) = 0;

    /**
     * Runs @a fn after @a delay on the main context, repeats while @a fn returns @c true.
     */
    virtual void timeout_add (std::chrono::milliseconds delay, callback_t<bool ()> fn) = 0;
};

/**
 * Scheduler with a dedicated thread as the main context.
 */
class thread_scheduler: public scheduler, public interruptable
{
    struct task
    {
        std::uint64_t seq;
        clock_type::time_point deadline;
        std::chrono::milliseconds interval;
        callback_t<bool ()> fn;
    };

private:
    std::vector<task> _tasks; // Binary heap ordered by deadline
    std::vector<task> _discarded; // Posted after interruption, released by the destructor
    std::uint64_t _seq {0};
    std::mutex _mtx;
    std::condition_variable _cv;
    std::thread _thread;

public:
    PIXWIRE__EXPORT thread_scheduler ();
    PIXWIRE__EXPORT ~thread_scheduler ();

    thread_scheduler (thread_scheduler const &) = delete;
    thread_scheduler & operator = (thread_scheduler const &) = delete;

public:
    PIXWIRE__EXPORT void idle_add (callback_t<void ()> fn) override;
    PIXWIRE__EXPORT void timeout_add (std::chrono::milliseconds delay, callback_t<bool ()> fn) override;

    /**
     * Stops the scheduler thread, pending tasks are discarded. Tasks posted after the
     * interruption never run and are released by the destructor.
     */
    PIXWIRE__EXPORT void interrupt () override;

    /**
     * Number of tasks waiting to run.
     */
    PIXWIRE__EXPORT std::size_t pending ();

    /**
     * Checks if the caller runs on the scheduler thread.
     */
    bool in_context () const noexcept
    {
        return std::this_thread::get_id() == _thread.get_id();
    }

private:
    void push (task && t);
    void execute (task t);
    void run ();
};

PIXWIRE__NAMESPACE_END
