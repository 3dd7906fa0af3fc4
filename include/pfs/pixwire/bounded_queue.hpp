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
#include <chrono>
#include <algorithm>
#include <condition_variable>
#include <list>
#include <mutex>
#include <queue>
#include <utility>

PIXWIRE__NAMESPACE_BEGIN

/**
 * Blocking FIFO queue with fixed capacity.
 *
 * A producer blocks on a full queue, a consumer blocks on an empty one. Both are released by
 * interrupt(). Like a task queue, it counts items that were popped but not yet reported as
 * processed by task_done(), so the owner can wait until everything has been handled.
 */
template <typename T>
class bounded_queue
{
    using queue_type = std::queue<T, std::list<T>>;

private:
    std::size_t _capacity {0};
    queue_type _q;
    std::size_t _unfinished {0};
    bool _interrupted {false};

    mutable std::mutex _mtx;
    std::condition_variable _not_empty;
    std::condition_variable _not_full;
    std::condition_variable _idle;

public:
    /**
     * @param capacity Maximum number of queued items, zero means unbounded.
     */
    explicit bounded_queue (std::size_t capacity = 0)
        : _capacity(capacity)
    {}

    bounded_queue (bounded_queue const &) = delete;
    bounded_queue & operator = (bounded_queue const &) = delete;

public:
    std::size_t capacity () const noexcept
    {
        return _capacity;
    }

    /**
     * Enqueues @a item, blocks while the queue is full.
     *
     * @return @c false if the queue was interrupted, @a item is not enqueued then.
     */
    bool push (T && item)
    {
        std::unique_lock<std::mutex> locker{_mtx};

        _not_full.wait(locker, [this] {
            return _interrupted || _capacity == 0 || _q.size() < _capacity;
        });

        if (_interrupted)
            return false;

        _q.push(std::move(item));
        ++_unfinished;
        _not_empty.notify_one();
        return true;
    }

    /**
     * Dequeues the front item, blocks while the queue is empty.
     *
     * @return @c false if the queue was interrupted.
     */
    bool pop (T & item)
    {
        std::unique_lock<std::mutex> locker{_mtx};

        _not_empty.wait(locker, [this] {
            return _interrupted || !_q.empty();
        });

        if (_interrupted)
            return false;

        item = std::move(_q.front());
        _q.pop();
        _not_full.notify_one();
        return true;
    }

    /**
     * Dequeues the front item waiting at most @a timeout.
     *
     * @return @c false on timeout or if the queue was interrupted.
     */
    template <typename Rep, typename Period>
    bool pop_for (T & item, std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> locker{_mtx};

        auto success = _not_empty.wait_for(locker, timeout, [this] {
            return _interrupted || !_q.empty();
        });

        if (!success || _interrupted)
            return false;

        item = std::move(_q.front());
        _q.pop();
        _not_full.notify_one();
        return true;
    }

    /**
     * Reports the item obtained by the last pop() as processed.
     */
    void task_done ()
    {
        std::unique_lock<std::mutex> locker{_mtx};

        if (_unfinished > 0)
            --_unfinished;

        if (_unfinished == 0)
            _idle.notify_all();
    }

    /**
     * Waits until all enqueued items are processed.
     *
     * @return @c true if the queue is idle, @c false on timeout.
     */
    template <typename Rep, typename Period>
    bool wait_idle (std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> locker{_mtx};

        return _idle.wait_for(locker, timeout, [this] {
            return _unfinished == 0 || _interrupted;
        }) && _unfinished == 0;
    }

    /**
     * No items queued and no popped items in progress.
     */
    bool idle () const
    {
        std::unique_lock<std::mutex> locker{_mtx};
        return _unfinished == 0;
    }

    bool empty () const
    {
        std::unique_lock<std::mutex> locker{_mtx};
        return _q.empty();
    }

    std::size_t size () const
    {
        std::unique_lock<std::mutex> locker{_mtx};
        return _q.size();
    }

    /**
     * Releases all blocked producers and consumers, subsequent push() and pop() calls fail.
     */
    void interrupt ()
    {
        std::unique_lock<std::mutex> locker{_mtx};
        _interrupted = true;
        _not_empty.notify_all();
        _not_full.notify_all();
        _idle.notify_all();
    }

    bool interrupted () const
    {
        std::unique_lock<std::mutex> locker{_mtx};
        return _interrupted;
    }

    /**
     * Drops all queued items.
     */
    void clear ()
    {
        std::unique_lock<std::mutex> locker{_mtx};
        _unfinished -= (std::min)(_unfinished, _q.size());

        while (!_q.empty())
            _q.pop();

        _not_full.notify_all();

        if (_unfinished == 0)
            _idle.notify_all();
    }
};

PIXWIRE__NAMESPACE_END
