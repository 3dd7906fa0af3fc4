////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/memory_pipe.hpp"
#include "pfs/pixwire/error.hpp"
#include <pfs/i18n.hpp>
#include <algorithm>

PIXWIRE__NAMESPACE_BEGIN

memory_connection::memory_connection (std::shared_ptr<memory_channel> in
    , std::shared_ptr<memory_channel> out, std::string local, std::string remote)
    : _in(std::move(in))
    , _out(std::move(out))
    , _local(std::move(local))
    , _remote(std::move(remote))
{}

memory_connection::~memory_connection ()
{
    close();
}

std::streamsize memory_connection::read (char * data, std::size_t n)
{
    std::chrono::milliseconds timeout;

    {
        std::lock_guard<std::mutex> locker{_mtx};
        timeout = _timeout;
    }

    std::unique_lock<std::mutex> locker{_in->mtx};

    auto ready = [this] {
        return !_in->buffer.empty() || _in->writer_closed || _in->reader_closed;
    };

    if (timeout.count() > 0) {
        if (!_in->cv.wait_for(locker, timeout, ready))
            return -1;
    } else {
        _in->cv.wait(locker, ready);
    }

    if (_in->reader_closed)
        return 0;

    // End of stream after the peer closed and everything was read
    if (_in->buffer.empty())
        return 0;

    auto count = (std::min)(n, _in->buffer.size());
    std::copy_n(_in->buffer.begin(), count, data);
    _in->buffer.erase(_in->buffer.begin(), _in->buffer.begin() + count);
    _in->cv.notify_all();

    _input_bytecount += count;
    return static_cast<std::streamsize>(count);
}

std::size_t memory_connection::write (char const * data, std::size_t n)
{
    std::unique_lock<std::mutex> locker{_out->mtx};

    _out->cv.wait(locker, [this] {
        return _out->writer_closed || _out->reader_closed
            || _out->capacity == 0 || _out->buffer.size() < _out->capacity;
    });

    if (_out->writer_closed || _out->reader_closed) {
        throw error {
              make_error_code(errc::connection_closed)
            , tr::_("write to closed connection")
        };
    }

    auto count = _out->capacity == 0
        ? n
        : (std::min)(n, _out->capacity - _out->buffer.size());

    _out->buffer.insert(_out->buffer.end(), data, data + count);
    _out->cv.notify_all();

    _output_bytecount += count;
    return count;
}

std::size_t memory_connection::peek (char * data, std::size_t n)
{
    std::lock_guard<std::mutex> locker{_in->mtx};
    auto count = (std::min)(n, _in->buffer.size());
    std::copy_n(_in->buffer.begin(), count, data);
    return count;
}

void memory_connection::close ()
{
    {
        std::lock_guard<std::mutex> locker{_mtx};

        if (_closed)
            return;

        _closed = true;
    }

    {
        std::lock_guard<std::mutex> locker{_out->mtx};
        _out->writer_closed = true;
        _out->cv.notify_all();
    }

    {
        std::lock_guard<std::mutex> locker{_in->mtx};
        _in->reader_closed = true;
        _in->cv.notify_all();
    }
}

bool memory_connection::is_closed () const
{
    std::lock_guard<std::mutex> locker{_mtx};
    return _closed;
}

void memory_connection::set_timeout (std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> locker{_mtx};
    _timeout = timeout;
}

std::pair<std::unique_ptr<memory_connection>, std::unique_ptr<memory_connection>>
make_memory_pipe (std::size_t capacity)
{
    auto a2b = std::make_shared<memory_channel>();
    auto b2a = std::make_shared<memory_channel>();

    a2b->capacity = capacity;
    b2a->capacity = capacity;

    std::unique_ptr<memory_connection> a {new memory_connection(b2a, a2b, "memory:a", "memory:b")};
    std::unique_ptr<memory_connection> b {new memory_connection(a2b, b2a, "memory:b", "memory:a")};

    return std::make_pair(std::move(a), std::move(b));
}

PIXWIRE__NAMESPACE_END
