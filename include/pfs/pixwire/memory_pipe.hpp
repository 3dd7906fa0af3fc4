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
#include "connection.hpp"
#include "exports.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

PIXWIRE__NAMESPACE_BEGIN

/**
 * One direction of the in-memory pipe.
 */
struct memory_channel
{
    std::mutex mtx;
    std::condition_variable cv;
    std::deque<char> buffer;
    std::size_t capacity {0}; // Zero means unlimited
    bool writer_closed {false};
    bool reader_closed {false};
};

/**
 * Endpoint of the in-memory duplex pipe.
 *
 * Bytes written to one endpoint are read from the other in the same order. After the peer
 * is closed the remaining bytes are still readable, then read() reports end of stream.
 */
class memory_connection: public connection
{
private:
    std::shared_ptr<memory_channel> _in;
    std::shared_ptr<memory_channel> _out;
    std::string _local;
    std::string _remote;
    std::chrono::milliseconds _timeout {0};
    mutable std::mutex _mtx;
    bool _closed {false};

public:
    PIXWIRE__EXPORT memory_connection (std::shared_ptr<memory_channel> in
        , std::shared_ptr<memory_channel> out, std::string local, std::string remote);
    PIXWIRE__EXPORT ~memory_connection ();

public:
    PIXWIRE__EXPORT std::streamsize read (char * data, std::size_t n) override;
    PIXWIRE__EXPORT std::size_t write (char const * data, std::size_t n) override;
    PIXWIRE__EXPORT std::size_t peek (char * data, std::size_t n) override;
    PIXWIRE__EXPORT void close () override;
    PIXWIRE__EXPORT bool is_closed () const override;
    PIXWIRE__EXPORT void set_timeout (std::chrono::milliseconds timeout) override;

    std::string local_endpoint () const override
    {
        return _local;
    }

    std::string remote_endpoint () const override
    {
        return _remote;
    }

    std::string socktype () const override
    {
        return "memory";
    }
};

/**
 * Creates two connected endpoints.
 *
 * @param capacity Maximum number of buffered bytes per direction, zero means unlimited.
 */
PIXWIRE__EXPORT std::pair<std::unique_ptr<memory_connection>, std::unique_ptr<memory_connection>>
make_memory_pipe (std::size_t capacity = 0);

PIXWIRE__NAMESPACE_END
