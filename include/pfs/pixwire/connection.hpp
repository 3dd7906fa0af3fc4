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
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ios>
#include <string>

PIXWIRE__NAMESPACE_BEGIN

/**
 * Blocking byte stream used by the protocol.
 *
 * The protocol owns the connection exclusively: one thread reads, one thread writes, and any
 * thread may call close() to release blocked readers and writers.
 */
class connection
{
protected:
    std::atomic<std::uint64_t> _input_bytecount {0};
    std::atomic<std::uint64_t> _output_bytecount {0};

public:
    virtual ~connection () {}

public:
    /**
     * Reads at most @a n bytes, blocks until some data is available.
     *
     * @return Number of bytes read, zero on end of stream or after close(), negative value if
     *         the read timeout expired (caller may retry).
     * @throws error {errc::socket_error} on I/O failure.
     */
    virtual std::streamsize read (char * data, std::size_t n) = 0;

    /**
     * Writes at most @a n bytes, blocks until some of them are written.
     *
     * @return Number of bytes written.
     * @throws error {errc::connection_closed} if connection is closed.
     * @throws error {errc::socket_error} on I/O failure.
     */
    virtual std::size_t write (char const * data, std::size_t n) = 0;

    /**
     * Copies at most @a n bytes of pending input without consuming them (does not block).
     */
    virtual std::size_t peek (char * data, std::size_t n) = 0;

    /**
     * Closes the connection, safe to call more than once and from any thread.
     */
    virtual void close () = 0;

    virtual bool is_closed () const = 0;

    /**
     * Sets read timeout, zero disables it.
     */
    virtual void set_timeout (std::chrono::milliseconds timeout) = 0;

    /**
     * Batching hints, no-op for transports without them.
     */
    virtual void set_nodelay (bool) {}
    virtual void set_cork (bool) {}

    virtual std::string local_endpoint () const = 0;
    virtual std::string remote_endpoint () const = 0;
    virtual std::string socktype () const = 0;

    std::uint64_t input_bytecount () const noexcept
    {
        return _input_bytecount.load();
    }

    std::uint64_t output_bytecount () const noexcept
    {
        return _output_bytecount.load();
    }

    /**
     * Writes all bytes, retrying partial writes.
     */
    void write_all (char const * data, std::size_t n)
    {
        while (n > 0) {
            auto written = write(data, n);
            data += written;
            n -= written;
        }
    }
};

PIXWIRE__NAMESPACE_END
