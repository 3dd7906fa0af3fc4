////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../namespace.hpp"
#include "../connection.hpp"
#include "../exports.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

PIXWIRE__NAMESPACE_BEGIN

namespace posix {

/**
 * Connected blocking TCP socket.
 */
class tcp_connection: public connection
{
public:
    using native_type = int;
    static constexpr native_type INVALID_SOCKET = -1;

private:
    native_type _socket {INVALID_SOCKET};
    std::atomic_bool _closed {false};
    std::string _local;
    std::string _remote;

public:
    /**
     * Takes ownership of the connected socket @a sock.
     */
    PIXWIRE__EXPORT explicit tcp_connection (native_type sock);
    PIXWIRE__EXPORT ~tcp_connection ();

    tcp_connection (tcp_connection const &) = delete;
    tcp_connection & operator = (tcp_connection const &) = delete;

public:
    PIXWIRE__EXPORT std::streamsize read (char * data, std::size_t n) override;
    PIXWIRE__EXPORT std::size_t write (char const * data, std::size_t n) override;
    PIXWIRE__EXPORT std::size_t peek (char * data, std::size_t n) override;
    PIXWIRE__EXPORT void close () override;
    PIXWIRE__EXPORT void set_timeout (std::chrono::milliseconds timeout) override;
    PIXWIRE__EXPORT void set_nodelay (bool enable) override;
    PIXWIRE__EXPORT void set_cork (bool enable) override;

    bool is_closed () const override
    {
        return _closed.load();
    }

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
        return "tcp";
    }

    native_type native () const noexcept
    {
        return _socket;
    }

public:
    /**
     * Connects to IPv4 @a host (numeric address) and @a port.
     *
     * @throws error {errc::socket_error} on failure.
     */
    static PIXWIRE__EXPORT std::unique_ptr<tcp_connection> connect (std::string const & host
        , std::uint16_t port);
};

/**
 * Listening IPv4 TCP socket.
 */
class tcp_listener
{
    using native_type = tcp_connection::native_type;

private:
    native_type _socket {tcp_connection::INVALID_SOCKET};

public:
    /**
     * Binds to @a host and @a port (zero port picks a free one) and starts listening.
     *
     * @throws error {errc::socket_error} on failure.
     */
    PIXWIRE__EXPORT tcp_listener (std::string const & host, std::uint16_t port, int backlog = 10);
    PIXWIRE__EXPORT ~tcp_listener ();

    tcp_listener (tcp_listener const &) = delete;
    tcp_listener & operator = (tcp_listener const &) = delete;

public:
    /**
     * Actual bound port.
     */
    PIXWIRE__EXPORT std::uint16_t port () const;

    /**
     * Blocks until a peer connects.
     *
     * @throws error {errc::socket_error} on failure.
     */
    PIXWIRE__EXPORT std::unique_ptr<tcp_connection> accept ();
};

} // namespace posix

PIXWIRE__NAMESPACE_END
