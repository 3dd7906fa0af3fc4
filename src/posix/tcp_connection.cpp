////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/posix/tcp_connection.hpp"
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/tag.hpp"
#include <pfs/endian.hpp>
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>

PIXWIRE__NAMESPACE_BEGIN

namespace posix {

namespace {

std::string to_string (sockaddr_in const & sa)
{
    char buf[INET_ADDRSTRLEN];

    if (::inet_ntop(AF_INET, & sa.sin_addr, buf, sizeof(buf)) == nullptr)
        return std::string{"?"};

    return std::string{buf} + ':' + std::to_string(pfs::to_native_order(sa.sin_port));
}

sockaddr_in make_sockaddr (std::string const & host, std::uint16_t port)
{
    sockaddr_in addr_in4;

    std::memset(& addr_in4, 0, sizeof(addr_in4));

    addr_in4.sin_family = AF_INET;
    addr_in4.sin_port   = pfs::to_network_order(port);

    if (::inet_pton(AF_INET, host.c_str(), & addr_in4.sin_addr) != 1) {
        throw error {
              make_error_code(errc::socket_error)
            , tr::f_("bad IPv4 address: {}", host)
        };
    }

    return addr_in4;
}

std::string local_name (int sock)
{
    sockaddr_in sa;
    socklen_t len = sizeof(sa);

    if (::getsockname(sock, reinterpret_cast<sockaddr *>(& sa), & len) != 0)
        return std::string{};

    return to_string(sa);
}

std::string peer_name (int sock)
{
    sockaddr_in sa;
    socklen_t len = sizeof(sa);

    if (::getpeername(sock, reinterpret_cast<sockaddr *>(& sa), & len) != 0)
        return std::string{};

    return to_string(sa);
}

void set_option (int sock, int level, int optname, int value)
{
    auto rc = ::setsockopt(sock, level, optname, & value, sizeof(value));

    if (rc != 0) {
        throw error {
              make_error_code(errc::socket_error)
            , tr::_("set socket option failure")
            , pfs::system_error_text()
        };
    }
}

} // namespace

tcp_connection::tcp_connection (native_type sock)
    : _socket(sock)
    , _local(local_name(sock))
    , _remote(peer_name(sock))
{}

tcp_connection::~tcp_connection ()
{
    close();

    if (_socket >= 0) {
        ::close(_socket);
        _socket = INVALID_SOCKET;
    }
}

std::streamsize tcp_connection::read (char * data, std::size_t n)
{
    if (_closed.load())
        return 0;

    auto rc = ::recv(_socket, data, n, 0);

    if (rc < 0) {
        if (errno == EAGAIN || (EAGAIN != EWOULDBLOCK && errno == EWOULDBLOCK))
            return -1; // Timeout

        if (errno == EINTR)
            return -1;

        // Peer reset or closed from our side
        if (_closed.load() || errno == ECONNRESET)
            return 0;

        throw error {
              make_error_code(errc::socket_error)
            , tr::_("receive data failure")
            , pfs::system_error_text()
        };
    }

    _input_bytecount += static_cast<std::uint64_t>(rc);
    return rc;
}

std::size_t tcp_connection::write (char const * data, std::size_t n)
{
    for (;;) {
        if (_closed.load()) {
            throw error {
                  make_error_code(errc::connection_closed)
                , tr::_("write to closed connection")
            };
        }

        // MSG_NOSIGNAL: EPIPE is returned instead of SIGPIPE
        auto rc = ::send(_socket, data, n, MSG_NOSIGNAL);

        if (rc < 0) {
            if (errno == EINTR)
                continue;

            if (errno == EPIPE || errno == ECONNRESET) {
                throw error {
                      make_error_code(errc::connection_closed)
                    , tr::_("connection closed by peer")
                };
            }

            throw error {
                  make_error_code(errc::socket_error)
                , tr::_("send failure")
                , pfs::system_error_text()
            };
        }

        _output_bytecount += static_cast<std::uint64_t>(rc);
        return static_cast<std::size_t>(rc);
    }
}

std::size_t tcp_connection::peek (char * data, std::size_t n)
{
    if (_closed.load())
        return 0;

    auto rc = ::recv(_socket, data, n, MSG_PEEK | MSG_DONTWAIT);

    return rc > 0 ? static_cast<std::size_t>(rc) : 0;
}

void tcp_connection::close ()
{
    bool expected = false;

    if (!_closed.compare_exchange_strong(expected, true))
        return;

    // Descriptor is released in destructor, shutdown only wakes up blocked calls
    auto rc = ::shutdown(_socket, SHUT_RDWR);

    if (rc != 0 && errno != ENOTCONN && errno != ECONNRESET)
        LOGW(CONNECTION_TAG, "socket shutdown error: {}", pfs::system_error_text());

    LOGD(CONNECTION_TAG, "connection closed: {} -> {}", _local, _remote);
}

void tcp_connection::set_timeout (std::chrono::milliseconds timeout)
{
    timeval tv;
    tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    auto rc = ::setsockopt(_socket, SOL_SOCKET, SO_RCVTIMEO, & tv, sizeof(tv));

    if (rc != 0) {
        throw error {
              make_error_code(errc::socket_error)
            , tr::_("set socket receive timeout failure")
            , pfs::system_error_text()
        };
    }
}

void tcp_connection::set_nodelay (bool enable)
{
    set_option(_socket, IPPROTO_TCP, TCP_NODELAY, enable ? 1 : 0);
}

void tcp_connection::set_cork (bool enable)
{
#if defined(TCP_CORK)
    set_option(_socket, IPPROTO_TCP, TCP_CORK, enable ? 1 : 0);
#else
    (void)enable;
#endif
}

std::unique_ptr<tcp_connection> tcp_connection::connect (std::string const & host, std::uint16_t port)
{
    auto addr_in4 = make_sockaddr(host, port);
    auto sock = ::socket(AF_INET, SOCK_STREAM, 0);

    if (sock < 0) {
        throw error {
              make_error_code(errc::socket_error)
            , tr::_("create INET socket failure")
            , pfs::system_error_text()
        };
    }

    auto rc = ::connect(sock, reinterpret_cast<sockaddr *>(& addr_in4), sizeof(addr_in4));

    if (rc < 0) {
        auto text = pfs::system_error_text();
        ::close(sock);

        throw error {
              make_error_code(errc::socket_error)
            , tr::f_("socket connect error: {}:{}", host, port)
            , text
        };
    }

    return std::unique_ptr<tcp_connection>(new tcp_connection(sock));
}

tcp_listener::tcp_listener (std::string const & host, std::uint16_t port, int backlog)
{
    auto addr_in4 = make_sockaddr(host, port);

    _socket = ::socket(AF_INET, SOCK_STREAM, 0);

    if (_socket < 0) {
        throw error {
              make_error_code(errc::socket_error)
            , tr::_("create INET socket failure")
            , pfs::system_error_text()
        };
    }

    set_option(_socket, SOL_SOCKET, SO_REUSEADDR, 1);

    auto rc = ::bind(_socket, reinterpret_cast<sockaddr *>(& addr_in4), sizeof(addr_in4));

    if (rc != 0) {
        throw error {
              make_error_code(errc::socket_error)
            , tr::f_("bind name to socket failure: {}:{}", host, port)
            , pfs::system_error_text()
        };
    }

    rc = ::listen(_socket, backlog);

    if (rc != 0) {
        throw error {
              make_error_code(errc::socket_error)
            , tr::_("listen failure")
            , pfs::system_error_text()
        };
    }
}

tcp_listener::~tcp_listener ()
{
    if (_socket >= 0) {
        ::close(_socket);
        _socket = tcp_connection::INVALID_SOCKET;
    }
}

std::uint16_t tcp_listener::port () const
{
    sockaddr_in sa;
    socklen_t len = sizeof(sa);

    if (::getsockname(_socket, reinterpret_cast<sockaddr *>(& sa), & len) != 0) {
        throw error {
              make_error_code(errc::socket_error)
            , tr::_("get socket name failure")
            , pfs::system_error_text()
        };
    }

    return pfs::to_native_order(sa.sin_port);
}

std::unique_ptr<tcp_connection> tcp_listener::accept ()
{
    for (;;) {
        sockaddr_in sa;
        socklen_t addrlen = sizeof(sa);
        auto sock = ::accept(_socket, reinterpret_cast<sockaddr *>(& sa), & addrlen);

        if (sock >= 0)
            return std::unique_ptr<tcp_connection>(new tcp_connection(sock));

        if (errno == EINTR)
            continue;

        throw error {
              make_error_code(errc::socket_error)
            , tr::_("socket accept failure")
            , pfs::system_error_text()
        };
    }
}

} // namespace posix

PIXWIRE__NAMESPACE_END
