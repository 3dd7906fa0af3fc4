////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/fmt.hpp"
#include "pfs/log.hpp"
#include "pfs/string_view.hpp"
#include "pfs/pixwire/capabilities.hpp"
#include "pfs/pixwire/chrono.hpp"
#include "pfs/pixwire/engine_config.hpp"
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/protocol.hpp"
#include "pfs/pixwire/scheduler.hpp"
#include "pfs/pixwire/posix/tcp_connection.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static char const * TAG = "PING";
using string_view = pfs::string_view;

static std::vector<std::string> const PACKET_TYPES {"hello", "ping", "ping_echo", "disconnect"};

static struct program_context {
    std::string program;
    std::string addr {"127.0.0.1"};
    std::uint16_t port {10000};
    int count {10};
    bool server {false};
} __pctx;

static void print_usage ()
{
    fmt::print(stdout, "Usage\n\t{} [--server] [--addr=ip4_addr] [--port=port] [--count=n]\n"
        , __pctx.program);
    fmt::print(stdout, "\nRun server\n\t{} --server --addr=127.0.0.1\n", __pctx.program);
    fmt::print(stdout, "\nSend ping packets to server\n\t{} --addr=127.0.0.1 --count=5\n"
        , __pctx.program);
}

static std::int64_t now_us ()
{
    return std::chrono::duration_cast<std::chrono::microseconds>(
        pixwire::current_timepoint().time_since_epoch()).count();
}

static pixwire::packet make_hello (pixwire::protocol const & proto)
{
    return pixwire::packet {
          pixwire::value{"hello"}
        , pixwire::make_network_caps(proto.config(), pixwire::default_receive_aliases(PACKET_TYPES))
    };
}

static void wait_closed (std::atomic_bool & finished)
{
    while (!finished.load())
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
}

static void serve (pixwire::scheduler & sched, std::unique_ptr<pixwire::connection> conn)
{
    std::atomic_bool finished {false};
    auto proto = std::make_shared<pixwire::protocol>(sched, std::move(conn)
        , pixwire::engine_config::from_environment());

    proto->set_receive_aliases(pixwire::default_receive_aliases(PACKET_TYPES));

    proto->on_packet = [& finished] (pixwire::protocol & p, pixwire::packet && pkt) {
        auto type = pixwire::packet_type(pkt);

        if (type == "hello") {
            pixwire::apply_peer_caps(p, pkt.at(1));
            p.send_now(make_hello(p));
        } else if (type == "ping") {
            p.send_now(pixwire::packet{pixwire::value{"ping_echo"}, pkt.at(1)});
        } else if (type == "disconnect") {
            LOGI(TAG, "client disconnected: {}", pixwire::to_string(pkt));
        } else if (type == pixwire::CONNECTION_LOST) {
            finished = true;
        } else {
            LOGW(TAG, "unexpected packet: {}", pixwire::to_string(pkt));
        }
    };

    // Handshake happens in plain rencodeplus
    proto->enable_encoder(pixwire::serializer_enum::rencodeplus);
    proto->start();
    proto->mark_authenticating();

    wait_closed(finished);

    LOGI(TAG, "session info: {}", pixwire::to_string(proto->get_info(), 1024));
}

static void start_server ()
{
    LOGD(TAG, "Starting server on: {}:{}", __pctx.addr, __pctx.port);

    pixwire::thread_scheduler sched;
    pixwire::posix::tcp_listener listener {__pctx.addr, __pctx.port};

    while (true) {
        auto conn = listener.accept();
        LOGI(TAG, "Client accepted: {}", conn->remote_endpoint());
        serve(sched, std::move(conn));
    }
}

static void start_client ()
{
    LOGD(TAG, "Starting client");

    pixwire::thread_scheduler sched;
    std::atomic_bool finished {false};
    int received = 0;

    auto proto = std::make_shared<pixwire::protocol>(sched
        , pixwire::posix::tcp_connection::connect(__pctx.addr, __pctx.port)
        , pixwire::engine_config::from_environment());

    proto->set_receive_aliases(pixwire::default_receive_aliases(PACKET_TYPES));

    proto->on_packet = [& finished, & received] (pixwire::protocol & p, pixwire::packet && pkt) {
        auto type = pixwire::packet_type(pkt);

        if (type == "hello") {
            pixwire::apply_peer_caps(p, pkt.at(1));
            LOGI(TAG, "Connected to server: {}", p.conn().remote_endpoint());

            for (int i = 0; i < __pctx.count; i++)
                p.send_now(pixwire::packet{pixwire::value{"ping"}, pixwire::value{now_us()}});
        } else if (type == "ping_echo") {
            auto elapsed = now_us() - pkt.at(1).as_integer();
            LOGI(TAG, "ping_echo: {} us", elapsed);

            if (++received == __pctx.count)
                p.send_disconnect({"done"});
        } else if (type == pixwire::CONNECTION_LOST) {
            finished = true;
        } else {
            LOGW(TAG, "unexpected packet: {}", pixwire::to_string(pkt));
        }
    };

    proto->enable_encoder(pixwire::serializer_enum::rencodeplus);
    proto->start();
    proto->mark_authenticating();
    proto->send_now(make_hello(*proto));

    wait_closed(finished);
}

int main (int argc, char * argv[])
{
    __pctx.program = argv[0];

    for (int i = 1; i < argc; i++) {
        if (string_view{"-h"} == argv[i] || string_view{"--help"} == argv[i]) {
            print_usage();
            return EXIT_SUCCESS;
        } else if (string_view{"--server"} == argv[i]) {
            __pctx.server = true;
        } else if (std::strncmp(argv[i], "--addr=", 7) == 0) {
            __pctx.addr = argv[i] + 7;
        } else if (std::strncmp(argv[i], "--port=", 7) == 0) {
            __pctx.port = static_cast<std::uint16_t>(std::atoi(argv[i] + 7));
        } else if (std::strncmp(argv[i], "--count=", 8) == 0) {
            __pctx.count = std::atoi(argv[i] + 8);
        } else {
            LOGE(TAG, "Bad option: {}", argv[i]);
            return EXIT_FAILURE;
        }
    }

    if (__pctx.count <= 0) {
        LOGE(TAG, "Bad ping count: {}", __pctx.count);
        return EXIT_FAILURE;
    }

    try {
        if (__pctx.server)
            start_server();
        else
            start_client();
    } catch (pixwire::error const & ex) {
        LOGE(TAG, "ERROR: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
