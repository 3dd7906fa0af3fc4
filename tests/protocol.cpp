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
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/header.hpp"
#include "pfs/pixwire/memory_pipe.hpp"
#include "pfs/pixwire/protocol.hpp"
#include "pfs/pixwire/scheduler.hpp"
#include "pfs/pixwire/serializer.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <utility>

using pixwire::value;
using pixwire::packet;
using pixwire::protocol;
using pixwire::protocol_state;
using pixwire::engine_config;

namespace {

engine_config test_config ()
{
    engine_config config;
    config.hangup_delay = std::chrono::milliseconds{50};
    config.invalid_hangup_delay = std::chrono::milliseconds{50};
    config.max_packet_size_recheck_delay = std::chrono::milliseconds{100};
    config.flush_retry_interval = std::chrono::milliseconds{10};
    return config;
}

std::shared_ptr<protocol> make_protocol (pixwire::scheduler & sched
    , std::unique_ptr<pixwire::memory_connection> conn, tools::packet_recorder & rec
    , engine_config config = test_config())
{
    auto proto = std::make_shared<protocol>(sched, std::move(conn), std::move(config));
    proto->enable_encoder(pixwire::serializer_enum::rencodeplus);
    proto->enable_compressor(pixwire::compressor_enum::zlib);

    proto->on_packet = [& rec] (protocol &, packet && pkt) {
        rec.push(std::move(pkt));
    };

    return proto;
}

} // namespace

TEST_CASE("construction") {
    pixwire::thread_scheduler sched;

    try {
        protocol p {sched, std::unique_ptr<pixwire::connection>{}};
        CHECK(false);
    } catch (pixwire::error const & ex) {
        CHECK(ex.code() == pixwire::make_error_code(pixwire::errc::invalid_argument));
    }

    auto config = test_config();
    config.compression_level = 12;

    try {
        protocol p {sched, pixwire::make_memory_pipe().first, config};
        CHECK(false);
    } catch (pixwire::error const & ex) {
        CHECK(ex.code() == pixwire::make_error_code(pixwire::errc::invalid_argument));
    }
}

TEST_CASE("states") {
    tools::packet_recorder rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();
    auto proto = make_protocol(sched, std::move(pipe.first), rec);

    CHECK_EQ(proto->state(), protocol_state::idle);

    // Authentication can only start after start()
    proto->mark_authenticating();
    CHECK_EQ(proto->state(), protocol_state::idle);

    proto->start();
    CHECK_EQ(proto->state(), protocol_state::started);

    proto->mark_authenticating();
    CHECK_EQ(proto->state(), protocol_state::authenticating);

    proto->mark_open();
    CHECK_EQ(proto->state(), protocol_state::open);

    proto->close("done");
    CHECK_EQ(proto->state(), protocol_state::closed);
    CHECK(proto->is_closed());

    // Closed is final
    proto->mark_open();
    CHECK_EQ(proto->state(), protocol_state::closed);

    CHECK_EQ(std::string{pixwire::to_string(protocol_state::authenticating)}
        , std::string{"authenticating"});

    REQUIRE(rec.wait_for(pixwire::CONNECTION_LOST));
    CHECK(proto->wait_for_io_threads_exit(std::chrono::milliseconds{2000}));
}

TEST_CASE("close is idempotent") {
    tools::packet_recorder rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();
    auto peer = std::move(pipe.second);
    auto proto = make_protocol(sched, std::move(pipe.first), rec);

    proto->start();
    proto->close("first reason");
    proto->close("second reason");

    REQUIRE(rec.wait_for(pixwire::CONNECTION_LOST));
    tools::sleep_ms(100);

    auto lost = rec.packets(pixwire::CONNECTION_LOST);
    REQUIRE_EQ(lost.size(), 1);
    REQUIRE_EQ(lost[0].size(), 2);
    CHECK_EQ(lost[0][1].as_string(), std::string{"first reason"});

    CHECK_FALSE(proto->send_now(packet{value{"ping"}, value{1}}));

    // Peer sees end of stream
    char buf[4];
    CHECK_EQ(peer->read(buf, sizeof(buf)), 0);

    // Flush of the closed protocol completes at once
    std::atomic_bool done {false};
    proto->flush_then_close(packet{value{"disconnect"}}, [& done] () { done = true; });
    CHECK(tools::wait_atomic_bool(done));
}

TEST_CASE("close without reason") {
    tools::packet_recorder rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();
    auto proto = make_protocol(sched, std::move(pipe.first), rec);

    proto->close();

    REQUIRE(rec.wait_for(pixwire::CONNECTION_LOST));

    auto lost = rec.packets(pixwire::CONNECTION_LOST);
    CHECK_EQ(lost[0].size(), 1);
}

TEST_CASE("end of stream") {
    tools::packet_recorder rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();
    auto peer = std::move(pipe.second);
    auto proto = make_protocol(sched, std::move(pipe.first), rec);

    proto->start();
    peer->close();

    REQUIRE(rec.wait_for(pixwire::CONNECTION_LOST));
    CHECK(proto->is_closed());
    CHECK(proto->wait_for_io_threads_exit(std::chrono::milliseconds{2000}));
}

TEST_CASE("gibberish") {
    tools::packet_recorder rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();
    auto peer = std::move(pipe.second);
    auto proto = make_protocol(sched, std::move(pipe.first), rec);

    proto->start();

    std::string request {"GET / HTTP/1.1\r\nHost: localhost\r\n\r\n"};
    peer->write_all(request.data(), request.size());

    REQUIRE(rec.wait_for(pixwire::GIBBERISH));
    REQUIRE(rec.wait_for(pixwire::CONNECTION_LOST));

    auto all = rec.packets();
    REQUIRE_EQ(all.size(), 2);
    CHECK_EQ(pixwire::packet_type(all[0]), std::string{pixwire::GIBBERISH});
    CHECK_EQ(pixwire::packet_type(all[1]), std::string{pixwire::CONNECTION_LOST});

    REQUIRE_EQ(all[0].size(), 3);
    CHECK_EQ(all[0][1].as_string().find("invalid packet header byte 0x47"), std::size_t{0});
    CHECK(all[0][2].is_bytes());

    // Hangup reason is the gibberish message
    REQUIRE_EQ(all[1].size(), 2);
    CHECK_EQ(all[1][1].as_string(), all[0][1].as_string());
}

TEST_CASE("send_now with packet source") {
    tools::packet_recorder rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();
    auto proto = make_protocol(sched, std::move(pipe.first), rec);

    proto->set_packet_source([] (packet &, bool &) { return false; });

    try {
        proto->send_now(packet{value{"ping"}});
        CHECK(false);
    } catch (pixwire::error const & ex) {
        CHECK(ex.code() == pixwire::make_error_code(pixwire::errc::invalid_argument));
    }
}

TEST_CASE("send_now without encoder") {
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();
    auto proto = std::make_shared<protocol>(sched, std::move(pipe.first), test_config());

    try {
        proto->send_now(packet{value{"ping"}});
        CHECK(false);
    } catch (pixwire::error const & ex) {
        CHECK(ex.code() == pixwire::make_error_code(pixwire::errc::encoding_error));
    }
}

TEST_CASE("settings") {
    tools::packet_recorder rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();
    auto proto = make_protocol(sched, std::move(pipe.first), rec);

    CHECK_THROWS_AS(proto->set_compression_level(11), pixwire::error);
    CHECK_THROWS_AS(proto->set_compression_level(-1), pixwire::error);
    CHECK_NOTHROW(proto->set_compression_level(0));
    CHECK_NOTHROW(proto->set_compression_level(10));

    CHECK_EQ(proto->max_packet_size(), 16 * 1024 * 1024);
    CHECK_THROWS_AS(proto->set_max_packet_size(proto->config().abs_max_packet_size + std::size_t{1})
        , pixwire::error);
    proto->set_max_packet_size(proto->config().abs_max_packet_size);
    CHECK_EQ(proto->max_packet_size(), proto->config().abs_max_packet_size);
}

TEST_CASE("encode with aliases") {
    tools::packet_recorder rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();
    auto proto = make_protocol(sched, std::move(pipe.first), rec);
    auto const & ser = pixwire::get_serializer(pixwire::serializer_enum::rencodeplus);

    proto->set_send_aliases({{"ping", 5}});

    auto chunks = proto->encode(packet{value{"ping"}, value{1}});
    REQUIRE_EQ(chunks.size(), 1);

    auto pkt = ser.decode(chunks[0].data.data(), chunks[0].data.size());
    REQUIRE_EQ(pkt.size(), 2);
    REQUIRE(pkt[0].is_integer());
    CHECK_EQ(pkt[0].as_integer(), 5);

    // Unknown types are sent by name
    chunks = proto->encode(packet{value{"pong"}, value{1}});
    pkt = ser.decode(chunks[0].data.data(), chunks[0].data.size());
    CHECK_EQ(pkt[0].as_string(), std::string{"pong"});
}

TEST_CASE("save and restore state") {
    tools::packet_recorder rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();
    auto a = make_protocol(sched, std::move(pipe.first), rec);
    auto b = make_protocol(sched, std::move(pipe.second), rec);

    a->enable_encoder(pixwire::serializer_enum::bencode);
    a->set_compression_level(3);
    a->enable_chunks(false);
    a->set_max_packet_size(1000);
    a->set_send_aliases({{"ping", 1}});
    a->set_receive_aliases({{2, "pong"}});

    auto state = a->save_state();

    CHECK_EQ(state.find("serializer")->as_string(), std::string{"bencode"});
    CHECK_EQ(state.find("compressor")->as_string(), std::string{"zlib"});
    CHECK_EQ(state.find("compression_level")->as_integer(), 3);
    CHECK_FALSE(state.find("chunks")->as_boolean());
    CHECK_EQ(state.find("max_packet_size")->as_integer(), 1000);

    b->restore_state(state);

    CHECK(b->save_state() == state);
    CHECK_EQ(b->max_packet_size(), 1000);

    SUBCASE("lz4 compressor") {
        a->enable_compressor(pixwire::compressor_enum::lz4);
        auto lz4_state = a->save_state();
        CHECK_EQ(lz4_state.find("compressor")->as_string(), std::string{"lz4"});

        b->restore_state(lz4_state);
        CHECK_EQ(b->get_info().find("compressor")->as_string(), std::string{"lz4"});
    }

    SUBCASE("malformed state") {
        CHECK_THROWS_AS(b->restore_state(value{1}), pixwire::error);

        auto bad = value::make_dict();
        bad.set(value{"serializer"}, value{"json"});
        CHECK_THROWS_AS(b->restore_state(bad), pixwire::error);

        auto bad_compressor = value::make_dict();
        bad_compressor.set(value{"compressor"}, value{"lzma"});
        CHECK_THROWS_AS(b->restore_state(bad_compressor), pixwire::error);
    }
}

TEST_CASE("info") {
    tools::packet_recorder rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();
    auto peer = std::move(pipe.second);
    auto proto = make_protocol(sched, std::move(pipe.first), rec);

    auto info = proto->get_info();

    CHECK_EQ(info.find("type")->as_string(), std::string{"memory"});
    CHECK_EQ(info.find("endpoint.local")->as_string(), std::string{"memory:a"});
    CHECK_EQ(info.find("endpoint.remote")->as_string(), std::string{"memory:b"});
    CHECK_EQ(info.find("state")->as_string(), std::string{"idle"});
    CHECK_EQ(info.find("encoder")->as_string(), std::string{"rencodeplus"});
    CHECK_EQ(info.find("compressor")->as_string(), std::string{"zlib"});
    CHECK_EQ(info.find("cipher.in")->as_string(), std::string{});
    CHECK_EQ(info.find("input.packetcount")->as_integer(), 0);
    CHECK_FALSE(info.find("threads")->find("read")->as_boolean());

    proto->start();
    REQUIRE(proto->send_now(packet{value{"ping"}, value{1}}));
    REQUIRE(proto->send_now(packet{value{"ping"}, value{2}}));

    // Drain the peer side so the writer never blocks
    std::size_t total = 0;
    char buf[256];

    while (total < 2 * pixwire::HEADER_SIZE) {
        auto n = peer->read(buf, sizeof(buf));
        REQUIRE(n > 0);
        total += static_cast<std::size_t>(n);
    }

    info = proto->get_info();

    CHECK_EQ(info.find("state")->as_string(), std::string{"started"});
    CHECK(info.find("threads")->find("read")->as_boolean());
    CHECK_EQ(info.find("output.packetcount")->as_integer(), 2);
    REQUIRE(info.find("output.packets")->find("ping") != nullptr);
    CHECK_EQ(info.find("output.packets")->find("ping")->as_integer(), 2);
}

TEST_CASE("oversized packet") {
    tools::packet_recorder sender_rec;
    tools::packet_recorder receiver_rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();

    auto receiver_config = test_config();
    receiver_config.max_packet_size = 100;

    auto sender = make_protocol(sched, std::move(pipe.first), sender_rec);
    auto receiver = make_protocol(sched, std::move(pipe.second), receiver_rec, receiver_config);

    sender->set_compression_level(0);

    SUBCASE("limit is not raised") {
        receiver->start();
        REQUIRE(sender->send_now(packet{value{"big"}, value{tools::random_bytes(500)}}));

        REQUIRE(receiver_rec.wait_for(pixwire::INVALID));
        REQUIRE(receiver_rec.wait_for(pixwire::CONNECTION_LOST));

        auto invalid = receiver_rec.packets(pixwire::INVALID);
        CHECK_EQ(invalid[0][1].as_string().find("packet size requested is"), std::size_t{0});
    }

    SUBCASE("limit raised by negotiation") {
        // Capabilities arrive in the same packet the limit is verified against
        receiver->on_packet = [& receiver_rec] (protocol & p, packet && pkt) {
            if (pixwire::packet_type(pkt) == "big")
                p.set_max_packet_size(1024 * 1024);

            receiver_rec.push(std::move(pkt));
        };

        receiver->start();
        REQUIRE(sender->send_now(packet{value{"big"}, value{tools::random_bytes(500)}}));

        REQUIRE(receiver_rec.wait_for("big"));
        tools::sleep_ms(300);

        CHECK_EQ(receiver_rec.count(pixwire::INVALID), 0);
        CHECK_FALSE(receiver->is_closed());
    }
}

TEST_CASE("packet source") {
    tools::packet_recorder sender_rec;
    tools::packet_recorder receiver_rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe(1024);

    auto sender = make_protocol(sched, std::move(pipe.first), sender_rec);
    auto receiver = make_protocol(sched, std::move(pipe.second), receiver_rec);

    int const total = 20;
    int next = 0;

    sender->set_packet_source([& next, total] (packet & pkt, bool & more) {
        if (next >= total)
            return false;

        pkt = packet{value{"draw"}, value{next}, value{tools::random_bytes(100
            , static_cast<std::uint32_t>(next))}};
        ++next;
        more = next < total;
        return true;
    });

    receiver->start();
    sender->start();
    sender->source_has_more();

    REQUIRE(receiver_rec.wait_for("draw", total));

    auto received = receiver_rec.packets("draw");

    for (int i = 0; i < total; i++) {
        CHECK_EQ(received[i][1].as_integer(), i);
        CHECK(received[i][2].as_bytes() == tools::random_bytes(100, static_cast<std::uint32_t>(i)));
    }

    CHECK_FALSE(receiver->receive_pending());
}

TEST_CASE("last reference released from packet callback") {
    tools::packet_recorder client_rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe();

    auto client = make_protocol(sched, std::move(pipe.first), client_rec);
    auto server = std::make_shared<protocol>(sched, std::move(pipe.second), test_config());
    server->enable_encoder(pixwire::serializer_enum::rencodeplus);
    server->enable_compressor(pixwire::compressor_enum::zlib);

    std::weak_ptr<protocol> server_weak = server;
    std::atomic_bool released {false};
    std::atomic_int packetcount {0};

    // Server drops the connection on disconnect, usual pattern of the embedding application
    server->on_packet = [& server, & released, & packetcount] (protocol & p, packet && pkt) {
        if (pixwire::packet_type(pkt) != "disconnect")
            return;

        server.reset();

        // Instance stays valid until the callback returns
        packetcount = static_cast<int>(p.get_info().find("input.packetcount")->as_integer());
        released = true;
    };

    server->start();
    client->start();

    REQUIRE(client->send_now(packet{value{"ping"}, value{1}}));
    REQUIRE(client->send_now(packet{value{"disconnect"}, value{"bye"}}));

    REQUIRE(tools::wait_atomic_bool(released));
    CHECK_EQ(packetcount.load(), 2);

    // Destroyed on the scheduler, so the client sees the end of stream
    REQUIRE(client_rec.wait_for(pixwire::CONNECTION_LOST));

    pfs::countdown_timer<std::milli> timer {std::chrono::milliseconds{5000}};

    while (!server_weak.expired() && timer.remain_count() > 0)
        tools::sleep_ms(10);

    CHECK(server_weak.expired());
}

TEST_CASE("backpressure") {
    tools::packet_recorder rec;
    pixwire::thread_scheduler sched;
    auto pipe = pixwire::make_memory_pipe(64);
    auto peer = std::move(pipe.second);
    auto sender = make_protocol(sched, std::move(pipe.first), rec);

    int const total = 50;
    std::atomic_int pulled {0};

    sender->set_packet_source([& pulled, total] (packet & pkt, bool & more) {
        auto n = pulled.load();

        if (n >= total)
            return false;

        pkt = packet{value{"draw"}, value{n}, value{tools::random_bytes(1000
            , static_cast<std::uint32_t>(n))}};
        pulled = n + 1;
        more = n + 1 < total;
        return true;
    });

    sender->start();
    sender->source_has_more();

    // Peer does not read: one frame is being written, one is queued, the format thread is
    // blocked pushing the next one
    tools::sleep_ms(200);
    auto stalled = pulled.load();
    tools::sleep_ms(200);

    CHECK_GE(stalled, 1);
    CHECK_LE(stalled, 4);
    CHECK_EQ(pulled.load(), stalled);
    CHECK_FALSE(sender->is_closed());
    CHECK(rec.packets().empty());

    // Draining the peer resumes the packet source
    std::atomic_bool stop {false};
    peer->set_timeout(std::chrono::milliseconds{20});

    std::thread drain {[& peer, & stop] () {
        char buf[512];

        while (!stop.load()) {
            if (peer->read(buf, sizeof(buf)) == 0)
                break;
        }
    }};

    CHECK(tools::wait_atomic_counter(pulled, total));
    CHECK_FALSE(sender->is_closed());

    stop = true;
    drain.join();
}
