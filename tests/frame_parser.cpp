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
#include "pfs/pixwire/compression.hpp"
#include "pfs/pixwire/frame_parser.hpp"
#include "pfs/pixwire/header.hpp"
#include "pfs/pixwire/packet_encoder.hpp"
#include <memory>
#include <string>
#include <vector>

using pixwire::value;
using pixwire::packet;

namespace {

struct events
{
    std::vector<packet> packets;
    std::vector<bool> flush_hints;
    std::vector<std::string> gibberish;
    std::vector<std::vector<char>> gibberish_data;
    std::vector<std::string> invalid;
    std::vector<std::string> decryption_errors;
    std::vector<std::size_t> oversized;

    void attach (pixwire::frame_parser & parser)
    {
        parser.on_packet = [this] (packet && pkt, bool flush) {
            packets.push_back(std::move(pkt));
            flush_hints.push_back(flush);
        };

        parser.on_gibberish = [this] (std::string const & msg, std::vector<char> const & data) {
            gibberish.push_back(msg);
            gibberish_data.push_back(data);
        };

        parser.on_invalid = [this] (std::string const & msg, std::vector<char> const &) {
            invalid.push_back(msg);
        };

        parser.on_decryption_error = [this] (std::string const & msg) {
            decryption_errors.push_back(msg);
        };

        parser.on_oversized = [this] (std::size_t size, std::vector<char> const & header) {
            CHECK_EQ(header.size(), pixwire::HEADER_SIZE);
            oversized.push_back(size);
        };
    }

    bool no_errors () const
    {
        return gibberish.empty() && invalid.empty() && decryption_errors.empty();
    }
};

void append_frame (std::string & out, std::uint8_t flags, std::uint8_t level, std::uint8_t index
    , std::vector<char> const & data)
{
    auto h = pixwire::pack_header(flags, level, index, data.size());
    out.append(h.data(), h.size());
    out.append(data.begin(), data.end());
}

pixwire::encoder_settings encoder_settings ()
{
    pixwire::encoder_settings s;
    s.ser = & pixwire::get_serializer(pixwire::serializer_enum::rencodeplus);
    s.compressor = pixwire::compressor_enum::zlib;
    s.compression_level = 1;
    return s;
}

std::string make_frames (packet const & pkt, bool flush = true)
{
    std::string out;

    for (auto const & c: pixwire::encode_packet(pkt, encoder_settings())) {
        auto flags = c.flags;

        if (c.index == 0 && flush)
            flags |= pixwire::FLAGS_FLUSH;

        append_frame(out, flags, c.level, c.index, c.data);
    }

    return out;
}

bool feed (pixwire::frame_parser & parser, std::string const & data)
{
    return parser.feed(data.data(), data.size());
}

} // namespace

TEST_CASE("single packet") {
    pixwire::frame_parser parser;
    events ev;
    ev.attach(parser);

    CHECK(feed(parser, make_frames(packet{"ping", 12345})));

    REQUIRE_EQ(ev.packets.size(), 1);
    CHECK_EQ(ev.packets[0], (packet{"ping", 12345}));
    CHECK(ev.flush_hints[0]);
    CHECK_FALSE(parser.receive_pending());
    CHECK_EQ(parser.buffered(), 0);
    CHECK(ev.no_errors());
}

TEST_CASE("feeding granularity") {
    auto text = std::string(5000, 't');
    auto ctext = pixwire::compress(pixwire::compressor_enum::zlib, text.data(), text.size(), 1);

    auto pixels1 = tools::random_bytes(1000, 1);
    auto pixels3 = tools::random_bytes(500, 3);

    packet pkt {"draw"
        , value::make_compressed("png", pixels1)
        , value::make_compressed("text", ctext.data, ctext.level)
        , value::make_compressed("png", pixels3)
        , 42};

    packet expected {"draw", value{pixels1}, value::make_bytes(text), value{pixels3}, 42};

    std::string data = make_frames(packet{"ping", 1}) + make_frames(pkt)
        + make_frames(packet{"pong", 2});

    // Three raw chunks and the main chunk
    CHECK_EQ(pixwire::encode_packet(pkt, encoder_settings()).size(), 4);

    pixwire::frame_parser parser1;
    events ev1;
    ev1.attach(parser1);
    CHECK(feed(parser1, data));

    pixwire::frame_parser parser2;
    events ev2;
    ev2.attach(parser2);

    for (char ch: data)
        CHECK(parser2.feed(& ch, 1));

    REQUIRE_EQ(ev1.packets.size(), 3);
    CHECK_EQ(ev1.packets[1], expected);
    CHECK_EQ(ev1.packets, ev2.packets);
    CHECK(ev1.no_errors());
    CHECK(ev2.no_errors());
}

TEST_CASE("receive pending") {
    pixwire::frame_parser parser;
    events ev;
    ev.attach(parser);

    CHECK(feed(parser, make_frames(packet{"ping", 1}, false)));
    REQUIRE_EQ(ev.packets.size(), 1);
    CHECK_FALSE(ev.flush_hints[0]);
    CHECK(parser.receive_pending());

    auto frames = make_frames(packet{"draw", value::make_compressed("png", tools::random_bytes(100))});

    // Only the raw chunk
    auto first_frame_size = pixwire::HEADER_SIZE + 100;
    CHECK(parser.feed(frames.data(), first_frame_size));
    CHECK_EQ(ev.packets.size(), 1);
    CHECK(parser.receive_pending());

    CHECK(parser.feed(frames.data() + first_frame_size, frames.size() - first_frame_size));
    CHECK_EQ(ev.packets.size(), 2);
    CHECK_FALSE(parser.receive_pending());
}

TEST_CASE("partial header") {
    pixwire::frame_parser parser;
    events ev;
    ev.attach(parser);

    auto frames = make_frames(packet{"ping", 1});

    CHECK(parser.feed(frames.data(), 3));
    CHECK_EQ(parser.buffered(), 3);
    CHECK(ev.packets.empty());
    CHECK(ev.no_errors());

    CHECK(parser.feed(frames.data() + 3, frames.size() - 3));
    CHECK_EQ(ev.packets.size(), 1);
}

TEST_CASE("size limit boundary") {
    pixwire::parser_settings settings;
    settings.abs_max_packet_size = 1024;
    settings.max_packet_size = 1024;

    // Packet that serializes to exactly 1024 bytes
    auto const & ser = pixwire::get_serializer(pixwire::serializer_enum::rencodeplus);
    packet pkt;

    for (std::size_t n = 900; n < 1024; n++) {
        packet p {"x", std::string(n, 'x')};

        if (ser.encode(p).size() == 1024) {
            pkt = p;
            break;
        }
    }

    REQUIRE_FALSE(pkt.empty());

    SUBCASE("at limit") {
        pixwire::frame_parser parser {settings};
        events ev;
        ev.attach(parser);

        std::string frame;
        append_frame(frame, 0x01 | pixwire::FLAGS_FLUSH, 0, 0, ser.encode(pkt));

        CHECK(feed(parser, frame));
        CHECK_EQ(ev.packets.size(), 1);
        CHECK(ev.oversized.empty());
        CHECK(ev.no_errors());
    }

    SUBCASE("above limit") {
        pixwire::frame_parser parser {settings};
        events ev;
        ev.attach(parser);

        std::string frame;
        auto data = ser.encode(pkt);
        data.push_back('\0');
        append_frame(frame, 0x01 | pixwire::FLAGS_FLUSH, 0, 0, data);

        CHECK_FALSE(feed(parser, frame));
        CHECK(ev.packets.empty());
        REQUIRE_EQ(ev.gibberish.size(), 1);
        CHECK_EQ(ev.gibberish[0].find("invalid size in packet header: 1025"), std::size_t{0});
        CHECK_EQ(ev.gibberish_data[0].size(), pixwire::HEADER_SIZE);
        CHECK(parser.failed());
    }
}

TEST_CASE("oversized frame") {
    pixwire::parser_settings settings;
    settings.max_packet_size = 100;

    pixwire::frame_parser parser {settings};
    events ev;
    ev.attach(parser);

    auto pkt = packet{"big", tools::random_bytes(200)};
    CHECK(feed(parser, make_frames(pkt)));

    // Reported, the decision is up to the owner
    REQUIRE_EQ(ev.oversized.size(), 1);
    CHECK_GT(ev.oversized[0], 200);
    CHECK_EQ(ev.packets.size(), 1);

    parser.set_max_packet_size(1000);
    CHECK_EQ(parser.max_packet_size(), 1000);
    CHECK(feed(parser, make_frames(pkt)));
    CHECK_EQ(ev.oversized.size(), 1);
}

TEST_CASE("gibberish") {
    pixwire::frame_parser parser;
    events ev;
    ev.attach(parser);

    SUBCASE("http") {
        std::string request = "GET / HTTP/1.1\r\n";

        CHECK_FALSE(feed(parser, request));
        REQUIRE_EQ(ev.gibberish.size(), 1);
        CHECK_EQ(ev.gibberish[0], std::string{"invalid packet header byte 0x47: http"});
        CHECK_EQ(tools::to_string(ev.gibberish_data[0]), request);
    }

    SUBCASE("binary") {
        CHECK_FALSE(feed(parser, std::string{"\x01\x02"}));
        REQUIRE_EQ(ev.gibberish.size(), 1);
        CHECK_EQ(ev.gibberish[0]
            , std::string{"invalid packet header byte 0x01: 0x0102 read buffer=\\x01\\x02 (2 bytes)"});
    }

    SUBCASE("invalid chunk index") {
        std::string frame;
        append_frame(frame, 0x01, 0, 5, tools::to_bytes("xxxx"));

        CHECK_FALSE(feed(parser, frame));
        REQUIRE_EQ(ev.gibberish.size(), 1);
        CHECK_EQ(ev.gibberish[0].find("invalid packet index: 5"), std::size_t{0});
    }

    SUBCASE("corrupt compressed payload") {
        std::string frame;
        append_frame(frame, 0x01 | pixwire::FLAGS_FLUSH, 0x01, 0, tools::to_bytes("not zlib data"));

        CHECK_FALSE(feed(parser, frame));
        REQUIRE_EQ(ev.gibberish.size(), 1);
        CHECK_EQ(ev.gibberish[0].find("zlib packet decompression failed"), std::size_t{0});
    }

    // Stopped parser ignores further input
    CHECK(parser.failed());
    CHECK_FALSE(feed(parser, make_frames(packet{"ping", 1})));
    CHECK(ev.packets.empty());
}

TEST_CASE("invalid frames") {
    pixwire::frame_parser parser;
    events ev;
    ev.attach(parser);

    SUBCASE("bad encoding") {
        std::string frame;
        append_frame(frame, 0x01 | pixwire::FLAGS_FLUSH, 0, 0, tools::to_bytes("\xC2\x84pi"));

        CHECK_FALSE(feed(parser, frame));
        REQUIRE_EQ(ev.invalid.size(), 1);
        CHECK_EQ(ev.invalid[0].find("invalid packet encoding"), std::size_t{0});
    }

    SUBCASE("unknown compression") {
        std::string frame;
        append_frame(frame, 0x01 | pixwire::FLAGS_FLUSH, pixwire::BROTLI_FLAG | 1, 0
            , tools::to_bytes("xxxx"));

        CHECK_FALSE(feed(parser, frame));
        REQUIRE_EQ(ev.invalid.size(), 1);
        CHECK_EQ(ev.invalid[0].find("invalid compression"), std::size_t{0});
    }

    SUBCASE("unknown alias") {
        CHECK_FALSE(feed(parser, make_frames(packet{7, "x"})));
        REQUIRE_EQ(ev.invalid.size(), 1);
        CHECK_EQ(ev.invalid[0], std::string{"unknown packet type alias: 7"});
    }

    SUBCASE("raw chunk beyond packet") {
        std::string frames;
        append_frame(frames, 0, 0, 3, tools::to_bytes("raw"));
        frames += make_frames(packet{"ping", 1});

        CHECK_FALSE(feed(parser, frames));
        REQUIRE_EQ(ev.invalid.size(), 1);
    }

    CHECK(ev.packets.empty());
}

TEST_CASE("aliases") {
    pixwire::frame_parser parser;
    events ev;
    ev.attach(parser);

    parser.set_receive_aliases({{1, "ping"}, {2, "pong"}});

    CHECK(feed(parser, make_frames(packet{2, "x"}) + make_frames(packet{1, "y"})));
    REQUIRE_EQ(ev.packets.size(), 2);
    CHECK_EQ(ev.packets[0], (packet{"pong", "x"}));
    CHECK_EQ(ev.packets[1], (packet{"ping", "y"}));
}

TEST_CASE("wait for header") {
    pixwire::parser_settings settings;
    settings.wait_for_header = true;

    pixwire::frame_parser parser {settings};
    events ev;
    ev.attach(parser);

    std::string banner = "Last login: Mon Oct 19 10:00:00 2026 from somewhere\r\nPlease wait...\r\n";

    // Banner and header split over several reads
    CHECK(feed(parser, banner.substr(0, 20)));
    CHECK(parser.waiting_for_header());
    CHECK(feed(parser, banner.substr(20) + make_frames(packet{"ping", 1})));

    CHECK_FALSE(parser.waiting_for_header());
    REQUIRE_EQ(ev.packets.size(), 1);
    CHECK_EQ(ev.packets[0], (packet{"ping", 1}));
    CHECK(ev.no_errors());
}

TEST_CASE("encryption") {
    auto params = pixwire::make_cipher_params("AES-CBC", tools::to_bytes("secret"));
    auto enc = std::make_shared<pixwire::cipher_state>(params
        , pixwire::cipher_state::direction::encrypt);
    auto dec = std::make_shared<pixwire::cipher_state>(params
        , pixwire::cipher_state::direction::decrypt);

    auto encrypted_frames = [enc] (packet const & pkt) {
        std::string out;

        for (auto const & c: pixwire::encode_packet(pkt, encoder_settings())) {
            auto ct = enc->encrypt(c.data.data(), c.data.size());
            auto flags = static_cast<std::uint8_t>(c.flags | pixwire::FLAGS_CIPHER
                | (c.index == 0 ? pixwire::FLAGS_FLUSH : 0));
            append_frame(out, flags, c.level, c.index, ct);
        }

        return out;
    };

    SUBCASE("decrypted") {
        pixwire::frame_parser parser;
        events ev;
        ev.attach(parser);
        parser.set_cipher(dec);

        auto pkt = packet{"draw", value::make_compressed("png", tools::random_bytes(1000))
            , std::string(1000, 'x')};

        CHECK(feed(parser, encrypted_frames(packet{"ping", 1}) + encrypted_frames(pkt)));
        REQUIRE_EQ(ev.packets.size(), 2);
        CHECK_EQ(ev.packets[0], (packet{"ping", 1}));
        CHECK_EQ(ev.packets[1][1], value{pkt[1].as_bytes()});
        CHECK_EQ(ev.packets[1][2], pkt[2]);
        CHECK(ev.no_errors());
    }

    SUBCASE("unencrypted frame") {
        pixwire::frame_parser parser;
        events ev;
        ev.attach(parser);
        parser.set_cipher(dec);

        CHECK_FALSE(feed(parser, make_frames(packet{"ping", 1})));
        REQUIRE_EQ(ev.invalid.size(), 1);
        CHECK_EQ(ev.invalid[0], std::string{"unencrypted packet dropped"});
    }

    SUBCASE("no cipher configured") {
        pixwire::frame_parser parser;
        events ev;
        ev.attach(parser);

        CHECK_FALSE(feed(parser, encrypted_frames(packet{"ping", 1})));
        CHECK_EQ(ev.gibberish.size(), 1);
    }

    SUBCASE("corrupted padding") {
        pixwire::frame_parser parser;
        events ev;
        ev.attach(parser);
        parser.set_cipher(dec);

        auto frame = encrypted_frames(packet{"ping", std::string(40, 'x')});
        REQUIRE_GT(frame.size(), pixwire::HEADER_SIZE + 32);
        frame[frame.size() - 17] ^= 0x40;

        CHECK_FALSE(feed(parser, frame));
        CHECK(ev.packets.empty());
        REQUIRE_EQ(ev.decryption_errors.size(), 1);
        CHECK_EQ(ev.decryption_errors[0].find("encryption error (wrong key?)"), std::size_t{0});
        CHECK(parser.failed());
    }
}
