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
#include "pfs/pixwire/error.hpp"
#include <string>

using pixwire::compressor_enum;

TEST_CASE("zlib") {
    std::string text;

    for (int i = 0; i < 1000; i++)
        text += "all work and no play makes jack a dull boy\n";

    auto c = pixwire::compress(compressor_enum::zlib, text.data(), text.size(), 1);

    CHECK_EQ(c.level, 0x01);
    CHECK_LT(c.data.size(), text.size());
    CHECK_EQ(pixwire::compression_type(c.level), std::string{"zlib"});

    auto d = pixwire::decompress(c.data.data(), c.data.size(), c.level, text.size());
    CHECK_EQ(tools::to_string(d), text);

    // Level is clamped to what zlib supports
    auto c10 = pixwire::compress(compressor_enum::zlib, text.data(), text.size(), 10);
    CHECK_EQ(c10.level, 0x09);
}

TEST_CASE("lz4") {
    std::string text;

    for (int i = 0; i < 1000; i++)
        text += "all work and no play makes jack a dull boy\n";

    auto c = pixwire::compress(compressor_enum::lz4, text.data(), text.size(), 3);

    CHECK_EQ(c.level, 0x13);
    CHECK_LT(c.data.size(), text.size());
    CHECK_EQ(pixwire::compression_type(c.level), std::string{"lz4"});

    // Uncompressed size prefix, little-endian
    REQUIRE_GT(c.data.size(), 4);
    auto size = static_cast<std::uint32_t>(static_cast<std::uint8_t>(c.data[0]))
        | (static_cast<std::uint32_t>(static_cast<std::uint8_t>(c.data[1])) << 8)
        | (static_cast<std::uint32_t>(static_cast<std::uint8_t>(c.data[2])) << 16)
        | (static_cast<std::uint32_t>(static_cast<std::uint8_t>(c.data[3])) << 24);
    CHECK_EQ(size, static_cast<std::uint32_t>(text.size()));

    auto d = pixwire::decompress(c.data.data(), c.data.size(), c.level, text.size());
    CHECK_EQ(tools::to_string(d), text);

    auto noise = tools::random_bytes(100000);
    auto cn = pixwire::compress(compressor_enum::lz4, noise.data(), noise.size(), 1);
    CHECK_EQ(pixwire::decompress(cn.data.data(), cn.data.size(), cn.level, noise.size()), noise);

    auto ce = pixwire::compress(compressor_enum::lz4, "", 0, 1);
    CHECK(pixwire::decompress(ce.data.data(), ce.data.size(), ce.level, 100).empty());
}

TEST_CASE("lz4 decompression failures") {
    auto expect = [] (std::vector<char> const & data, std::size_t max_size) {
        try {
            pixwire::decompress(data.data(), data.size(), pixwire::LZ4_FLAG | 0x01, max_size);
            CHECK(false);
        } catch (pixwire::error const & ex) {
            CHECK(ex.code() == pixwire::make_error_code(pixwire::errc::decompression_error));
        }
    };

    std::string text(10000, 'z');
    auto c = pixwire::compress(compressor_enum::lz4, text.data(), text.size(), 1);

    // Output exceeds the limit
    expect(c.data, 100);

    // Truncated stream
    auto truncated = c.data;
    truncated.resize(truncated.size() / 2);
    expect(truncated, text.size());

    // Size prefix only
    expect(std::vector<char>(c.data.begin(), c.data.begin() + 4), text.size());

    // Declared size does not match the stream
    auto wrong_size = c.data;
    wrong_size[0] = static_cast<char>(static_cast<std::uint8_t>(wrong_size[0]) + 1);
    expect(wrong_size, text.size() + 1000);
}

TEST_CASE("incompressible data") {
    auto data = tools::random_bytes(100000);
    auto c = pixwire::compress(compressor_enum::zlib, data.data(), data.size(), 5);
    auto d = pixwire::decompress(c.data.data(), c.data.size(), c.level, data.size());

    CHECK_EQ(d, data);
}

TEST_CASE("invalid arguments") {
    std::string text {"text"};

    CHECK_THROWS_AS(pixwire::compress(compressor_enum::none, text.data(), text.size(), 1)
        , pixwire::error);
    CHECK_THROWS_AS(pixwire::compress(compressor_enum::zlib, text.data(), text.size(), 0)
        , pixwire::error);
    CHECK_THROWS_AS(pixwire::compress(compressor_enum::zlib, text.data(), text.size(), 11)
        , pixwire::error);
}

TEST_CASE("decompression failures") {
    auto expect = [] (std::vector<char> const & data, std::uint8_t level, std::size_t max_size
            , pixwire::errc ec) {
        try {
            pixwire::decompress(data.data(), data.size(), level, max_size);
            CHECK(false);
        } catch (pixwire::error const & ex) {
            CHECK(ex.code() == pixwire::make_error_code(ec));
        }
    };

    std::string text(10000, 'z');
    auto c = pixwire::compress(compressor_enum::zlib, text.data(), text.size(), 1);

    // Output exceeds the limit
    expect(c.data, c.level, 100, pixwire::errc::decompression_error);

    // Truncated stream
    auto truncated = c.data;
    truncated.resize(truncated.size() / 2);
    expect(truncated, c.level, text.size(), pixwire::errc::decompression_error);

    // Not a zlib stream
    expect(tools::to_bytes("definitely not zlib"), 0x01, 1000, pixwire::errc::decompression_error);

    // Not an lz4 stream, size prefix is garbage
    expect(c.data, pixwire::LZ4_FLAG | 0x01, 1000, pixwire::errc::decompression_error);

    // Reserved and unknown algorithms, zero level
    expect(c.data, pixwire::BROTLI_FLAG | 0x01, 1000, pixwire::errc::invalid_compression);
    expect(c.data, 0x21, 1000, pixwire::errc::invalid_compression);
    expect(c.data, 0x00, 1000, pixwire::errc::invalid_compression);
}

TEST_CASE("names") {
    compressor_enum c = compressor_enum::none;

    CHECK(pixwire::parse_compressor("zlib", c));
    CHECK_EQ(c, compressor_enum::zlib);
    CHECK(pixwire::parse_compressor("none", c));
    CHECK_EQ(c, compressor_enum::none);
    CHECK(pixwire::parse_compressor("lz4", c));
    CHECK_EQ(c, compressor_enum::lz4);
    CHECK_FALSE(pixwire::parse_compressor("brotli", c));

    CHECK_EQ(std::string{pixwire::to_string(compressor_enum::zlib)}, std::string{"zlib"});
    CHECK_EQ(std::string{pixwire::to_string(compressor_enum::lz4)}, std::string{"lz4"});
    CHECK_EQ(pixwire::compression_type(pixwire::LZ4_FLAG | 3), std::string{"lz4"});
    CHECK_EQ(pixwire::compression_type(0x21), std::string{});
}
