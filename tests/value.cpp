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
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/value.hpp"
#include <string>

using pixwire::value;
using pixwire::packet;

TEST_CASE("kinds") {
    CHECK(value{}.is_null());
    CHECK(value{true}.is_boolean());
    CHECK(value{42}.is_integer());
    CHECK(value{std::int64_t{-1}}.is_integer());
    CHECK(value{"text"}.is_string());
    CHECK(value::make_bytes("raw").is_bytes());
    CHECK(value::make_list({1, 2}).is_list());
    CHECK(value::make_dict().is_dict());

    CHECK_EQ(value{42}.as_integer(), 42);
    CHECK(value{true}.as_boolean());
    CHECK_EQ(value{"text"}.as_string(), std::string{"text"});
    CHECK_EQ(value::make_bytes("raw").size(), 3);

    CHECK_THROWS_AS(value{"text"}.as_integer(), pixwire::error);
    CHECK_THROWS_AS(value{42}.as_string(), pixwire::error);
    CHECK_THROWS_AS(value{42}.as_list(), pixwire::error);
}

TEST_CASE("wrappers") {
    auto c = value::make_compressed("png", value::bytes_type(100, 'x'), 0, true);
    CHECK(c.is_compressed());
    CHECK_FALSE(c.level_compressed());
    CHECK(c.can_inline());
    CHECK_EQ(c.datatype(), std::string{"png"});
    CHECK_EQ(c.size(), 100);

    auto lc = value::make_compressed("zlib", value::bytes_type(10, 'x'), 0x01);
    CHECK(lc.level_compressed());
    CHECK_EQ(lc.level(), 0x01);

    auto cc = value::make_compressible("rgb24", value::bytes_type(20, 'y'));
    CHECK(cc.is_compressible());
    CHECK_EQ(cc.as_bytes().size(), 20);

    auto ls = value::make_large_structure("hello", value::make_list({1, 2, 3}));
    CHECK(ls.is_large_structure());
    CHECK_EQ(ls.size(), 3);
    CHECK_EQ(ls.inner(), value::make_list({1, 2, 3}));
}

TEST_CASE("dict order") {
    auto d1 = value::make_dict({{"b", 2}, {"a", 1}});
    auto d2 = value::make_dict({{"a", 1}, {"b", 2}});

    CHECK_EQ(d1, d2);
    REQUIRE_EQ(d1.as_dict().size(), 2);
    CHECK_EQ(d1.as_dict()[0].first, value{"a"});

    d1.set("c", 3);
    d1.set("a", 10);
    CHECK_EQ(d1.size(), 3);
    REQUIRE(d1.find("a") != nullptr);
    CHECK_EQ(d1.find("a")->as_integer(), 10);
    CHECK(d1.find("z") == nullptr);
    CHECK(value{1}.find("a") == nullptr);

    // Byte string keys are matched by content
    auto d3 = value::make_dict({{value::make_bytes("key"), "v"}});
    REQUIRE(d3.find("key") != nullptr);
    CHECK_EQ(d3.find("key")->as_string(), std::string{"v"});
}

TEST_CASE("compare") {
    CHECK(value{1} < value{2});
    CHECK(value{"a"} < value{"b"});
    CHECK(value{"ab"} < value{"abc"});
    CHECK_NE(value{"a"}, value::make_bytes("a"));
    CHECK_NE(value{1}, value{true});
    CHECK_EQ(value::make_list({1, "x"}), value::make_list({1, "x"}));
}

TEST_CASE("to_string") {
    packet pkt {"draw", 1, value::make_bytes(std::string(1000, 'x'))
        , value::make_dict({{"k", true}})};

    CHECK_EQ(pixwire::to_string(pkt), std::string{R"(["draw", 1, bytes(1000), {"k": true}])"});
    CHECK_EQ(pixwire::to_string(value{std::string(300, 'a')}, 4), std::string{"\"aaaa...\""});
    CHECK_EQ(pixwire::to_string(value::make_compressed("png", value::bytes_type(5, 'x')))
        , std::string{"Compressed(png: 5 bytes)"});
}

TEST_CASE("packet type") {
    CHECK_EQ(pixwire::packet_type(packet{"ping", 1}), std::string{"ping"});
    CHECK_EQ(pixwire::packet_type(packet{7, 1}), std::string{"7"});
    CHECK_EQ(pixwire::packet_type(packet{}), std::string{});
}

TEST_CASE("validate packet") {
    CHECK_NOTHROW(pixwire::validate_packet(packet{"ping", 1, value::make_list({1, "x"})}));
    CHECK_NOTHROW(pixwire::validate_packet(packet{3}));

    CHECK_THROWS_AS(pixwire::validate_packet(packet{}), pixwire::error);
    CHECK_THROWS_AS(pixwire::validate_packet(packet{value::make_list({})}), pixwire::error);
    CHECK_THROWS_AS(pixwire::validate_packet(packet{"ping", value{}}), pixwire::error);
    CHECK_THROWS_AS(pixwire::validate_packet(packet{"ping"
        , value::make_list({1, value::make_dict({{"k", value{}}})})}), pixwire::error);

    try {
        pixwire::validate_packet(packet{"ping", 1, value{}});
        CHECK(false);
    } catch (pixwire::error const & ex) {
        CHECK(ex.code() == pixwire::make_error_code(pixwire::errc::encoding_error));
    }
}
