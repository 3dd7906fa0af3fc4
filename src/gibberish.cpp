////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/gibberish.hpp"
#include "pfs/pixwire/header.hpp"
#include <pfs/i18n.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>

PIXWIRE__NAMESPACE_BEGIN

static constexpr std::size_t GUESS_SIZE = 32;
static constexpr std::uint32_t GUESS_MAX_SIZE = 256 * 1024 * 1024;

static bool starts_with (std::string const & s, char const * prefix)
{
    auto n = std::strlen(prefix);
    return s.size() >= n && s.compare(0, n, prefix) == 0;
}

std::string guess_packet_type (char const * data, std::size_t n)
{
    if (n == 0)
        return std::string{};

    std::string head(data, (std::min)(n, GUESS_SIZE));
    auto first = static_cast<std::uint8_t>(head[0]);

    if (looks_like_header(head.data(), head.size(), GUESS_MAX_SIZE))
        return "pixwire";

    if (starts_with(head, "SSH-"))
        return "ssh";

    // TLS handshake record
    if (first == 0x16)
        return "ssl";

    if (starts_with(head, "RFB "))
        return "vnc";

    // TPKT header
    if (head.size() >= 7 && head[0] == '\x03' && head[1] == '\x00') {
        auto size = static_cast<std::size_t>(static_cast<std::uint8_t>(head[2])) * 256
            + static_cast<std::uint8_t>(head[3]);

        if (head.size() >= size)
            return "rdp";
    }

    auto eol = head.find_first_of("\r\n");
    auto line1 = eol == std::string::npos ? head : head.substr(0, eol);

    auto http_pos = line1.find("HTTP/");

    if (http_pos != std::string::npos && http_pos > 0)
        return "http";

    auto method = line1.substr(0, line1.find(' '));

    if (method == "GET" || method == "POST")
        return "http";

    std::string lower(line1);
    std::transform(lower.begin(), lower.end(), lower.begin(), [] (char ch) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    });

    if (starts_with(lower, "<!doctype html") || starts_with(lower, "<html"))
        return "http";

    return std::string{};
}

std::string hexstr (char const * data, std::size_t n, std::size_t limit)
{
    static char const * digits = "0123456789abcdef";
    std::string result;
    auto count = (std::min)(n, limit);
    result.reserve(count * 2);

    for (std::size_t i = 0; i < count; i++) {
        auto b = static_cast<std::uint8_t>(data[i]);
        result += digits[b >> 4];
        result += digits[b & 0x0F];
    }

    return result;
}

std::string repr_ellipsized (char const * data, std::size_t n, std::size_t limit)
{
    std::string result;
    auto count = (std::min)(n, limit);

    for (std::size_t i = 0; i < count; i++) {
        auto ch = static_cast<unsigned char>(data[i]);

        if (ch == '\r') {
            result += "\\r";
        } else if (ch == '\n') {
            result += "\\n";
        } else if (std::isprint(ch)) {
            result += static_cast<char>(ch);
        } else {
            result += "\\x";
            result += hexstr(data + i, 1);
        }
    }

    if (n > limit)
        result += "...";

    return result;
}

std::string describe_invalid_header (char const * data, std::size_t n, std::string const & msg)
{
    auto guess = guess_packet_type(data, n);

    if (!guess.empty())
        return tr::f_("{}: {}", msg, guess);

    auto err = tr::f_("{}: 0x{}", msg, hexstr(data, n, HEADER_SIZE));

    if (n > 1)
        err += tr::f_(" read buffer={} ({} bytes)", repr_ellipsized(data, n), n);

    return err;
}

PIXWIRE__NAMESPACE_END
