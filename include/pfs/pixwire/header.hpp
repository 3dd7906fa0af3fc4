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
#include "archive.hpp"
#include "exports.hpp"
#include <array>
#include <cstddef>
#include <cstdint>

PIXWIRE__NAMESPACE_BEGIN

//
// Frame header format (8 bytes)
//
// +-----+-------+-------+-------+-----+-----+-----+-----+
// | 'P' | flags | level | index |        length         |
// +-----+-------+-------+-------+-----+-----+-----+-----+
//
// Byte 0     - 'P', marker
// Byte 1     - protocol flags (see below)
// Byte 2     - compression level byte (0 - uncompressed, see compression.hpp)
// Byte 3     - chunk index (0 - main packet, 1..3 - raw chunks)
// Bytes 4..7 - payload length in network byte order (after padding and encryption)
//
// Protocol flags:
// +-------------------------------+
// | 7 | 6 | 5 | 4 | 3 | 2 | 1 | 0 |
// +-------------------------------+
// | R | R | R | N | F | C |   S   |
// +-------------------------------+
// (S) - serializer that produced the payload (see serializer_enum).
// (C) - payload is encrypted.
// (F) - flush hint: last chunk of a burst, peer may process now.
// (N) - no header: plain passthrough, never present on the wire.
// (R) - reserved, must be zero.
//
constexpr std::size_t HEADER_SIZE = 8;
constexpr char HEADER_MARKER = 'P';

constexpr std::uint8_t FLAGS_SERIALIZER_MASK = 0x03;
constexpr std::uint8_t FLAGS_CIPHER          = 0x04;
constexpr std::uint8_t FLAGS_FLUSH           = 0x08;
constexpr std::uint8_t FLAGS_NOHEADER        = 0x10;
constexpr std::uint8_t FLAGS_RESERVED_MASK   = 0xE0;

// Indices 0..3 are valid, 4..15 are reserved.
constexpr std::uint8_t MAX_CHUNK_INDEX = 3;

struct frame_header
{
    char marker {HEADER_MARKER};
    std::uint8_t flags {0};
    std::uint8_t level {0};
    std::uint8_t index {0};
    std::uint32_t size {0};

    bool has_cipher () const noexcept
    {
        return (flags & FLAGS_CIPHER) != 0;
    }

    bool has_flush () const noexcept
    {
        return (flags & FLAGS_FLUSH) != 0;
    }

    std::uint8_t serializer_bits () const noexcept
    {
        return flags & FLAGS_SERIALIZER_MASK;
    }
};

using header_bytes = std::array<char, HEADER_SIZE>;

/**
 * Packs frame header.
 *
 * @throws error {errc::invalid_argument} if @a size is not representable by 4 bytes.
 */
PIXWIRE__EXPORT header_bytes pack_header (std::uint8_t flags, std::uint8_t level
    , std::uint8_t index, std::size_t size);

/**
 * Packs frame header and appends it to @a out.
 */
PIXWIRE__EXPORT void pack_header (archive & out, std::uint8_t flags, std::uint8_t level
    , std::uint8_t index, std::size_t size);

/**
 * Unpacks frame header from first HEADER_SIZE bytes of @a data.
 *
 * @throws error {errc::invalid_header} if @a n is less than HEADER_SIZE or the marker is wrong.
 */
PIXWIRE__EXPORT frame_header unpack_header (char const * data, std::size_t n);

/**
 * Checks whether the first bytes of @a data could be the first frame header of a connection:
 * index 0, no reserved bits, known serializer and a sane length below @a abs_max_size.
 */
PIXWIRE__EXPORT bool looks_like_header (char const * data, std::size_t n
    , std::uint32_t abs_max_size);

/**
 * Scans @a data for the position of the first plausible frame header.
 *
 * Used only while resynchronizing on a stream whose early bytes are not protocol data
 * (tunnel banners, shell output).
 *
 * @return Position of the header or -1 if not found.
 */
PIXWIRE__EXPORT std::ptrdiff_t find_marker (char const * data, std::size_t n
    , std::uint32_t abs_max_size);

PIXWIRE__NAMESPACE_END
