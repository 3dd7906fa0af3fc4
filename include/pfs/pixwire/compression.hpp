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
#include "exports.hpp"
#include <cstdint>
#include <string>
#include <vector>

PIXWIRE__NAMESPACE_BEGIN

enum class compressor_enum: std::uint8_t
{
      none = 0
    , zlib
    , lz4
};

//
// Compression level byte (header byte 2):
// +-------------------------------+
// | 7 | 6 | 5 | 4 | 3 | 2 | 1 | 0 |
// +-------------------------------+
// |  algorithm    |     level     |
// +-------------------------------+
// Level 0 means uncompressed payload.
//
// lz4 payload is prefixed by the uncompressed size (4 bytes, little-endian).
//
constexpr std::uint8_t ZLIB_FLAG   = 0x00;
constexpr std::uint8_t LZ4_FLAG    = 0x10;
constexpr std::uint8_t BROTLI_FLAG = 0x40; // Reserved
constexpr std::uint8_t COMPRESSION_ALGORITHM_MASK = 0xF0;
constexpr std::uint8_t COMPRESSION_LEVEL_MASK     = 0x0F;

constexpr int MAX_COMPRESSION_LEVEL = 10;

struct compressed_data
{
    std::uint8_t level {0}; // Level byte for the header
    std::vector<char> data;
};

/**
 * Compresses @a data.
 *
 * @param level Requested level in range [1, MAX_COMPRESSION_LEVEL], clamped to what the
 *        algorithm supports. lz4 ignores it apart from the level byte.
 *
 * @throws error {errc::invalid_argument} if @a c is @c compressor_enum::none or @a level is
 *         out of range.
 */
PIXWIRE__EXPORT compressed_data compress (compressor_enum c, char const * data, std::size_t n
    , int level);

/**
 * Decompresses @a data according to header level byte @a level.
 *
 * @throws error {errc::invalid_compression} on unknown or unsupported algorithm bits.
 * @throws error {errc::decompression_error} on corrupt stream or when output exceeds
 *         @a max_size.
 */
PIXWIRE__EXPORT std::vector<char> decompress (char const * data, std::size_t n
    , std::uint8_t level, std::size_t max_size);

/**
 * Algorithm name for the level byte ("zlib", "lz4", "brotli" or empty for unknown).
 */
PIXWIRE__EXPORT std::string compression_type (std::uint8_t level);

PIXWIRE__EXPORT char const * to_string (compressor_enum c) noexcept;
PIXWIRE__EXPORT bool parse_compressor (std::string const & name, compressor_enum & result) noexcept;

PIXWIRE__NAMESPACE_END
