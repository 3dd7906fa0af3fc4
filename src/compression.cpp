////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/compression.hpp"
#include "pfs/pixwire/error.hpp"
#include <pfs/i18n.hpp>
#include <pfs/numeric_cast.hpp>
#include <lz4.h>
#include <zlib.h>
#include <algorithm>
#include <limits>

PIXWIRE__NAMESPACE_BEGIN

static constexpr std::size_t INFLATE_CHUNK_SIZE = 64 * 1024;
static constexpr std::size_t LZ4_SIZE_PREFIX = 4;

static compressed_data zlib_compress (char const * data, std::size_t n, int level)
{
    auto source_len = pfs::numeric_cast<uLong>(n);
    auto zlevel = (std::min)(level, Z_BEST_COMPRESSION);
    uLongf dest_len = compressBound(source_len);

    compressed_data result;
    result.data.resize(dest_len);

    auto rc = compress2(reinterpret_cast<Bytef *>(result.data.data()), & dest_len
        , reinterpret_cast<Bytef const *>(data), source_len, zlevel);

    if (rc != Z_OK) {
        throw error {
              make_error_code(errc::unexpected_error)
            , tr::f_("zlib compression failure: {}", zError(rc))
        };
    }

    result.data.resize(dest_len);
    result.level = static_cast<std::uint8_t>(ZLIB_FLAG | (zlevel & COMPRESSION_LEVEL_MASK));
    return result;
}

static std::vector<char> zlib_decompress (char const * data, std::size_t n, std::size_t max_size)
{
    z_stream zs;
    zs.zalloc = Z_NULL;
    zs.zfree = Z_NULL;
    zs.opaque = Z_NULL;
    zs.next_in = Z_NULL;
    zs.avail_in = 0;

    auto rc = inflateInit(& zs);

    if (rc != Z_OK) {
        throw error {
              make_error_code(errc::unexpected_error)
            , tr::f_("zlib inflate initialization failure: {}", zError(rc))
        };
    }

    std::vector<char> result;
    std::size_t consumed = 0;

    do {
        auto chunk = (std::min)(n - consumed
            , static_cast<std::size_t>((std::numeric_limits<uInt>::max)()));
        zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data + consumed));
        zs.avail_in = static_cast<uInt>(chunk);

        do {
            auto offset = result.size();
            result.resize(offset + INFLATE_CHUNK_SIZE);
            zs.next_out = reinterpret_cast<Bytef *>(result.data() + offset);
            zs.avail_out = static_cast<uInt>(INFLATE_CHUNK_SIZE);

            rc = inflate(& zs, Z_NO_FLUSH);
            result.resize(offset + INFLATE_CHUNK_SIZE - zs.avail_out);

            if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
                std::string msg = zs.msg != nullptr ? zs.msg : zError(rc);
                inflateEnd(& zs);

                throw error {
                      make_error_code(errc::decompression_error)
                    , tr::f_("zlib: corrupt stream: {}", msg)
                };
            }

            if (result.size() > max_size) {
                inflateEnd(& zs);

                throw error {
                      make_error_code(errc::decompression_error)
                    , tr::f_("zlib: decompressed data exceeds the limit of {} bytes", max_size)
                };
            }
        } while (rc != Z_STREAM_END && zs.avail_out == 0);

        consumed += chunk - zs.avail_in;
    } while (rc != Z_STREAM_END && consumed < n && rc != Z_BUF_ERROR);

    inflateEnd(& zs);

    if (rc != Z_STREAM_END) {
        throw error {
              make_error_code(errc::decompression_error)
            , tr::_("zlib: truncated stream")
        };
    }

    return result;
}

static compressed_data lz4_compress (char const * data, std::size_t n, int level)
{
    if (n > static_cast<std::size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::f_("lz4: data too large to compress: {} bytes", n)
        };
    }

    auto source_len = pfs::numeric_cast<int>(n);
    auto bound = LZ4_compressBound(source_len);

    compressed_data result;
    result.data.resize(LZ4_SIZE_PREFIX + static_cast<std::size_t>(bound));

    auto size = static_cast<std::uint32_t>(n);
    result.data[0] = static_cast<char>(size & 0xFF);
    result.data[1] = static_cast<char>((size >> 8) & 0xFF);
    result.data[2] = static_cast<char>((size >> 16) & 0xFF);
    result.data[3] = static_cast<char>((size >> 24) & 0xFF);

    auto rc = LZ4_compress_default(data, result.data.data() + LZ4_SIZE_PREFIX, source_len, bound);

    if (rc <= 0) {
        throw error {
              make_error_code(errc::unexpected_error)
            , tr::f_("lz4 compression failure: {} bytes", n)
        };
    }

    result.data.resize(LZ4_SIZE_PREFIX + static_cast<std::size_t>(rc));
    result.level = static_cast<std::uint8_t>(LZ4_FLAG | (level & COMPRESSION_LEVEL_MASK));
    return result;
}

static std::vector<char> lz4_decompress (char const * data, std::size_t n, std::size_t max_size)
{
    if (n <= LZ4_SIZE_PREFIX) {
        throw error {
              make_error_code(errc::decompression_error)
            , tr::_("lz4: truncated stream")
        };
    }

    auto p = reinterpret_cast<unsigned char const *>(data);
    auto size = static_cast<std::uint32_t>(p[0])
        | (static_cast<std::uint32_t>(p[1]) << 8)
        | (static_cast<std::uint32_t>(p[2]) << 16)
        | (static_cast<std::uint32_t>(p[3]) << 24);

    if (size > max_size) {
        throw error {
              make_error_code(errc::decompression_error)
            , tr::f_("lz4: decompressed data exceeds the limit of {} bytes", max_size)
        };
    }

    auto compressed_len = n - LZ4_SIZE_PREFIX;

    if (size > static_cast<std::uint32_t>(LZ4_MAX_INPUT_SIZE)
            || compressed_len > static_cast<std::size_t>(LZ4_compressBound(LZ4_MAX_INPUT_SIZE))) {
        throw error {
              make_error_code(errc::decompression_error)
            , tr::_("lz4: corrupt stream")
        };
    }

    std::vector<char> result(size);
    char empty = 0;

    auto rc = LZ4_decompress_safe(data + LZ4_SIZE_PREFIX, size > 0 ? result.data() : & empty
        , pfs::numeric_cast<int>(compressed_len), pfs::numeric_cast<int>(size));

    if (rc < 0 || static_cast<std::uint32_t>(rc) != size) {
        throw error {
              make_error_code(errc::decompression_error)
            , tr::_("lz4: corrupt stream")
        };
    }

    return result;
}

compressed_data compress (compressor_enum c, char const * data, std::size_t n, int level)
{
    if (level < 1 || level > MAX_COMPRESSION_LEVEL) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::f_("invalid compression level: {} (must be between 1 and {})"
                , level, MAX_COMPRESSION_LEVEL)
        };
    }

    switch (c) {
        case compressor_enum::zlib:
            return zlib_compress(data, n, level);

        case compressor_enum::lz4:
            return lz4_compress(data, n, level);

        case compressor_enum::none:
            break;
    }

    throw error {
          make_error_code(errc::invalid_argument)
        , tr::f_("compressor is not usable: {}", to_string(c))
    };
}

std::vector<char> decompress (char const * data, std::size_t n, std::uint8_t level
    , std::size_t max_size)
{
    auto algorithm = level & COMPRESSION_ALGORITHM_MASK;

    if ((level & COMPRESSION_LEVEL_MASK) == 0) {
        throw error {
              make_error_code(errc::invalid_compression)
            , tr::f_("invalid compression level byte 0x{:02X}", static_cast<unsigned int>(level))
        };
    }

    if (algorithm == ZLIB_FLAG)
        return zlib_decompress(data, n, max_size);

    if (algorithm == LZ4_FLAG)
        return lz4_decompress(data, n, max_size);

    auto name = compression_type(level);

    if (name.empty()) {
        throw error {
              make_error_code(errc::invalid_compression)
            , tr::f_("unknown compression algorithm in level byte 0x{:02X}"
                , static_cast<unsigned int>(level))
        };
    }

    throw error {
          make_error_code(errc::invalid_compression)
        , tr::f_("{} decompression is not supported", name)
    };
}

std::string compression_type (std::uint8_t level)
{
    switch (level & COMPRESSION_ALGORITHM_MASK) {
        case ZLIB_FLAG:
            return "zlib";
        case LZ4_FLAG:
            return "lz4";
        case BROTLI_FLAG:
            return "brotli";
        default:
            break;
    }

    return std::string{};
}

char const * to_string (compressor_enum c) noexcept
{
    switch (c) {
        case compressor_enum::none:
            return "none";
        case compressor_enum::zlib:
            return "zlib";
        case compressor_enum::lz4:
            return "lz4";
    }

    return "<unknown>";
}

bool parse_compressor (std::string const & name, compressor_enum & result) noexcept
{
    if (name == "zlib") {
        result = compressor_enum::zlib;
        return true;
    }

    if (name == "lz4") {
        result = compressor_enum::lz4;
        return true;
    }

    if (name == "none") {
        result = compressor_enum::none;
        return true;
    }

    return false;
}

PIXWIRE__NAMESPACE_END
