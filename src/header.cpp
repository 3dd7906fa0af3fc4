////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/header.hpp"
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/serializer_traits.hpp"
#include <pfs/i18n.hpp>
#include <pfs/numeric_cast.hpp>
#include <cstring>
#include <limits>

PIXWIRE__NAMESPACE_BEGIN

static void check_size (std::size_t size)
{
    if (size > (std::numeric_limits<std::uint32_t>::max)()) {
        throw error {
              make_error_code(errc::invalid_argument)
            , tr::f_("frame payload size is not representable in the header: {}", size)
        };
    }
}

void pack_header (archive & out, std::uint8_t flags, std::uint8_t level
    , std::uint8_t index, std::size_t size)
{
    check_size(size);

    serializer_t os {out};
    os << HEADER_MARKER << flags << level << index << pfs::numeric_cast<std::uint32_t>(size);
}

header_bytes pack_header (std::uint8_t flags, std::uint8_t level, std::uint8_t index
    , std::size_t size)
{
    archive ar;
    pack_header(ar, flags, level, index, size);

    header_bytes result;
    std::memcpy(result.data(), ar.data(), HEADER_SIZE);
    return result;
}

frame_header unpack_header (char const * data, std::size_t n)
{
    if (n < HEADER_SIZE) {
        throw error {
              make_error_code(errc::invalid_header)
            , tr::f_("incomplete packet header: {} bytes", n)
        };
    }

    frame_header h;
    deserializer_t in {data, HEADER_SIZE};
    in >> h.marker >> h.flags >> h.level >> h.index >> h.size;

    if (h.marker != HEADER_MARKER) {
        throw error {
              make_error_code(errc::invalid_header)
            , tr::f_("invalid packet header byte 0x{:02X}"
                , static_cast<unsigned int>(static_cast<std::uint8_t>(h.marker)))
        };
    }

    return h;
}

bool looks_like_header (char const * data, std::size_t n, std::uint32_t abs_max_size)
{
    if (n < HEADER_SIZE || data[0] != HEADER_MARKER)
        return false;

    auto h = unpack_header(data, n);

    // Normally used on the first packet, so the chunk index should be 0
    if (h.index != 0)
        return false;

    if ((h.flags & (FLAGS_RESERVED_MASK | FLAGS_NOHEADER)) != 0)
        return false;

    if (h.serializer_bits() == FLAGS_SERIALIZER_MASK)
        return false;

    // Can not make a serialized packet smaller than this
    if (h.size < HEADER_SIZE || h.size > abs_max_size)
        return false;

    return true;
}

std::ptrdiff_t find_marker (char const * data, std::size_t n, std::uint32_t abs_max_size)
{
    if (n < HEADER_SIZE)
        return -1;

    for (std::size_t pos = 0; pos + HEADER_SIZE <= n; pos++) {
        if (data[pos] != HEADER_MARKER)
            continue;

        if (looks_like_header(data + pos, n - pos, abs_max_size))
            return static_cast<std::ptrdiff_t>(pos);
    }

    return -1;
}

PIXWIRE__NAMESPACE_END
