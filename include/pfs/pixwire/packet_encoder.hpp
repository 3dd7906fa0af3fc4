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
#include "callback.hpp"
#include "chunk.hpp"
#include "compression.hpp"
#include "exports.hpp"
#include "serializer.hpp"
#include "value.hpp"
#include <set>
#include <string>
#include <vector>

PIXWIRE__NAMESPACE_BEGIN

struct encoder_settings
{
    serializer const * ser {nullptr};
    compressor_enum compressor {compressor_enum::none};
    int compression_level {0};
    bool chunks {true};
    std::size_t large_packet_size {16384};
    std::size_t inline_size {32768};
    std::size_t min_compress_size {378};

    // Packet types expected to be large, no warning for them
    std::set<std::string> large_packets;

    // Called along with the large packet warning (packet type, main packet size)
    callback_t<void (std::string const &, std::size_t)> on_large_packet;
};

/**
 * Converts packet into the chunks to send.
 *
 * Items that are too big for the main packet (non-inlineable compressed data, large
 * uncompressed binary data) are pulled out into raw chunks with index equal to the item
 * position, their slots are replaced with empty placeholders. Raw chunks precede the main
 * chunk (index 0) in the result.
 *
 * @throws error {errc::encoding_error} if packet is invalid or can not be serialized.
 */
PIXWIRE__EXPORT std::vector<chunk> encode_packet (packet pkt, encoder_settings const & settings);

PIXWIRE__NAMESPACE_END
