////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/packet_encoder.hpp"
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/header.hpp"
#include "pfs/pixwire/tag.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>
#include <algorithm>

PIXWIRE__NAMESPACE_BEGIN

std::vector<chunk> encode_packet (packet pkt, encoder_settings const & settings)
{
    if (settings.ser == nullptr) {
        throw error {
              make_error_code(errc::encoding_error)
            , tr::_("no packet encoder enabled")
        };
    }

    validate_packet(pkt);

    std::vector<chunk> result;
    auto type = packet_type(pkt);
    auto level = settings.compressor == compressor_enum::none ? 0 : settings.compression_level;
    auto size_check = settings.large_packet_size;
    auto min_comp_size = settings.min_compress_size;

    for (std::size_t i = 1; i < pkt.size(); i++) {
        auto & item = pkt[i];

        if (item.is_compressible()) {
            if (settings.compressor == compressor_enum::none) {
                item = value {std::move(item.as_bytes())};
            } else {
                auto const & raw = item.as_bytes();
                auto cdata = compress(settings.compressor, raw.data(), raw.size()
                    , (std::max)(level, 1));
                item = value::make_compressed(item.datatype(), std::move(cdata.data)
                    , cdata.level, true);
            }

            // Compressed item is processed below
        }

        if (item.is_large_structure()) {
            value inner = item.inner();
            item = std::move(inner);

            // Always inlined, its size is expected
            size_check += settings.ser->encode(packet {item}).size();
            continue;
        }

        if (item.is_compressed()) {
            auto size = item.size();
            bool extract = settings.chunks && (!item.can_inline() || size > settings.inline_size);

            if (extract && i > MAX_CHUNK_INDEX) {
                LOGW(PROTOCOL_TAG, "compressed item at position {} of '{}' packet can not be sent"
                    " as raw chunk, inlined: {} bytes", i, type, size);
                extract = false;
            }

            if (extract) {
                chunk c;
                c.index = static_cast<std::uint8_t>(i);

                // Only level compressed data is decompressed by the receiving network layer
                c.level = item.level_compressed() ? item.level() : 0;
                c.data = std::move(item.as_bytes());
                result.push_back(std::move(c));
                item = value {value::bytes_type{}};
            } else {
                item = value {std::move(item.as_bytes())};
                min_comp_size += size;
                size_check += size;
            }

            continue;
        }

        if (settings.chunks && item.is_bytes() && level > 0
                && item.size() > settings.large_packet_size && i <= MAX_CHUNK_INDEX) {
            LOGW(PROTOCOL_TAG, "found a large uncompressed item in packet '{}' at position {}: {} bytes"
                , type, i, item.size());

            auto const & raw = item.as_bytes();
            auto cdata = compress(settings.compressor, raw.data(), raw.size(), level);

            chunk c;
            c.index = static_cast<std::uint8_t>(i);
            c.level = cdata.level;
            c.data = std::move(cdata.data);
            result.push_back(std::move(c));

            item = value {value::bytes_type{}};
            continue;
        }
    }

    auto main_packet = settings.ser->encode(pkt);
    auto proto_flags = settings.ser->protocol_flags();
    auto size = main_packet.size();

    if (settings.chunks && size > size_check
            && settings.large_packets.find(type) == settings.large_packets.end()) {
        LOGW(PROTOCOL_TAG, "found large packet: '{}' packet is {} bytes: {}"
            , type, size, to_string(pkt, 128));

        if (settings.on_large_packet)
            settings.on_large_packet(type, size);
    }

    chunk main;
    main.flags = proto_flags;
    main.index = 0;

    // Plain text is never compressed
    if (level > 0 && size > min_comp_size && (proto_flags & FLAGS_NOHEADER) == 0) {
        auto cdata = compress(settings.compressor, main_packet.data(), size, level);
        main.level = cdata.level;
        main.data = std::move(cdata.data);
    } else {
        main.data = std::move(main_packet);
    }

    result.push_back(std::move(main));
    return result;
}

PIXWIRE__NAMESPACE_END
