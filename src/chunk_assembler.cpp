////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/chunk_assembler.hpp"
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/header.hpp"
#include <pfs/i18n.hpp>

PIXWIRE__NAMESPACE_BEGIN

void chunk_assembler::add (std::uint8_t index, std::vector<char> && data)
{
    if (index == 0 || index > MAX_CHUNK_INDEX) {
        throw error {
              make_error_code(errc::invalid_packet)
            , tr::f_("invalid raw packet index: {}", static_cast<unsigned int>(index))
        };
    }

    if (_chunks.find(index) != _chunks.end()) {
        throw error {
              make_error_code(errc::invalid_packet)
            , tr::f_("duplicate raw packet at index {}", static_cast<unsigned int>(index))
        };
    }

    _chunks.emplace(index, std::move(data));
}

std::size_t chunk_assembler::splice (packet & pkt)
{
    std::size_t total = 0;

    for (auto & entry: _chunks) {
        if (entry.first >= pkt.size()) {
            auto index = entry.first;
            _chunks.clear();

            throw error {
                  make_error_code(errc::invalid_packet)
                , tr::f_("raw packet index {} is out of packet bounds: {}"
                    , static_cast<unsigned int>(index), pkt.size())
            };
        }

        total += entry.second.size();
        pkt[entry.first] = value {std::move(entry.second)};
    }

    _chunks.clear();
    return total;
}

PIXWIRE__NAMESPACE_END
