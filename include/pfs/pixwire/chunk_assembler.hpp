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
#include "value.hpp"
#include <cstdint>
#include <map>
#include <vector>

PIXWIRE__NAMESPACE_BEGIN

/**
 * Receive side of the raw chunk channel.
 *
 * Raw chunks (index 1..3) arrive before the main chunk (index 0) of the same packet and are
 * buffered here until the main chunk is decoded.
 */
class chunk_assembler
{
    std::map<std::uint8_t, std::vector<char>> _chunks;

public:
    /**
     * Buffers raw chunk.
     *
     * @throws error {errc::invalid_packet} on zero, reserved or duplicate index.
     */
    PIXWIRE__EXPORT void add (std::uint8_t index, std::vector<char> && data);

    /**
     * Replaces placeholders in @a pkt with the buffered raw chunks and clears the buffer.
     *
     * @return Total size of the spliced data.
     *
     * @throws error {errc::invalid_packet} if a chunk index is beyond the packet size.
     */
    PIXWIRE__EXPORT std::size_t splice (packet & pkt);

    bool empty () const noexcept
    {
        return _chunks.empty();
    }

    std::size_t size () const noexcept
    {
        return _chunks.size();
    }

    void clear ()
    {
        _chunks.clear();
    }
};

PIXWIRE__NAMESPACE_END
