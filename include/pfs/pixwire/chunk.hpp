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
#include <cstdint>
#include <vector>

PIXWIRE__NAMESPACE_BEGIN

// One frame worth of payload before encryption and framing.
struct chunk
{
    std::uint8_t flags {0};
    std::uint8_t index {0}; // 0 - main packet, 1..3 - raw items
    std::uint8_t level {0}; // Compression level byte, 0 - uncompressed
    std::vector<char> data;
};

PIXWIRE__NAMESPACE_END
