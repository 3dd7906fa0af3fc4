////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../serializer.hpp"

PIXWIRE__NAMESPACE_BEGIN

namespace serializers {

//
// Compact binary codec based on rencode type codes.
//
// Code      | Meaning
// ----------|-----------------------------------------------------------------
// 0..43     | integers 0..43
// 47        | byte string: <decimal length>:<bytes>
// 48..57    | text string: <decimal length>:<utf-8 bytes> (first digit is the code)
// 59        | list of any size, terminated by 127
// 60        | dictionary of any size, terminated by 127
// 61        | integer as decimal digits, terminated by 127
// 62..65    | 1, 2, 4 and 8 bytes big-endian integer
// 67, 68    | true, false
// 70..101   | integers -1..-32
// 102..126  | dictionary with 0..24 entries
// 128..191  | text string of 0..63 bytes
// 192..255  | list of 0..63 items
//
class rencodeplus: public serializer
{
public:
    serializer_enum type () const noexcept override
    {
        return serializer_enum::rencodeplus;
    }

    char const * name () const noexcept override
    {
        return "rencodeplus";
    }

    std::uint8_t protocol_flags () const noexcept override
    {
        return static_cast<std::uint8_t>(serializer_enum::rencodeplus);
    }

    PIXWIRE__EXPORT std::vector<char> encode (packet const & pkt) const override;
    PIXWIRE__EXPORT packet decode (char const * data, std::size_t n) const override;
};

} // namespace serializers

PIXWIRE__NAMESPACE_END
