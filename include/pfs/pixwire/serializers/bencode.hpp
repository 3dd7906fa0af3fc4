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
// Bencode with the unicode extension:
//
// integer     : i<decimal>e     (booleans are sent as 0 and 1)
// byte string : <length>:<bytes>
// text string : u<length>:<utf-8 bytes>
// list        : l<items>e
// dictionary  : d<key><value>...e, keys in sorted order
//
class bencode: public serializer
{
public:
    serializer_enum type () const noexcept override
    {
        return serializer_enum::bencode;
    }

    char const * name () const noexcept override
    {
        return "bencode";
    }

    std::uint8_t protocol_flags () const noexcept override
    {
        return static_cast<std::uint8_t>(serializer_enum::bencode);
    }

    PIXWIRE__EXPORT std::vector<char> encode (packet const & pkt) const override;
    PIXWIRE__EXPORT packet decode (char const * data, std::size_t n) const override;
};

} // namespace serializers

PIXWIRE__NAMESPACE_END
