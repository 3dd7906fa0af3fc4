////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../header.hpp"
#include "../serializer.hpp"

PIXWIRE__NAMESPACE_BEGIN

namespace serializers {

// Renders "type: arg: arg\n", used for error replies to peers that do not speak the protocol.
class plain_text: public serializer
{
public:
    serializer_enum type () const noexcept override
    {
        return serializer_enum::none;
    }

    char const * name () const noexcept override
    {
        return "none";
    }

    std::uint8_t protocol_flags () const noexcept override
    {
        return FLAGS_NOHEADER;
    }

    PIXWIRE__EXPORT std::vector<char> encode (packet const & pkt) const override;

    /**
     * @throws error {errc::decoding_error} always.
     */
    PIXWIRE__EXPORT packet decode (char const * data, std::size_t n) const override;
};

} // namespace serializers

PIXWIRE__NAMESPACE_END
