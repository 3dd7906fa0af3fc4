////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/serializer.hpp"
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/header.hpp"
#include "pfs/pixwire/serializers/bencode.hpp"
#include "pfs/pixwire/serializers/plain_text.hpp"
#include "pfs/pixwire/serializers/rencodeplus.hpp"
#include <pfs/i18n.hpp>

PIXWIRE__NAMESPACE_BEGIN

serializer const & get_serializer (serializer_enum type)
{
    static serializers::bencode const bencode_instance;
    static serializers::rencodeplus const rencodeplus_instance;
    static serializers::plain_text const plain_text_instance;

    switch (type) {
        case serializer_enum::bencode:
            return bencode_instance;
        case serializer_enum::rencodeplus:
            return rencodeplus_instance;
        case serializer_enum::none:
            return plain_text_instance;
    }

    throw error {
          make_error_code(errc::invalid_argument)
        , tr::f_("unknown serializer: {}", static_cast<int>(type))
    };
}

serializer const & serializer_for_flags (std::uint8_t protocol_flags)
{
    auto bits = protocol_flags & FLAGS_SERIALIZER_MASK;

    if (bits == static_cast<std::uint8_t>(serializer_enum::bencode))
        return get_serializer(serializer_enum::bencode);

    if (bits == static_cast<std::uint8_t>(serializer_enum::rencodeplus))
        return get_serializer(serializer_enum::rencodeplus);

    throw error {
          make_error_code(errc::decoding_error)
        , tr::f_("no decoder for protocol flags 0x{:02X}", static_cast<unsigned int>(protocol_flags))
    };
}

char const * to_string (serializer_enum type) noexcept
{
    switch (type) {
        case serializer_enum::bencode:
            return "bencode";
        case serializer_enum::rencodeplus:
            return "rencodeplus";
        case serializer_enum::none:
            return "none";
    }

    return "<unknown>";
}

bool parse_serializer (std::string const & name, serializer_enum & result) noexcept
{
    if (name == "bencode") {
        result = serializer_enum::bencode;
        return true;
    }

    if (name == "rencodeplus") {
        result = serializer_enum::rencodeplus;
        return true;
    }

    if (name == "none") {
        result = serializer_enum::none;
        return true;
    }

    return false;
}

PIXWIRE__NAMESPACE_END
