////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/error.hpp"
#include <pfs/i18n.hpp>

PIXWIRE__NAMESPACE_BEGIN

char const * error_category::name () const noexcept
{
    return "pixwire::category";
}

std::string error_category::message (int ev) const
{
    switch (static_cast<errc>(ev)) {
        case errc::success:
            return tr::_("no error");
        case errc::invalid_header:
            return tr::_("invalid packet header");
        case errc::gibberish:
            return tr::_("gibberish received");
        case errc::invalid_packet:
            return tr::_("invalid packet");
        case errc::decryption_error:
            return tr::_("decryption error");
        case errc::decompression_error:
            return tr::_("decompression error");
        case errc::invalid_compression:
            return tr::_("invalid compression");
        case errc::encoding_error:
            return tr::_("packet encoding error");
        case errc::decoding_error:
            return tr::_("packet decoding error");
        case errc::packet_too_large:
            return tr::_("packet too large");
        case errc::negotiation_error:
            return tr::_("capability negotiation error");
        case errc::socket_error:
            return tr::_("socket error");
        case errc::connection_closed:
            return tr::_("connection closed");
        case errc::invalid_argument:
            return tr::_("invalid argument");
        case errc::unexpected_error:
            return tr::_("unexpected error");

        default: return tr::_("unknown pixwire error");
    }
}

PIXWIRE__NAMESPACE_END
