////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/serializers/plain_text.hpp"
#include "pfs/pixwire/error.hpp"
#include <pfs/i18n.hpp>
#include <string>

PIXWIRE__NAMESPACE_BEGIN

namespace serializers {

std::vector<char> plain_text::encode (packet const & pkt) const
{
    std::string text;

    for (std::size_t i = 0; i < pkt.size(); i++) {
        auto const & x = pkt[i];

        if (x.is_null()) {
            throw error {
                  make_error_code(errc::encoding_error)
                , tr::f_("null value at index {}", i)
            };
        }

        if (i > 0)
            text += ": ";

        if (x.is_string() || x.is_bytes())
            text += x.to_text();
        else
            text += to_string(x);
    }

    text += '\n';
    return std::vector<char>(text.begin(), text.end());
}

packet plain_text::decode (char const *, std::size_t) const
{
    throw error {
          make_error_code(errc::decoding_error)
        , tr::_("plain text packets can not be decoded")
    };
}

} // namespace serializers

PIXWIRE__NAMESPACE_END
