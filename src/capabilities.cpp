////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `pixwire-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/pixwire/capabilities.hpp"
#include "pfs/pixwire/error.hpp"
#include "pfs/pixwire/tag.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>

PIXWIRE__NAMESPACE_BEGIN

namespace {

bool caps_flag (value const & caps, std::string const & key, bool default_value)
{
    auto v = caps.find(key);

    if (v == nullptr)
        return default_value;

    if (v->is_boolean() || v->is_integer())
        return v->as_boolean();

    return default_value;
}

bool has_compressor (value const & caps, std::string const & name)
{
    auto list = caps.find("compressors");

    if (list != nullptr && list->is_list()) {
        for (auto const & x: list->as_list()) {
            if ((x.is_string() || x.is_bytes()) && x.to_text() == name)
                return true;
        }

        return false;
    }

    return caps_flag(caps, name, false);
}

} // namespace

protocol::receive_aliases_type default_receive_aliases (std::vector<std::string> const & packet_types)
{
    protocol::receive_aliases_type result;
    std::int64_t n = 1;

    for (auto const & type: packet_types)
        result[n++] = type;

    return result;
}

value make_network_caps (engine_config const & config
    , protocol::receive_aliases_type const & receive_aliases)
{
    auto caps = value::make_dict();

    for (auto s: config.enabled_serializers)
        caps.set(value{to_string(s)}, value{true});

    value::list_type compressors;

    for (auto c: config.enabled_compressors) {
        compressors.push_back(value{to_string(c)});
        caps.set(value{to_string(c)}, value{true});
    }

    caps.set(value{"compressors"}, value{std::move(compressors)});
    caps.set(value{"chunks"}, value{config.chunks});
    caps.set(value{"max_packet_size"}, value{config.max_packet_size});

    // Peer sends these numbers instead of the type names
    if (config.use_aliases) {
        auto aliases = value::make_dict();

        for (auto const & x: receive_aliases)
            aliases.set(value{x.second}, value{x.first});

        caps.set(value{"aliases"}, std::move(aliases));
    }

    return caps;
}

serializer_enum negotiate_serializer (std::vector<serializer_enum> const & local
    , value const & peer_caps)
{
    for (auto s: local) {
        if (s == serializer_enum::none)
            continue;

        if (caps_flag(peer_caps, to_string(s), false))
            return s;
    }

    throw error {
          make_error_code(errc::negotiation_error)
        , tr::_("no matching packet encoder found")
    };
}

compressor_enum negotiate_compressor (std::vector<compressor_enum> const & local
    , value const & peer_caps)
{
    for (auto c: local) {
        if (c == compressor_enum::none)
            continue;

        if (has_compressor(peer_caps, to_string(c)))
            return c;
    }

    LOGW(PROTOCOL_TAG, "no common compressor, compression disabled");
    return compressor_enum::none;
}

void apply_peer_caps (protocol & proto, value const & peer_caps)
{
    if (!peer_caps.is_dict()) {
        throw error {
              make_error_code(errc::negotiation_error)
            , tr::_("capabilities must be a dictionary")
        };
    }

    auto const & config = proto.config();

    proto.enable_encoder(negotiate_serializer(config.enabled_serializers, peer_caps));
    proto.enable_compressor(negotiate_compressor(config.enabled_compressors, peer_caps));
    proto.enable_chunks(config.chunks && caps_flag(peer_caps, "chunks", false));

    auto aliases = peer_caps.find("aliases");

    if (config.use_aliases && aliases != nullptr && aliases->is_dict()) {
        protocol::send_aliases_type send_aliases;

        for (auto const & x: aliases->as_dict()) {
            if (!x.second.is_integer()) {
                throw error {
                      make_error_code(errc::negotiation_error)
                    , tr::f_("invalid packet alias for '{}'", to_string(x.first))
                };
            }

            send_aliases[x.first.to_text()] = x.second.as_integer();
        }

        proto.set_send_aliases(std::move(send_aliases));
    }

    proto.mark_open();

    LOGD(PROTOCOL_TAG, "peer capabilities applied: {}", to_string(peer_caps, 512));
}

PIXWIRE__NAMESPACE_END
