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
#include "compression.hpp"
#include "engine_config.hpp"
#include "exports.hpp"
#include "protocol.hpp"
#include "serializer.hpp"
#include "value.hpp"
#include <string>
#include <vector>

PIXWIRE__NAMESPACE_BEGIN

/**
 * Numbers packet types starting from 1.
 */
PIXWIRE__EXPORT protocol::receive_aliases_type default_receive_aliases (
    std::vector<std::string> const & packet_types);

/**
 * Network capabilities advertised to the peer: enabled serializers and compressors,
 * chunks support, receive aliases and maximum packet size.
 */
PIXWIRE__EXPORT value make_network_caps (engine_config const & config
    , protocol::receive_aliases_type const & receive_aliases);

/**
 * Picks the first serializer from @a local (preference order) the peer supports.
 *
 * @throws error {errc::negotiation_error} if there is no common serializer.
 */
PIXWIRE__EXPORT serializer_enum negotiate_serializer (std::vector<serializer_enum> const & local
    , value const & peer_caps);

/**
 * Picks the first compressor from @a local the peer supports, @c compressor_enum::none if
 * there is no common one.
 */
PIXWIRE__EXPORT compressor_enum negotiate_compressor (std::vector<compressor_enum> const & local
    , value const & peer_caps);

/**
 * Configures @a proto from the peer capabilities and marks it open.
 *
 * @throws error {errc::negotiation_error} if there is no common serializer.
 */
PIXWIRE__EXPORT void apply_peer_caps (protocol & proto, value const & peer_caps);

PIXWIRE__NAMESPACE_END
