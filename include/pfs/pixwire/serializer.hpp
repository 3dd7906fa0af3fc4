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
#include <string>
#include <vector>

PIXWIRE__NAMESPACE_BEGIN

// Values match the two low bits of the header protocol flags.
enum class serializer_enum: std::uint8_t
{
      bencode = 0
    , rencodeplus = 1
    , none = 2 // Plain text, no header
};

constexpr int MAX_NESTING_DEPTH = 64;

/**
 * Packet serializer interface.
 *
 * Implementations are stateless, a single instance of each one is shared by all protocols.
 */
class serializer
{
public:
    virtual ~serializer () {}

    virtual serializer_enum type () const noexcept = 0;

    /**
     * Capability name.
     */
    virtual char const * name () const noexcept = 0;

    /**
     * Header protocol flags of the frames with the encoded payload.
     */
    virtual std::uint8_t protocol_flags () const noexcept = 0;

    /**
     * Serializes packet.
     *
     * @throws error {errc::encoding_error} on unsupported values.
     */
    virtual std::vector<char> encode (packet const & pkt) const = 0;

    /**
     * Deserializes packet.
     *
     * @throws error {errc::decoding_error} on malformed, truncated or too deeply nested input.
     */
    virtual packet decode (char const * data, std::size_t n) const = 0;
};

PIXWIRE__EXPORT serializer const & get_serializer (serializer_enum type);

/**
 * Serializer that produced a frame with the specified protocol flags.
 *
 * @throws error {errc::decoding_error} if the flags do not name a decodable serializer.
 */
PIXWIRE__EXPORT serializer const & serializer_for_flags (std::uint8_t protocol_flags);

PIXWIRE__EXPORT char const * to_string (serializer_enum type) noexcept;

/**
 * @return @c false if @a name is not a known serializer name.
 */
PIXWIRE__EXPORT bool parse_serializer (std::string const & name, serializer_enum & result) noexcept;

PIXWIRE__NAMESPACE_END
