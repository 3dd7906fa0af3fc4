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
#include <pfs/error.hpp>
#include <string>
#include <system_error>

PIXWIRE__NAMESPACE_BEGIN

using error_code = std::error_code;

enum class errc
{
      success = 0
    , invalid_header      // Bad marker, size above the absolute limit or bad chunk index
    , gibberish           // Input is not this protocol at all
    , invalid_packet      // Structurally valid frame with malformed content
    , decryption_error    // Bad padding or cipher failure
    , decompression_error // Corrupt compressed stream
    , invalid_compression // Unknown or unsupported compression level byte
    , encoding_error      // Packet can not be serialized
    , decoding_error      // Serialized blob can not be parsed
    , packet_too_large    // Declared size exceeds negotiated maximum
    , negotiation_error   // No mutually supported serializer
    , socket_error
    , connection_closed
    , invalid_argument
    , unexpected_error
};

class error_category : public std::error_category
{
public:
    PIXWIRE__EXPORT virtual char const * name () const noexcept override;
    PIXWIRE__EXPORT virtual std::string message (int ev) const override;
};

inline std::error_category const & get_error_category ()
{
    static error_category instance;
    return instance;
}

inline std::error_code make_error_code (errc e)
{
    return std::error_code(static_cast<int>(e), get_error_category());
}

class error: public pfs::error
{
public:
    using pfs::error::error;
};

PIXWIRE__NAMESPACE_END
