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
#include <cstddef>
#include <string>

PIXWIRE__NAMESPACE_BEGIN

/**
 * Guesses the protocol spoken by the peer from the first 32 bytes of @a data.
 *
 * @return One of "pixwire", "ssh", "ssl", "vnc", "rdp", "http" or empty string if unknown.
 */
PIXWIRE__EXPORT std::string guess_packet_type (char const * data, std::size_t n);

/**
 * Builds the diagnostic for bytes that failed the header check: "<msg>: <guess>" when the
 * protocol is recognized, "<msg>: 0x<header hex>" followed by an ellipsized dump otherwise.
 */
PIXWIRE__EXPORT std::string describe_invalid_header (char const * data, std::size_t n
    , std::string const & msg);

/**
 * Hex representation of the first @a limit bytes.
 */
PIXWIRE__EXPORT std::string hexstr (char const * data, std::size_t n, std::size_t limit = 64);

/**
 * Printable representation of @a data, non-printable bytes are escaped, long data ellipsized.
 */
PIXWIRE__EXPORT std::string repr_ellipsized (char const * data, std::size_t n
    , std::size_t limit = 100);

PIXWIRE__NAMESPACE_END
