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
#include "archive.hpp"
#include <pfs/endian.hpp>
#include <pfs/binary_istream.hpp>
#include <pfs/binary_ostream.hpp>

PIXWIRE__NAMESPACE_BEGIN

// All multi-byte integers on the wire are in network (big-endian) order.
struct serializer_traits
{
    using archive_type = archive;
    using serializer_type = pfs::binary_ostream<pfs::endian::network, archive>;
    using deserializer_type = pfs::binary_istream<pfs::endian::network>;
};

using serializer_t = serializer_traits::serializer_type;
using deserializer_t = serializer_traits::deserializer_type;

PIXWIRE__NAMESPACE_END

PFS__NAMESPACE_BEGIN
template <>
inline void
binary_ostream<endian::network, pixwire::archive>::write (pixwire::archive & ar
    , char const * data, std::size_t n)
{
    ar.append(data, n);
}

template <>
inline void
append_bytes<pixwire::archive> (pixwire::archive & ar, char const * data, std::size_t n)
{
    ar.append(data, n);
}
PFS__NAMESPACE_END
