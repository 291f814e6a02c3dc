////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
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

XFER__NAMESPACE_BEGIN

struct serializer_traits
{
    using archive_type = archive;
    using serializer_type = pfs::binary_ostream<pfs::endian::network, archive>;
    using deserializer_type = pfs::binary_istream<pfs::endian::network>;
};

XFER__NAMESPACE_END

PFS__NAMESPACE_BEGIN
template <>
inline void
binary_ostream<endian::network, XFER__NAMESPACE_NAME::archive>::write (XFER__NAMESPACE_NAME::archive & ar
    , char const * data, std::size_t n)
{
    ar.append(data, n);
}

template <>
inline void
append_bytes<XFER__NAMESPACE_NAME::archive> (XFER__NAMESPACE_NAME::archive & ar
    , char const * data, std::size_t n)
{
    ar.append(data, n);
}
PFS__NAMESPACE_END
