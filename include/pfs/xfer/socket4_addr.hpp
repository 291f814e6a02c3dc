////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/optional.hpp>
#include <cstdint>
#include <string>

XFER__NAMESPACE_BEGIN

/**
 * IPv4 socket address (address in host byte order and port).
 */
class socket4_addr
{
public:
    std::uint32_t addr {0};
    std::uint16_t port {0};

public:
    /**
     * Parses socket address in form `a.b.c.d:port`.
     */
    static XFER__EXPORT pfs::optional<socket4_addr> parse (char const * s, std::size_t n);

    static pfs::optional<socket4_addr> parse (std::string const & s)
    {
        return parse(s.c_str(), s.size());
    }
};

XFER__EXPORT std::string to_string (socket4_addr const & saddr);

inline bool operator == (socket4_addr const & a, socket4_addr const & b)
{
    return a.addr == b.addr && a.port == b.port;
}

inline bool operator != (socket4_addr const & a, socket4_addr const & b)
{
    return a.addr != b.addr || a.port != b.port;
}

XFER__NAMESPACE_END
