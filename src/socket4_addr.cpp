////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/socket4_addr.hpp"
#include <pfs/integer.hpp>
#include <algorithm>
#include <system_error>

XFER__NAMESPACE_BEGIN

// Dotted-decimal notation only: a.b.c.d
static pfs::optional<std::uint32_t> parse_inet4 (char const * first, char const * last)
{
    std::uint32_t result = 0;

    for (int i = 0; i < 4; i++) {
        auto delim_pos = (i < 3) ? std::find(first, last, '.') : last;

        if (delim_pos == last && i < 3)
            return pfs::nullopt;

        std::error_code ec;
        auto part = pfs::to_integer(first, delim_pos, std::uint8_t{0}, std::uint8_t{255}, ec);

        if (ec)
            return pfs::nullopt;

        result = (result << 8) | part;
        first = delim_pos == last ? last : delim_pos + 1;
    }

    return result;
}

pfs::optional<socket4_addr> socket4_addr::parse (char const * s, std::size_t n)
{
    auto delim_pos = std::find(s, s + n, ':');

    if (delim_pos == s + n)
        return pfs::nullopt;

    auto addr = parse_inet4(s, delim_pos);

    if (!addr)
        return pfs::nullopt;

    std::error_code ec;
    auto port = pfs::to_integer(delim_pos + 1, s + n
        , std::uint16_t{1}, std::uint16_t{65535}, ec);

    if (ec)
        return pfs::nullopt;

    return socket4_addr{*addr, port};
}

std::string to_string (socket4_addr const & saddr)
{
    std::string result;

    for (int shift = 24; shift >= 0; shift -= 8) {
        result += std::to_string((saddr.addr >> shift) & 0xFF);

        if (shift > 0)
            result += '.';
    }

    return result + ':' + std::to_string(saddr.port);
}

XFER__NAMESPACE_END
