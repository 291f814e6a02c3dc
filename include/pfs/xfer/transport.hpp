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
#include "socket4_addr.hpp"
#include <pfs/optional.hpp>
#include <chrono>
#include <cstddef>
#include <vector>

XFER__NAMESPACE_BEGIN

/**
 * Addressed datagram transport.
 */
class transport
{
public:
    virtual ~transport () = default;

    /**
     * Sends datagram to @a dest. Throws @c xfer::error with
     * @c errc::transport_error on failure.
     */
    virtual void send (socket4_addr const & dest, char const * data, std::size_t len) = 0;

    /**
     * Receives next datagram. Blocks forever if @a timeout is not set.
     *
     * @return Datagram bytes or @c nullopt if @a timeout expired.
     */
    virtual pfs::optional<std::vector<char>> recv (pfs::optional<std::chrono::milliseconds> timeout) = 0;
};

XFER__NAMESPACE_END
