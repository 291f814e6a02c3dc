////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "error.hpp"
#include "exports.hpp"
#include "namespace.hpp"
#include "transport.hpp"

XFER__NAMESPACE_BEGIN

/**
 * UDP transport bound to the local socket address.
 */
class udp_transport: public transport
{
public:
    using native_type = int;
    static constexpr native_type INVALID_SOCKET = -1;
    static constexpr std::size_t MAX_DATAGRAM_SIZE = 65536;

private:
    native_type _socket {INVALID_SOCKET};
    socket4_addr _saddr;
    socket4_addr _last_sender;

public:
    /**
     * Creates socket and binds it to @a saddr. Throws @c xfer::error with
     * @c errc::transport_error on failure.
     */
    XFER__EXPORT udp_transport (socket4_addr const & saddr);
    XFER__EXPORT ~udp_transport ();

    udp_transport (udp_transport const &) = delete;
    udp_transport & operator = (udp_transport const &) = delete;

    socket4_addr const & local_addr () const noexcept
    {
        return _saddr;
    }

    /**
     * Source address of the last received datagram.
     */
    socket4_addr const & last_sender () const noexcept
    {
        return _last_sender;
    }

    XFER__EXPORT void send (socket4_addr const & dest, char const * data, std::size_t len) override;
    XFER__EXPORT pfs::optional<std::vector<char>> recv (pfs::optional<std::chrono::milliseconds> timeout) override;
};

XFER__NAMESPACE_END
