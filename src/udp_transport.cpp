////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/udp_transport.hpp"
#include "pfs/xfer/tag.hpp"
#include "pfs/xfer/trace.hpp"
#include <pfs/endian.hpp>
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>
#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

XFER__NAMESPACE_BEGIN

static sockaddr_in make_sockaddr (socket4_addr const & saddr)
{
    sockaddr_in addr_in4;

    std::memset(& addr_in4, 0, sizeof(addr_in4));

    addr_in4.sin_family      = AF_INET;
    addr_in4.sin_port        = pfs::to_network_order(static_cast<std::uint16_t>(saddr.port));
    addr_in4.sin_addr.s_addr = pfs::to_network_order(static_cast<std::uint32_t>(saddr.addr));

    return addr_in4;
}

udp_transport::udp_transport (socket4_addr const & saddr)
    : _saddr(saddr)
{
    _socket = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);

    if (_socket < 0) {
        throw error {
              errc::transport_error
            , tr::_("create UDP socket failure")
            , pfs::system_error_text()
        };
    }

    int yes = 1;
    auto rc = ::setsockopt(_socket, SOL_SOCKET, SO_REUSEADDR, & yes, sizeof(int));

    if (rc == 0) {
        auto addr_in4 = make_sockaddr(saddr);
        rc = ::bind(_socket, reinterpret_cast<sockaddr *>(& addr_in4), sizeof(addr_in4));
    }

    if (rc != 0) {
        error err {
              errc::transport_error
            , tr::f_("bind name to socket failure: {}", to_string(saddr))
            , pfs::system_error_text()
        };

        ::close(_socket);
        _socket = INVALID_SOCKET;
        throw err;
    }

    LOGD(XFER_TAG, "UDP transport bound to {}", to_string(saddr));
}

udp_transport::~udp_transport ()
{
    if (_socket >= 0) {
        ::close(_socket);
        _socket = INVALID_SOCKET;
    }
}

void udp_transport::send (socket4_addr const & dest, char const * data, std::size_t len)
{
    auto addr_in4 = make_sockaddr(dest);

    for (;;) {
        auto n = ::sendto(_socket, data, len, MSG_NOSIGNAL
            , reinterpret_cast<sockaddr *>(& addr_in4), sizeof(addr_in4));

        if (n < 0) {
            if (errno == EINTR)
                continue;

            throw error {
                  errc::transport_error
                , tr::f_("send to socket failure: {}", to_string(dest))
                , pfs::system_error_text()
            };
        }

        if (static_cast<std::size_t>(n) != len) {
            throw error {
                  errc::transport_error
                , tr::f_("datagram truncated on send to {}: {} of {} bytes", to_string(dest), n, len)
            };
        }

        break;
    }

    XFER__TRACE("[udp_transport] sent {} bytes to {}", len, to_string(dest));
}

pfs::optional<std::vector<char>> udp_transport::recv (pfs::optional<std::chrono::milliseconds> timeout)
{
    using clock_type = std::chrono::steady_clock;

    auto deadline = clock_type::now() + (timeout ? *timeout : std::chrono::milliseconds{0});

    for (;;) {
        int poll_timeout = -1;

        if (timeout) {
            auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_type::now());
            poll_timeout = remain.count() > 0 ? static_cast<int>(remain.count()) : 0;
        }

        pollfd pfd;
        pfd.fd = _socket;
        pfd.events = POLLIN;
        pfd.revents = 0;

        auto rc = ::poll(& pfd, 1, poll_timeout);

        if (rc < 0) {
            if (errno == EINTR)
                continue;

            throw error {
                  errc::transport_error
                , tr::_("poll socket failure")
                , pfs::system_error_text()
            };
        }

        if (rc == 0)
            return pfs::nullopt;

        std::vector<char> buffer(MAX_DATAGRAM_SIZE);
        sockaddr_in addr_in4;
        std::memset(& addr_in4, 0, sizeof(addr_in4));
        socklen_t addr_in4_len = sizeof(addr_in4);

        auto n = ::recvfrom(_socket, buffer.data(), buffer.size(), MSG_DONTWAIT
            , reinterpret_cast<sockaddr *>(& addr_in4), & addr_in4_len);

        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
                continue;

            throw error {
                  errc::transport_error
                , tr::_("receive data failure")
                , pfs::system_error_text()
            };
        }

        _last_sender.port = pfs::to_native_order(static_cast<std::uint16_t>(addr_in4.sin_port));
        _last_sender.addr = pfs::to_native_order(static_cast<std::uint32_t>(addr_in4.sin_addr.s_addr));

        buffer.resize(static_cast<std::size_t>(n));

        XFER__TRACE("[udp_transport] received {} bytes from {}", n, to_string(_last_sender));
        return buffer;
    }
}

XFER__NAMESPACE_END
