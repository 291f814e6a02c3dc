////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "channel_registry.hpp"
#include "config.hpp"
#include "exports.hpp"
#include "message.hpp"
#include "namespace.hpp"
#include "socket4_addr.hpp"
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>

XFER__NAMESPACE_BEGIN

/**
 * Responder host: receives datagrams on a single transport, demultiplexes them
 * by channel and drives one message engine per channel on a worker thread.
 */
class file_service
{
public:
    struct options
    {
        socket4_addr listen_addr;
        socket4_addr downlink_addr;
        protocol_config conf;

        // Period of checking the interrupt flag and reaping finished workers.
        std::chrono::milliseconds poll_interval {100};
    };

    class session;

private:
    options _opts;
    std::unique_ptr<transport> _transport;
    std::mutex _send_mtx;
    std::shared_ptr<channel_registry> _registry;
    std::map<channel_id, std::unique_ptr<session>> _sessions;
    std::atomic<bool> _interrupted {false};
    std::atomic<std::size_t> _completed {0};
    std::atomic<std::size_t> _failed {0};

public:
    /**
     * Constructs service. If @a t is @c nullptr UDP transport bound to
     * @c listen_addr is created.
     */
    XFER__EXPORT file_service (options const & opts, std::unique_ptr<transport> t = nullptr);
    XFER__EXPORT ~file_service ();

    file_service (file_service const &) = delete;
    file_service & operator = (file_service const &) = delete;

    /**
     * Runs receive loop until interrupted.
     */
    XFER__EXPORT void run ();

    void interrupt () noexcept
    {
        _interrupted = true;
    }

    channel_registry & registry () noexcept
    {
        return *_registry;
    }

    std::size_t completed_count () const noexcept
    {
        return _completed;
    }

    std::size_t failed_count () const noexcept
    {
        return _failed;
    }

private:
    void dispatch (std::vector<char> && bytes);
    void reap (bool all);
    void send_to (socket4_addr const & dest, char const * data, std::size_t len);
};

XFER__NAMESPACE_END
