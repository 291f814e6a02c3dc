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
#include "message.hpp"
#include "namespace.hpp"
#include "transfer_state.hpp"
#include <pfs/optional.hpp>
#include <map>
#include <mutex>
#include <random>
#include <string>

XFER__NAMESPACE_BEGIN

// Registered channel summary.
struct channel_info
{
    channel_id channel {0};
    state_enum status {state_enum::awaiting_metadata};
    role_enum role {role_enum::receiver};

    // Content hash, empty until known.
    std::string hash;

public:
    static channel_info from (transfer_state const & state)
    {
        channel_info info;
        info.channel = state.channel;
        info.status = state.status;
        info.role = state.role;

        if (state.expected)
            info.hash = state.expected->hash;

        return info;
    }
};

/**
 * Thread-safe map of channel identifiers to transfer summaries. Shared between
 * engine instances through `std::shared_ptr`.
 */
class channel_registry
{
public:
    static constexpr int MAX_ATTEMPTS = 100;

private:
    mutable std::mutex _mtx;
    std::map<channel_id, channel_info> _channels;
    std::mt19937 _rng;

public:
    XFER__EXPORT channel_registry ();

    channel_registry (channel_registry const &) = delete;
    channel_registry & operator = (channel_registry const &) = delete;

    /**
     * Allocates unique channel identifier and registers it in `awaiting_metadata` state.
     *
     * @return Channel identifier or zero (or throws @c xfer::error with
     *         @c errc::channel_exhaustion) if no free identifier found.
     */
    XFER__EXPORT channel_id generate_channel (error * perr = nullptr);

    /**
     * Registers @a state for @a channel.
     *
     * @return @c false if @a channel is already registered.
     */
    XFER__EXPORT bool bind (channel_id channel, transfer_state const & state);

    /**
     * Replaces summary of registered (or registers) @a channel with the
     * summary of @a state.
     */
    XFER__EXPORT void update (channel_id channel, transfer_state const & state);

    XFER__EXPORT pfs::optional<channel_info> lookup (channel_id channel) const;

    XFER__EXPORT bool release (channel_id channel);

    XFER__EXPORT std::size_t size () const;
};

XFER__NAMESPACE_END
