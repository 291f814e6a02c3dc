////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/channel_registry.hpp"
#include "pfs/xfer/tag.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>

XFER__NAMESPACE_BEGIN

channel_registry::channel_registry ()
    : _rng(std::random_device{}())
{}

channel_id channel_registry::generate_channel (error * perr)
{
    std::lock_guard<std::mutex> locker{_mtx};

    // Zero is reserved as invalid channel
    std::uniform_int_distribution<channel_id> dist {1};

    for (int i = 0; i < MAX_ATTEMPTS; i++) {
        auto channel = dist(_rng);

        if (_channels.find(channel) == _channels.end()) {
            _channels.emplace(channel, channel_info::from(transfer_state::make_awaiting_metadata(channel)));
            return channel;
        }
    }

    pfs::throw_or(perr, error {
          errc::channel_exhaustion
        , tr::f_("no free channel found after {} attempts", MAX_ATTEMPTS)
    });

    return 0;
}

bool channel_registry::bind (channel_id channel, transfer_state const & state)
{
    std::lock_guard<std::mutex> locker{_mtx};
    auto res = _channels.emplace(channel, channel_info::from(state));

    if (!res.second)
        LOGW(XFER_TAG, "channel already bound: {}", channel);

    return res.second;
}

void channel_registry::update (channel_id channel, transfer_state const & state)
{
    std::lock_guard<std::mutex> locker{_mtx};
    auto info = channel_info::from(state);
    auto pos = _channels.find(channel);

    if (pos == _channels.end())
        _channels.emplace(channel, std::move(info));
    else
        pos->second = std::move(info);
}

pfs::optional<channel_info> channel_registry::lookup (channel_id channel) const
{
    std::lock_guard<std::mutex> locker{_mtx};
    auto pos = _channels.find(channel);

    if (pos == _channels.end())
        return pfs::nullopt;

    return pos->second;
}

bool channel_registry::release (channel_id channel)
{
    std::lock_guard<std::mutex> locker{_mtx};
    return _channels.erase(channel) > 0;
}

std::size_t channel_registry::size () const
{
    std::lock_guard<std::mutex> locker{_mtx};
    return _channels.size();
}

XFER__NAMESPACE_END
