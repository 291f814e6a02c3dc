////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/file_protocol.hpp"
#include "pfs/xfer/codec.hpp"
#include "pfs/xfer/tag.hpp"
#include "pfs/xfer/trace.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>

XFER__NAMESPACE_BEGIN

file_protocol::file_protocol (transport & t, socket4_addr const & remote
    , protocol_config const & conf, std::shared_ptr<channel_registry> registry)
    : _transport(& t)
    , _remote(remote)
    , _conf(conf)
    , _registry(registry ? std::move(registry) : std::make_shared<channel_registry>())
    , _store(conf.prefix)
    , _sm(_store, conf)
{}

channel_id file_protocol::generate_channel (error * perr)
{
    return _registry->generate_channel(perr);
}

pfs::optional<file_descriptor> file_protocol::initialize_file (pfs::filesystem::path const & path
    , error * perr)
{
    return _store.initialize_file(path, _conf.chunk_size, _conf.effective_hash_chunk_size(), perr);
}

void file_protocol::send (message const & m)
{
    auto data = encode(m);

    XFER__TRACE("[file_protocol] send {} on channel {} to {}", to_string(type_of(m))
        , channel_of(m), to_string(_remote));

    _transport->send(_remote, data.data(), data.size());
}

void file_protocol::announce (message && m)
{
    send(m);
    _setup[channel_of(m)].push_back(std::move(m));
}

void file_protocol::send_import_file (channel_id channel, std::string const & source_path)
{
    announce(import_request {channel, source_path});
}

void file_protocol::send_metadata (channel_id channel, std::string const & hash
    , std::uint32_t chunk_count)
{
    announce(metadata {channel, hash, chunk_count});
}

void file_protocol::send_export (channel_id channel, std::string const & hash
    , std::string const & target_path, std::uint32_t mode)
{
    announce(export_request {channel, hash, target_path, mode});
}

void file_protocol::send_cleanup (channel_id channel, pfs::optional<std::string> const & hash)
{
    send(cleanup_request {channel, hash});

    _setup.erase(channel);
    _registry->release(channel);
}

pfs::optional<std::vector<char>> file_protocol::recv (pfs::optional<std::chrono::milliseconds> timeout)
{
    return _transport->recv(timeout);
}

void file_protocol::send_all (std::vector<message> const & outbound)
{
    for (auto const & m: outbound)
        send(m);
}

void file_protocol::commit (transfer_state const & state)
{
    if (state.is_terminal())
        _registry->release(state.channel);
    else
        _registry->update(state.channel, state);
}

transfer_state file_protocol::step (std::vector<char> const & bytes, transfer_state && state
    , bool strict)
{
    error err;
    auto m = decode(bytes, & err);

    if (!m) {
        if (strict && state.is_setup()) {
            state.status = state_enum::error;
            state.cause = make_error_code(errc::malformed);
            state.cause_text = err.what();
            LOGE(XFER_TAG, "channel {}: session setup failure: {}", state.channel, err.what());
        } else {
            LOGW(XFER_TAG, "channel {}: malformed message dropped: {}", state.channel, err.what());
        }

        return std::move(state);
    }

    auto channel = channel_of(*m);

    if (channel != state.channel) {
        XFER__TRACE("[file_protocol] message {} for foreign channel {} dropped (expected {})"
            , to_string(type_of(*m)), channel, state.channel);
        return std::move(state);
    }

    auto t = _sm.on_message(std::move(state), *m);
    send_all(t.outbound);
    return std::move(t.state);
}

transfer_state file_protocol::process_message (std::vector<char> const & bytes
    , transfer_state const & state)
{
    auto result = step(bytes, transfer_state{state}, true);
    commit(result);
    return result;
}

void file_protocol::linger (pump_type & pump, std::chrono::milliseconds timeout
    , channel_id channel)
{
    try {
        pfs::optional<std::vector<char>> bytes;

        while ((bytes = pump(timeout))) {
            auto ch = peek_channel(bytes->data(), bytes->size());

            if (ch && *ch == channel) {
                XFER__TRACE("[file_protocol] channel {}: completion confirmed again", channel);
                send(success_receive {channel});
            }
        }
    } catch (error const & ex) {
        // Content is already placed, the outcome is not changed
        LOGW(XFER_TAG, "channel {}: confirm completion failure: {}", channel, ex.what());
    }
}

bool file_protocol::message_engine (pump_type pump, std::chrono::milliseconds timeout
    , transfer_state & state, error * perr)
{
    auto channel = state.channel;

    try {
        _registry->update(state.channel, state);

        auto t = _sm.resume(std::move(state));
        send_all(t.outbound);
        state = std::move(t.state);

        while (!state.is_terminal()) {
            auto bytes = pump(timeout);

            if (!bytes) {
                XFER__TRACE("[file_protocol] channel {}: timeout in state {}", state.channel
                    , to_string(state.status));

                t = _sm.on_timeout(std::move(state));
                send_all(t.outbound);
                state = std::move(t.state);

                // Session setup messages could be lost
                if (!state.is_terminal()) {
                    auto pos = _setup.find(channel);

                    if (pos != _setup.end())
                        send_all(pos->second);
                }
            } else {
                auto strict = state.is_setup();
                state = step(*bytes, std::move(state), strict);
            }

            commit(state);
        }
    } catch (error const & ex) {
        state.status = state_enum::error;
        state.cause = ex.code();
        state.cause_text = ex.what();
        _setup.erase(channel);
        _registry->release(channel);
        pfs::throw_or(perr, error{ex});
        return false;
    }

    _setup.erase(channel);
    _registry->release(channel);

    if (state.status == state_enum::done) {
        if (state.delivered)
            linger(pump, timeout, channel);

        return true;
    }

    pfs::throw_or(perr, error {
          state.cause
        , tr::f_("transfer failure on channel {}", state.channel)
        , state.cause_text
    });

    return false;
}

XFER__NAMESPACE_END
