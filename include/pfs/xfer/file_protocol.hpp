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
#include "chunk_store.hpp"
#include "config.hpp"
#include "error.hpp"
#include "exports.hpp"
#include "message.hpp"
#include "namespace.hpp"
#include "socket4_addr.hpp"
#include "state_machine.hpp"
#include "transfer_state.hpp"
#include "transport.hpp"
#include <pfs/filesystem.hpp>
#include <pfs/optional.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

XFER__NAMESPACE_BEGIN

/**
 * File transfer protocol endpoint: session setup helpers and the message engine
 * that drives one transfer until it reaches terminal state.
 */
class file_protocol
{
public:
    using pump_type = std::function<pfs::optional<std::vector<char>> (std::chrono::milliseconds)>;

private:
    transport * _transport {nullptr};
    socket4_addr _remote;
    protocol_config _conf;
    std::shared_ptr<channel_registry> _registry;
    chunk_store _store;
    state_machine _sm;

    // Session setup messages sent on each channel, repeated on timeouts until
    // the transfer reaches terminal state.
    std::map<channel_id, std::vector<message>> _setup;

public:
    /**
     * Constructs protocol endpoint.
     *
     * @param t Transport (must outlive the endpoint).
     * @param remote Peer address.
     * @param conf Protocol configuration (validated, throws @c errc::invalid_argument).
     * @param registry Channel registry shared with other endpoints, new one is
     *        created if @c nullptr.
     */
    XFER__EXPORT file_protocol (transport & t, socket4_addr const & remote
        , protocol_config const & conf
        , std::shared_ptr<channel_registry> registry = nullptr);

    file_protocol (file_protocol const &) = delete;
    file_protocol & operator = (file_protocol const &) = delete;

public:
    protocol_config const & config () const noexcept
    {
        return _conf;
    }

    socket4_addr const & remote () const noexcept
    {
        return _remote;
    }

    chunk_store & storage () noexcept
    {
        return _store;
    }

    channel_registry & registry () noexcept
    {
        return *_registry;
    }

    XFER__EXPORT channel_id generate_channel (error * perr = nullptr);

    /**
     * Prepares file @a path for sending: hashes it and stores chunks and metadata.
     */
    XFER__EXPORT pfs::optional<file_descriptor> initialize_file (pfs::filesystem::path const & path
        , error * perr = nullptr);

    /**
     * Session setup helpers. Messages are remembered and sent again by the
     * message engine of @a channel on timeouts.
     */
    XFER__EXPORT void send_import_file (channel_id channel, std::string const & source_path);
    XFER__EXPORT void send_metadata (channel_id channel, std::string const & hash
        , std::uint32_t chunk_count);
    XFER__EXPORT void send_export (channel_id channel, std::string const & hash
        , std::string const & target_path, std::uint32_t mode);

    /**
     * Sends cleanup request. Cleanup is not answered, so @a channel is released.
     */
    XFER__EXPORT void send_cleanup (channel_id channel, pfs::optional<std::string> const & hash);

    /**
     * Encodes and sends arbitrary message to the peer.
     */
    XFER__EXPORT void send (message const & m);

    /**
     * Default message pump: receives next datagram from the transport.
     */
    XFER__EXPORT pfs::optional<std::vector<char>> recv (pfs::optional<std::chrono::milliseconds> timeout);

    /**
     * Processes single raw message in @a state and sends resulting messages.
     * Malformed message fails the transfer if @a state is a session setup state
     * and is ignored otherwise.
     */
    XFER__EXPORT transfer_state process_message (std::vector<char> const & bytes
        , transfer_state const & state);

    /**
     * Drives transfer @a state until terminal state. Malformed message fails
     * the transfer in session setup states and is ignored otherwise. Receiver
     * that placed the content keeps answering the peer's retransmissions with
     * `success_receive` until the channel is quiet for @a timeout.
     *
     * @return @c true if transfer completed successfully, @c false (or throws
     *         @c xfer::error with the transfer failure code) otherwise.
     */
    XFER__EXPORT bool message_engine (pump_type pump, std::chrono::milliseconds timeout
        , transfer_state & state, error * perr = nullptr);

    /**
     * Drives transfer @a state using the transport and configured receive timeout.
     */
    bool message_engine (transfer_state & state, error * perr = nullptr)
    {
        return message_engine([this] (std::chrono::milliseconds timeout) {
            return this->recv(timeout);
        }, _conf.receive_timeout, state, perr);
    }

private:
    void send_all (std::vector<message> const & outbound);
    void announce (message && m);
    void linger (pump_type & pump, std::chrono::milliseconds timeout, channel_id channel);
    transfer_state step (std::vector<char> const & bytes, transfer_state && state, bool strict);
    void commit (transfer_state const & state);
};

XFER__NAMESPACE_END
