////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "chunk_store.hpp"
#include "error.hpp"
#include "message.hpp"
#include "namespace.hpp"
#include <pfs/filesystem.hpp>
#include <pfs/optional.hpp>
#include <cstdint>
#include <deque>
#include <set>
#include <string>
#include <vector>

XFER__NAMESPACE_BEGIN

enum class state_enum: std::uint8_t
{
      awaiting_metadata
        /// Responder waits for the session setup message.

    , start_receive
        /// Download initiator waits for the `success_transmit` reply.

    , receiving_chunks
        /// Receiver collects chunks of the expected content.

    , transmitting
        /// Sender emits chunks within the hold window.

    , done
        /// Terminal state: transfer completed.

    , error
        /// Terminal state: transfer failed.
};

enum class role_enum: std::uint8_t { receiver, sender };

XFER__EXPORT char const * to_string (state_enum status) noexcept;

struct transfer_state
{
    state_enum status {state_enum::awaiting_metadata};
    role_enum role {role_enum::receiver};
    channel_id channel {0};

    // Content being transferred (declared by metadata / success_transmit or
    // prepared locally by the sender).
    pfs::optional<file_descriptor> expected;

    // Receiver: target path and permissions (from export request or start_receive).
    pfs::optional<pfs::filesystem::path> target_path;
    std::uint32_t target_mode {0};

    // Receiver: indices in range [0, chunk_count) already stored. Before the
    // content is announced holds indices of chunks arrived in this session.
    std::set<chunk_index> received;

    // Receiver: some of received chunks were stored by previous sessions.
    bool reused {false};

    // Receiver: content placed at the target path.
    bool delivered {false};

    // Sender: next never transmitted index.
    chunk_index next_index {0};

    // Sender: transmitted but not acknowledged indices in transmission order.
    std::deque<chunk_index> in_flight;

    // Sender: indices requested again by the receiver.
    std::deque<chunk_index> retransmit;

    // Sender: transmission requested by import, `success_transmit` is repeated
    // on duplicate requests.
    bool import_reply {false};

    // Single file per transfer: `total_files` is always 1.
    std::uint32_t transmitted_files {0};
    std::uint32_t total_files {0};

    // Consecutive timeouts.
    std::size_t timeouts {0};

    // Terminal cause for error state.
    error_code cause;
    std::string cause_text;

public:
    bool is_terminal () const noexcept
    {
        return status == state_enum::done || status == state_enum::error;
    }

    bool is_setup () const noexcept
    {
        return status == state_enum::awaiting_metadata || status == state_enum::start_receive;
    }

    std::string const * hash () const noexcept
    {
        return expected ? & expected->hash : nullptr;
    }

    // Sender: all chunks transmitted and acknowledged.
    bool all_acknowledged () const noexcept
    {
        return role == role_enum::sender && expected
            && next_index >= expected->chunk_count
            && in_flight.empty() && retransmit.empty();
    }

public: // static
    static transfer_state make_awaiting_metadata (channel_id channel)
    {
        transfer_state s;
        s.channel = channel;
        return s;
    }

    static transfer_state make_start_receive (channel_id channel, pfs::filesystem::path const & path)
    {
        transfer_state s;
        s.status = state_enum::start_receive;
        s.channel = channel;
        s.target_path = path;
        return s;
    }

    static transfer_state make_transmitting (channel_id channel, file_descriptor const & fd)
    {
        transfer_state s;
        s.status = state_enum::transmitting;
        s.role = role_enum::sender;
        s.channel = channel;
        s.expected = fd;
        s.total_files = 1;
        return s;
    }
};

XFER__NAMESPACE_END
