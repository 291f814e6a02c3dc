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
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/optional.hpp>
#include <pfs/variant.hpp>
#include <cstdint>
#include <string>
#include <vector>

XFER__NAMESPACE_BEGIN

using channel_id = std::uint32_t;

constexpr int PROTOCOL_VERSION = 1;

/// Message type
enum class message_enum: std::uint8_t
{
      import_request = 1
        /// Request to send file located on the responder side.

    , metadata = 2
        /// Announcement of the content to be received.

    , export_request = 3
        /// Request to place received content at the target path.

    , receive_chunk = 4
        /// Chunk payload.

    , success_receive = 5
        /// Content received, verified and placed.

    , success_transmit = 6
        /// Reply to import request: responder prepared content and starts sending.

    , cleanup_request = 7
        /// Request to remove stored chunks.

    , ack = 8
        /// Chunk receive acknowledgement.

    , nak = 9
        /// Missing chunks report.

    , failure = 10
        /// Transfer failed on the peer side.
};

struct import_request
{
    channel_id channel;
    std::string source_path;
};

struct metadata
{
    channel_id channel;
    std::string hash;
    std::uint32_t chunk_count;
};

struct export_request
{
    channel_id channel;
    std::string hash;
    std::string target_path;
    std::uint32_t mode;
};

struct receive_chunk
{
    channel_id channel;
    std::string hash;
    chunk_index index;
    std::vector<char> payload;
};

struct success_receive
{
    channel_id channel;
};

struct success_transmit
{
    channel_id channel;
    std::string file_name;
    std::string hash;
    std::uint32_t num_chunks;
    std::uint32_t mode;
    bool last;
};

struct cleanup_request
{
    channel_id channel;
    pfs::optional<std::string> hash;
};

struct ack
{
    channel_id channel;
    std::string hash;
    chunk_index index;
};

struct nak
{
    channel_id channel;
    std::string hash;
    std::vector<chunk_range> ranges;
};

struct failure
{
    channel_id channel;
    std::uint16_t code;
    std::string text;
};

// Alternatives order must match message_enum values
using message = pfs::variant<
      import_request
    , metadata
    , export_request
    , receive_chunk
    , success_receive
    , success_transmit
    , cleanup_request
    , ack
    , nak
    , failure>;

inline message_enum type_of (message const & m) noexcept
{
    return static_cast<message_enum>(m.index() + 1);
}

XFER__EXPORT channel_id channel_of (message const & m) noexcept;
XFER__EXPORT char const * to_string (message_enum type) noexcept;

XFER__NAMESPACE_END
