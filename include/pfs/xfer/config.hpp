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
#include <pfs/filesystem.hpp>
#include <pfs/optional.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>

XFER__NAMESPACE_BEGIN

struct protocol_config
{
    // Storage root, chunks are stored under `<prefix>/storage`.
    pfs::filesystem::path prefix {"."};

    // Maximum size of the chunk payload in bytes.
    std::size_t chunk_size {4096};

    // Maximum number of transmitted but not acknowledged chunks.
    std::size_t hold_count {5};

    // Bounded wait for the next message.
    std::chrono::milliseconds receive_timeout {2000};

    // Number of consecutive timeouts before the transfer fails, unlimited if not set.
    pfs::optional<std::size_t> max_retries {5};

    // Read block size used while hashing, `2 * chunk_size` if zero.
    std::size_t hash_chunk_size {0};

    // Maximum number of chunks sent per one window refill, `hold_count` if not set.
    pfs::optional<std::size_t> max_chunks_transmit;

    std::size_t effective_hash_chunk_size () const noexcept
    {
        return hash_chunk_size > 0 ? hash_chunk_size : chunk_size * 2;
    }
};

/**
 * Checks configuration consistency.
 *
 * @return @c true if @a conf is valid, @c false (or throws @c xfer::error
 *         with @c errc::invalid_argument) otherwise.
 */
XFER__EXPORT bool validate (protocol_config const & conf, error * perr = nullptr);

XFER__NAMESPACE_END
