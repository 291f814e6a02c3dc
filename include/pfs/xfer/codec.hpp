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
#include <pfs/optional.hpp>
#include <cstddef>
#include <vector>

XFER__NAMESPACE_BEGIN

// Header:
//
// Byte 0:
// ---------------------------
// | 7  6  5  4 | 3  2  1  0 |
// ---------------------------
// |    (V)     |     (T)    |
// ---------------------------
// (V) - Protocol version (1 - first, 2 - second, etc).
// (T) - Message type (see message_enum).
//
// Bytes 1..4: channel identifier.
//
// Fields follow the header in network byte order. Strings are prefixed with
// 16-bit length, chunk payloads with 32-bit length, optional hash with
// 8-bit presence flag, ranges with 32-bit count of (first, last) pairs.

constexpr std::size_t HEADER_SIZE = 5;

XFER__EXPORT std::vector<char> encode (message const & m);

/**
 * Decodes message from @a data.
 *
 * @return Decoded message or @c nullopt (or throws @c xfer::error with
 *         @c errc::malformed) if data is truncated, has unknown type or
 *         version, or contains trailing bytes.
 */
XFER__EXPORT pfs::optional<message> decode (char const * data, std::size_t len
    , error * perr = nullptr);

inline pfs::optional<message> decode (std::vector<char> const & data, error * perr = nullptr)
{
    return decode(data.data(), data.size(), perr);
}

/**
 * Extracts channel identifier from the message header without decoding the body.
 */
XFER__EXPORT pfs::optional<channel_id> peek_channel (char const * data, std::size_t len) noexcept;

XFER__NAMESPACE_END
