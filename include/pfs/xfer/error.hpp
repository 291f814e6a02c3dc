////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "exports.hpp"
#include "namespace.hpp"
#include <pfs/error.hpp>
#include <string>
#include <system_error>

XFER__NAMESPACE_BEGIN

using error_code = std::error_code;

enum class errc
{
      success = 0
    , io_error            // Local file or storage access failure
    , malformed           // Undecodable or truncated wire message
    , unexpected_message  // Valid message that is illegal for the current transfer state
    , hash_mismatch       // Reassembled content does not match the announced digest
    , timeout             // No message received after exhausting retransmission attempts
    , channel_exhaustion  // Unable to allocate unique channel identifier
    , not_found           // Chunk or metadata is absent in the storage
    , incomplete          // Not all chunks are available for reassembly
    , transport_error     // Datagram send/receive failure
    , invalid_argument
};

class error_category : public std::error_category
{
public:
    XFER__EXPORT virtual char const * name () const noexcept override;
    XFER__EXPORT virtual std::string message (int ev) const override;
};

XFER__EXPORT std::error_category const & get_error_category ();

inline std::error_code make_error_code (errc e)
{
    return std::error_code(static_cast<int>(e), get_error_category());
}

class error: public pfs::error
{
public:
    using pfs::error::error;
};

XFER__NAMESPACE_END

namespace std {
template <>
struct is_error_code_enum<XFER__NAMESPACE_NAME::errc> : public std::true_type {};
} // namespace std
