////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/config.hpp"
#include <pfs/i18n.hpp>
#include <limits>
#include <string>

XFER__NAMESPACE_BEGIN

bool validate (protocol_config const & conf, error * perr)
{
    bool bad = false;
    std::string invalid_argument_desc;

    do {
        if (conf.prefix.empty()) {
            bad = true;
            invalid_argument_desc = tr::_("storage prefix must not be empty");
            break;
        }

        // Payload length is encoded as 32-bit unsigned integer
        if (conf.chunk_size == 0 || conf.chunk_size > (std::numeric_limits<std::uint32_t>::max)()) {
            bad = true;
            invalid_argument_desc = tr::_("chunk size must be a positive 32-bit integer");
            break;
        }

        if (conf.hold_count == 0) {
            bad = true;
            invalid_argument_desc = tr::_("hold count must be greater than zero");
            break;
        }

        if (conf.receive_timeout <= std::chrono::milliseconds{0}) {
            bad = true;
            invalid_argument_desc = tr::_("receive timeout must be positive");
            break;
        }

        if (conf.max_chunks_transmit && *conf.max_chunks_transmit == 0) {
            bad = true;
            invalid_argument_desc = tr::_("maximum chunks per transmit must be greater than zero");
            break;
        }
    } while (false);

    if (bad) {
        pfs::throw_or(perr, error {
              errc::invalid_argument
            , invalid_argument_desc
        });

        return false;
    }

    return true;
}

XFER__NAMESPACE_END
