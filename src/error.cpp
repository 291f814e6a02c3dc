////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/error.hpp"
#include <pfs/i18n.hpp>

XFER__NAMESPACE_BEGIN

char const * error_category::name () const noexcept
{
    return "xfer::category";
}

std::string error_category::message (int ev) const
{
    switch (static_cast<errc>(ev)) {
        case errc::success:
            return tr::_("no error");
        case errc::io_error:
            return tr::_("I/O error");
        case errc::malformed:
            return tr::_("malformed message");
        case errc::unexpected_message:
            return tr::_("unexpected message");
        case errc::hash_mismatch:
            return tr::_("hash mismatch");
        case errc::timeout:
            return tr::_("timeout");
        case errc::channel_exhaustion:
            return tr::_("channel exhaustion");
        case errc::not_found:
            return tr::_("not found");
        case errc::incomplete:
            return tr::_("incomplete");
        case errc::transport_error:
            return tr::_("transport error");
        case errc::invalid_argument:
            return tr::_("invalid argument");

        default: return tr::_("unknown xfer error");
    }
}

std::error_category const & get_error_category ()
{
    static error_category instance;
    return instance;
}

XFER__NAMESPACE_END
