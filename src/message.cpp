////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/message.hpp"

XFER__NAMESPACE_BEGIN

template <typename T>
inline channel_id channel_of_alternative (message const & m) noexcept
{
    auto p = pfs::get_if<T>(& m);
    return p != nullptr ? p->channel : 0;
}

channel_id channel_of (message const & m) noexcept
{
    switch (type_of(m)) {
        case message_enum::import_request:
            return channel_of_alternative<import_request>(m);
        case message_enum::metadata:
            return channel_of_alternative<metadata>(m);
        case message_enum::export_request:
            return channel_of_alternative<export_request>(m);
        case message_enum::receive_chunk:
            return channel_of_alternative<receive_chunk>(m);
        case message_enum::success_receive:
            return channel_of_alternative<success_receive>(m);
        case message_enum::success_transmit:
            return channel_of_alternative<success_transmit>(m);
        case message_enum::cleanup_request:
            return channel_of_alternative<cleanup_request>(m);
        case message_enum::ack:
            return channel_of_alternative<ack>(m);
        case message_enum::nak:
            return channel_of_alternative<nak>(m);
        case message_enum::failure:
            return channel_of_alternative<failure>(m);
    }

    return 0;
}

char const * to_string (message_enum type) noexcept
{
    switch (type) {
        case message_enum::import_request: return "import_request";
        case message_enum::metadata: return "metadata";
        case message_enum::export_request: return "export_request";
        case message_enum::receive_chunk: return "receive_chunk";
        case message_enum::success_receive: return "success_receive";
        case message_enum::success_transmit: return "success_transmit";
        case message_enum::cleanup_request: return "cleanup_request";
        case message_enum::ack: return "ack";
        case message_enum::nak: return "nak";
        case message_enum::failure: return "failure";
    }

    return "<unknown>";
}

XFER__NAMESPACE_END
