////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/codec.hpp"
#include "pfs/xfer/serializer_traits.hpp"
#include <pfs/numeric_cast.hpp>
#include <pfs/i18n.hpp>
#include <limits>

XFER__NAMESPACE_BEGIN

using serializer_type = serializer_traits::serializer_type;
using deserializer_type = serializer_traits::deserializer_type;

namespace {

constexpr std::uint8_t MAX_TYPE_VALUE = static_cast<std::uint8_t>(message_enum::failure);

inline std::uint8_t make_b0 (message_enum type) noexcept
{
    std::uint8_t b0 = 0;
    b0 |= (static_cast<std::uint8_t>(PROTOCOL_VERSION) << 4) & 0xF0;
    b0 |= static_cast<std::uint8_t>(type) & 0x0F;
    return b0;
}

inline int version_of (std::uint8_t b0) noexcept
{
    return static_cast<int>((b0 >> 4) & 0x0F);
}

inline std::uint8_t type_value_of (std::uint8_t b0) noexcept
{
    return static_cast<std::uint8_t>(b0 & 0x0F);
}

void write_string (serializer_type & out, std::string const & s)
{
    if (s.size() > (std::numeric_limits<std::uint16_t>::max)()) {
        throw error {
              errc::invalid_argument
            , tr::f_("string field too long: {} bytes", s.size())
        };
    }

    auto size = static_cast<std::uint16_t>(s.size());
    out << size;
    out.write(s.data(), s.size());
}

void write_payload (serializer_type & out, std::vector<char> const & payload)
{
    if (payload.size() > (std::numeric_limits<std::uint32_t>::max)()) {
        throw error {
              errc::invalid_argument
            , tr::f_("payload too long: {} bytes", payload.size())
        };
    }

    auto size = static_cast<std::uint32_t>(payload.size());
    out << size;
    out.write(payload.data(), payload.size());
}

std::string read_string (deserializer_type & in)
{
    std::uint16_t size = 0;
    archive bytes;

    in >> size;

    if (!in.is_good())
        return std::string{};

    in.read(bytes, size);
    return bytes.to_string();
}

std::vector<char> read_payload (deserializer_type & in)
{
    std::uint32_t size = 0;
    archive bytes;

    in >> size;

    if (!in.is_good())
        return std::vector<char>{};

    in.read(bytes, size);
    return bytes.take();
}

inline bool to_bool (std::uint8_t x) noexcept
{
    return x != 0;
}

} // namespace

std::vector<char> encode (message const & m)
{
    auto type = type_of(m);
    archive ar;
    serializer_type out {ar};

    out << make_b0(type) << channel_of(m);

    switch (type) {
        case message_enum::import_request: {
            auto p = pfs::get_if<import_request>(& m);
            write_string(out, p->source_path);
            break;
        }

        case message_enum::metadata: {
            auto p = pfs::get_if<metadata>(& m);
            write_string(out, p->hash);
            out << p->chunk_count;
            break;
        }

        case message_enum::export_request: {
            auto p = pfs::get_if<export_request>(& m);
            write_string(out, p->hash);
            write_string(out, p->target_path);
            out << p->mode;
            break;
        }

        case message_enum::receive_chunk: {
            auto p = pfs::get_if<receive_chunk>(& m);
            write_string(out, p->hash);
            out << p->index;
            write_payload(out, p->payload);
            break;
        }

        case message_enum::success_receive:
            break;

        case message_enum::success_transmit: {
            auto p = pfs::get_if<success_transmit>(& m);
            write_string(out, p->file_name);
            write_string(out, p->hash);
            out << p->num_chunks << p->mode << static_cast<std::uint8_t>(p->last ? 1 : 0);
            break;
        }

        case message_enum::cleanup_request: {
            auto p = pfs::get_if<cleanup_request>(& m);

            if (p->hash) {
                out << static_cast<std::uint8_t>(1);
                write_string(out, *p->hash);
            } else {
                out << static_cast<std::uint8_t>(0);
            }

            break;
        }

        case message_enum::ack: {
            auto p = pfs::get_if<ack>(& m);
            write_string(out, p->hash);
            out << p->index;
            break;
        }

        case message_enum::nak: {
            auto p = pfs::get_if<nak>(& m);
            write_string(out, p->hash);
            out << pfs::numeric_cast<std::uint32_t>(p->ranges.size());

            for (auto const & r: p->ranges)
                out << r.first << r.last;

            break;
        }

        case message_enum::failure: {
            auto p = pfs::get_if<failure>(& m);
            out << p->code;
            write_string(out, p->text);
            break;
        }
    }

    return ar.take();
}

pfs::optional<message> decode (char const * data, std::size_t len, error * perr)
{
    auto malformed = [perr] (std::string && description) {
        pfs::throw_or(perr, error {
              errc::malformed
            , std::move(description)
        });

        return pfs::optional<message>{};
    };

    if (len < HEADER_SIZE)
        return malformed(tr::f_("message too short: {} bytes", len));

    deserializer_type in {data, len};
    std::uint8_t b0 = 0;
    channel_id channel = 0;

    in >> b0 >> channel;

    if (version_of(b0) != PROTOCOL_VERSION)
        return malformed(tr::f_("unsupported protocol version: {}", version_of(b0)));

    auto type_value = type_value_of(b0);

    if (type_value == 0 || type_value > MAX_TYPE_VALUE)
        return malformed(tr::f_("unknown message type: {}", type_value));

    auto type = static_cast<message_enum>(type_value);
    pfs::optional<message> result;

    switch (type) {
        case message_enum::import_request: {
            import_request m {channel, std::string{}};
            m.source_path = read_string(in);
            result = std::move(m);
            break;
        }

        case message_enum::metadata: {
            metadata m {channel, std::string{}, 0};
            m.hash = read_string(in);
            in >> m.chunk_count;
            result = std::move(m);
            break;
        }

        case message_enum::export_request: {
            export_request m {channel, std::string{}, std::string{}, 0};
            m.hash = read_string(in);
            m.target_path = read_string(in);
            in >> m.mode;
            result = std::move(m);
            break;
        }

        case message_enum::receive_chunk: {
            receive_chunk m {channel, std::string{}, 0, std::vector<char>{}};
            m.hash = read_string(in);
            in >> m.index;
            m.payload = read_payload(in);
            result = std::move(m);
            break;
        }

        case message_enum::success_receive:
            result = success_receive {channel};
            break;

        case message_enum::success_transmit: {
            success_transmit m {channel, std::string{}, std::string{}, 0, 0, false};
            std::uint8_t last = 0;
            m.file_name = read_string(in);
            m.hash = read_string(in);
            in >> m.num_chunks >> m.mode >> last;
            m.last = to_bool(last);
            result = std::move(m);
            break;
        }

        case message_enum::cleanup_request: {
            cleanup_request m {channel, pfs::nullopt};
            std::uint8_t present = 0;
            in >> present;

            if (present > 1)
                return malformed(tr::_("bad optional hash flag"));

            if (present == 1)
                m.hash = read_string(in);

            result = std::move(m);
            break;
        }

        case message_enum::ack: {
            ack m {channel, std::string{}, 0};
            m.hash = read_string(in);
            in >> m.index;
            result = std::move(m);
            break;
        }

        case message_enum::nak: {
            nak m {channel, std::string{}, std::vector<chunk_range>{}};
            std::uint32_t count = 0;
            m.hash = read_string(in);
            in >> count;

            // Each range occupies 8 bytes, do not trust the count blindly
            if (!in.is_good() || count > in.available() / 8)
                return malformed(tr::f_("bad ranges count: {}", count));

            m.ranges.reserve(count);

            for (std::uint32_t i = 0; i < count; i++) {
                chunk_range r {0, 0};
                in >> r.first >> r.last;

                if (r.first >= r.last)
                    return malformed(tr::f_("bad chunk range: [{}, {})", r.first, r.last));

                m.ranges.push_back(r);
            }

            result = std::move(m);
            break;
        }

        case message_enum::failure: {
            failure m {channel, 0, std::string{}};
            in >> m.code;
            m.text = read_string(in);
            result = std::move(m);
            break;
        }
    }

    if (!in.is_good())
        return malformed(tr::f_("truncated message: {}", to_string(type)));

    if (in.available() > 0) {
        return malformed(tr::f_("trailing bytes in message {}: {}"
            , to_string(type), in.available()));
    }

    return result;
}

pfs::optional<channel_id> peek_channel (char const * data, std::size_t len) noexcept
{
    if (len < HEADER_SIZE)
        return pfs::nullopt;

    auto b0 = static_cast<std::uint8_t>(data[0]);
    auto type_value = type_value_of(b0);

    if (version_of(b0) != PROTOCOL_VERSION || type_value == 0 || type_value > MAX_TYPE_VALUE)
        return pfs::nullopt;

    channel_id channel = 0;

    for (std::size_t i = 1; i < HEADER_SIZE; i++)
        channel = (channel << 8) | static_cast<std::uint8_t>(data[i]);

    return channel;
}

XFER__NAMESPACE_END
