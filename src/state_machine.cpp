////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "pfs/xfer/state_machine.hpp"
#include "pfs/xfer/content_hasher.hpp"
#include "pfs/xfer/tag.hpp"
#include "pfs/xfer/trace.hpp"
#include <pfs/i18n.hpp>
#include <pfs/log.hpp>
#include <algorithm>

XFER__NAMESPACE_BEGIN

namespace fs = pfs::filesystem;

char const * to_string (state_enum status) noexcept
{
    switch (status) {
        case state_enum::awaiting_metadata: return "awaiting_metadata";
        case state_enum::start_receive: return "start_receive";
        case state_enum::receiving_chunks: return "receiving_chunks";
        case state_enum::transmitting: return "transmitting";
        case state_enum::done: return "done";
        case state_enum::error: return "error";
    }

    return "<unknown>";
}

template <typename Container>
inline bool contains (Container const & c, chunk_index index)
{
    return std::find(c.begin(), c.end(), index) != c.end();
}

// Returns `true` if value was found and erased
template <typename Container>
inline bool erase_value (Container & c, chunk_index index)
{
    auto pos = std::remove(c.begin(), c.end(), index);

    if (pos == c.end())
        return false;

    c.erase(pos, c.end());
    return true;
}

inline success_transmit make_transmit_reply (transfer_state const & s)
{
    return success_transmit {
          s.channel
        , s.expected->name
        , s.expected->hash
        , s.expected->chunk_count
        , s.expected->mode
        , true
    };
}

state_machine::state_machine (chunk_store & store, protocol_config const & conf)
    : _store(& store)
    , _conf(conf)
{
    validate(_conf);
}

void state_machine::fail (transition & t, errc ec, std::string const & text, bool notify_peer)
{
    auto & s = t.state;

    s.status = state_enum::error;
    s.cause = make_error_code(ec);
    s.cause_text = text;

    if (notify_peer)
        t.outbound.push_back(failure {s.channel, static_cast<std::uint16_t>(ec), text});

    LOGE(XFER_TAG, "transfer failed on channel {}: {}", s.channel, text);
}

transition state_machine::unexpected (transfer_state && state, message const & m)
{
    auto text = tr::f_("unexpected message {} in state {}"
        , to_string(type_of(m)), to_string(state.status));

    transition t {std::move(state), {}};
    fail(t, errc::unexpected_message, text, true);
    return t;
}

bool state_machine::timeouts_exhausted (transfer_state const & state) const noexcept
{
    return _conf.max_retries && state.timeouts >= *_conf.max_retries;
}

transition state_machine::resume (transfer_state state)
{
    transition t {std::move(state), {}};

    if (t.state.status == state_enum::transmitting)
        fill_window(t);
    else if (t.state.status == state_enum::receiving_chunks)
        try_complete(t);

    return t;
}

transition state_machine::on_message (transfer_state state, message const & m)
{
    if (state.is_terminal())
        return transition {std::move(state), {}};

    XFER__TRACE("[state_machine] channel {}: {} in state {}", state.channel
        , to_string(type_of(m)), to_string(state.status));

    // Handlers reset the timeout counter only on progress, so duplicates
    // exchanged by stuck peers do not prolong the transfer forever.
    switch (type_of(m)) {
        case message_enum::import_request:
            return on_import_request(std::move(state), *pfs::get_if<import_request>(& m));
        case message_enum::metadata:
            return on_metadata(std::move(state), *pfs::get_if<metadata>(& m));
        case message_enum::export_request:
            return on_export_request(std::move(state), *pfs::get_if<export_request>(& m));
        case message_enum::receive_chunk:
            return on_receive_chunk(std::move(state), *pfs::get_if<receive_chunk>(& m));
        case message_enum::success_receive:
            return on_success_receive(std::move(state), *pfs::get_if<success_receive>(& m));
        case message_enum::success_transmit:
            return on_success_transmit(std::move(state), *pfs::get_if<success_transmit>(& m));
        case message_enum::cleanup_request:
            return on_cleanup_request(std::move(state), *pfs::get_if<cleanup_request>(& m));
        case message_enum::ack:
            return on_ack(std::move(state), *pfs::get_if<ack>(& m));
        case message_enum::nak:
            return on_nak(std::move(state), *pfs::get_if<nak>(& m));
        case message_enum::failure:
            return on_failure(std::move(state), *pfs::get_if<failure>(& m));
    }

    return unexpected(std::move(state), m);
}

transition state_machine::on_metadata (transfer_state && state, metadata const & m)
{
    if (state.status == state_enum::receiving_chunks) {
        // Duplicate announcement
        if (state.expected->hash == m.hash && state.expected->chunk_count == m.chunk_count)
            return transition {std::move(state), {}};

        return unexpected(std::move(state), m);
    }

    if (state.status != state_enum::awaiting_metadata)
        return unexpected(std::move(state), m);

    transition t {std::move(state), {}};

    if (!content_hasher::is_valid(m.hash)) {
        fail(t, errc::malformed, tr::f_("bad content hash in metadata: {}", m.hash), true);
        return t;
    }

    file_descriptor fd;
    fd.hash = m.hash;
    fd.chunk_count = m.chunk_count;

    begin_receive(t, std::move(fd));
    return t;
}

transition state_machine::on_import_request (transfer_state && state, import_request const & m)
{
    // Initiator missed the reply
    if (state.status == state_enum::transmitting && state.import_reply) {
        transition t {std::move(state), {}};
        t.outbound.push_back(make_transmit_reply(t.state));
        return t;
    }

    if (state.status != state_enum::awaiting_metadata)
        return unexpected(std::move(state), m);

    transition t {std::move(state), {}};
    error err;

    auto fd = _store->initialize_file(fs::utf8_decode(m.source_path), _conf.chunk_size
        , _conf.effective_hash_chunk_size(), & err);

    if (!fd) {
        fail(t, errc::io_error, tr::f_("prepare file for transmission failure: {}: {}"
            , m.source_path, err.what()), true);
        return t;
    }

    t.state = transfer_state::make_transmitting(m.channel, *fd);
    t.state.import_reply = true;
    t.outbound.push_back(make_transmit_reply(t.state));

    LOGD(XFER_TAG, "channel {}: transmitting {} ({} chunks)", m.channel, fd->hash, fd->chunk_count);

    fill_window(t);
    return t;
}

transition state_machine::on_export_request (transfer_state && state, export_request const & m)
{
    if (state.status != state_enum::awaiting_metadata && state.status != state_enum::receiving_chunks)
        return unexpected(std::move(state), m);

    if (state.expected && state.expected->hash != m.hash)
        return unexpected(std::move(state), m);

    transition t {std::move(state), {}};
    auto & s = t.state;

    if (!content_hasher::is_valid(m.hash)) {
        fail(t, errc::malformed, tr::f_("bad content hash in export request: {}", m.hash), true);
        return t;
    }

    if (!s.target_path)
        s.timeouts = 0;

    s.target_path = fs::utf8_decode(m.target_path);
    s.target_mode = m.mode;

    // Content could be announced by the previous session
    if (s.status == state_enum::awaiting_metadata) {
        error err;
        auto stored = _store->load_meta(m.hash, & err);

        if (!stored) {
            XFER__TRACE("[state_machine] channel {}: export pending metadata: {}", s.channel, m.hash);
            return t;
        }

        begin_receive(t, std::move(*stored));
        return t;
    }

    try_complete(t);
    return t;
}

transition state_machine::on_success_transmit (transfer_state && state, success_transmit const & m)
{
    if (state.status == state_enum::receiving_chunks) {
        // Duplicate reply
        if (state.expected->hash == m.hash && state.expected->chunk_count == m.num_chunks)
            return transition {std::move(state), {}};

        return unexpected(std::move(state), m);
    }

    if (state.status != state_enum::start_receive)
        return unexpected(std::move(state), m);

    transition t {std::move(state), {}};

    if (!content_hasher::is_valid(m.hash)) {
        fail(t, errc::malformed, tr::f_("bad content hash in transmit reply: {}", m.hash), true);
        return t;
    }

    if (!m.last) {
        fail(t, errc::invalid_argument, tr::f_("multi-file transmission is not supported: {}"
            , m.file_name), true);
        return t;
    }

    t.state.target_mode = m.mode;

    begin_receive(t, file_descriptor {m.file_name, m.hash, m.num_chunks, m.mode});
    return t;
}

transition state_machine::on_receive_chunk (transfer_state && state, receive_chunk const & m)
{
    if (state.status == state_enum::transmitting)
        return unexpected(std::move(state), m);

    transition t {std::move(state), {}};
    auto & s = t.state;

    if (!content_hasher::is_valid(m.hash)) {
        LOGW(XFER_TAG, "channel {}: chunk with bad content hash dropped", s.channel);
        return t;
    }

    // Chunk arrived before the content was announced: store it only
    if (s.status != state_enum::receiving_chunks) {
        error err;

        if (!_store->put_chunk(m.hash, m.index, m.payload, & err)) {
            fail(t, errc::io_error, err.what(), true);
            return t;
        }

        if (s.received.insert(m.index).second)
            s.timeouts = 0;

        t.outbound.push_back(ack {s.channel, m.hash, m.index});
        return t;
    }

    if (s.expected->hash != m.hash) {
        LOGW(XFER_TAG, "channel {}: chunk of foreign content dropped: {}", s.channel, m.hash);
        return t;
    }

    if (m.index >= s.expected->chunk_count) {
        XFER__TRACE("[state_machine] channel {}: chunk index out of range dropped: {} (total {})"
            , s.channel, m.index, s.expected->chunk_count);
        return t;
    }

    // Chunks stored by previous sessions are replaced by transmitted ones
    if (s.reused || s.received.find(m.index) == s.received.end()) {
        error err;

        if (!_store->put_chunk(m.hash, m.index, m.payload, & err)) {
            fail(t, errc::io_error, err.what(), true);
            return t;
        }

        if (s.received.insert(m.index).second)
            s.timeouts = 0;
    }

    t.outbound.push_back(ack {s.channel, m.hash, m.index});

    try_complete(t);
    return t;
}

transition state_machine::on_cleanup_request (transfer_state && state, cleanup_request const & m)
{
    transition t {std::move(state), {}};
    auto & s = t.state;
    error err;
    bool success = true;

    if (m.hash) {
        if (!content_hasher::is_valid(*m.hash)) {
            fail(t, errc::malformed, tr::f_("bad content hash in cleanup request: {}", *m.hash), false);
            return t;
        }

        success = _store->purge(*m.hash, & err);
    } else if (s.expected) {
        success = _store->purge(s.expected->hash, & err);
    } else {
        success = _store->purge_all(& err);
    }

    if (!success) {
        fail(t, errc::io_error, err.what(), false);
        return t;
    }

    s.status = state_enum::done;
    LOGD(XFER_TAG, "channel {}: storage cleaned up", s.channel);
    return t;
}

transition state_machine::on_ack (transfer_state && state, ack const & m)
{
    if (state.status != state_enum::transmitting)
        return unexpected(std::move(state), m);

    transition t {std::move(state), {}};
    auto & s = t.state;

    if (s.expected->hash != m.hash)
        return t;

    auto in_flight = erase_value(s.in_flight, m.index);
    auto requested = erase_value(s.retransmit, m.index);

    if (in_flight || requested)
        s.timeouts = 0;

    fill_window(t);
    return t;
}

transition state_machine::on_nak (transfer_state && state, nak const & m)
{
    if (state.status != state_enum::transmitting)
        return unexpected(std::move(state), m);

    transition t {std::move(state), {}};
    auto & s = t.state;

    if (s.expected->hash != m.hash)
        return t;

    s.timeouts = 0;

    for (auto const & r: m.ranges) {
        auto last = (std::min)(r.last, s.next_index);

        // Indices never transmitted will be sent in order anyway
        for (auto i = r.first; i < last; i++) {
            if (contains(s.in_flight, i) || contains(s.retransmit, i))
                continue;

            s.retransmit.push_back(i);
        }
    }

    fill_window(t);
    return t;
}

transition state_machine::on_success_receive (transfer_state && state, success_receive const & m)
{
    if (state.status != state_enum::transmitting)
        return unexpected(std::move(state), m);

    transition t {std::move(state), {}};
    auto & s = t.state;

    s.transmitted_files++;

    if (s.transmitted_files >= s.total_files) {
        s.status = state_enum::done;
        s.in_flight.clear();
        s.retransmit.clear();
        LOGD(XFER_TAG, "channel {}: transmission complete", s.channel);
    }

    return t;
}

transition state_machine::on_failure (transfer_state && state, failure const & m)
{
    transition t {std::move(state), {}};

    auto ec = (m.code > 0 && m.code <= static_cast<std::uint16_t>(errc::invalid_argument))
        ? static_cast<errc>(m.code)
        : errc::unexpected_message;

    fail(t, ec, tr::f_("peer reported failure: {}", m.text), false);
    return t;
}

transition state_machine::on_timeout (transfer_state state)
{
    transition t {std::move(state), {}};
    auto & s = t.state;

    if (s.is_terminal())
        return t;

    s.timeouts++;

    if (timeouts_exhausted(s)) {
        fail(t, errc::timeout, tr::f_("no response after {} attempts", s.timeouts), false);
        return t;
    }

    if (s.status == state_enum::transmitting) {
        if (!s.in_flight.empty()) {
            auto index = s.in_flight.front();
            s.in_flight.pop_front();

            XFER__TRACE("[state_machine] channel {}: retransmit chunk {}", s.channel, index);

            if (!emit_chunk(t, index))
                return t;
        } else if (s.all_acknowledged()) {
            // Completion confirmation is lost or not sent yet. The last chunk
            // (or the reply for empty content) is repeated, a finished receiver
            // answers it with `success_receive` again.
            if (s.expected->chunk_count > 0) {
                if (!emit_chunk(t, s.expected->chunk_count - 1))
                    return t;
            } else if (s.import_reply) {
                t.outbound.push_back(make_transmit_reply(s));
            }
        }

        fill_window(t);
    } else if (s.status == state_enum::receiving_chunks) {
        auto ranges = missing_ranges(s.received, s.expected->chunk_count, MAX_NAK_RANGES);

        if (!ranges.empty())
            t.outbound.push_back(nak {s.channel, s.expected->hash, std::move(ranges)});
    }

    return t;
}

bool state_machine::emit_chunk (transition & t, chunk_index index)
{
    auto & s = t.state;
    error err;

    auto payload = _store->get_chunk(s.expected->hash, index, & err);

    if (err) {
        fail(t, errc::io_error, err.what(), true);
        return false;
    }

    t.outbound.push_back(receive_chunk {s.channel, s.expected->hash, index, std::move(payload)});
    s.in_flight.push_back(index);
    return true;
}

void state_machine::fill_window (transition & t)
{
    auto & s = t.state;

    if (s.status != state_enum::transmitting || !s.expected)
        return;

    auto limit = _conf.max_chunks_transmit ? *_conf.max_chunks_transmit : _conf.hold_count;
    std::size_t sent = 0;

    while (s.in_flight.size() < _conf.hold_count && sent < limit) {
        chunk_index index = 0;

        if (!s.retransmit.empty()) {
            index = s.retransmit.front();
            s.retransmit.pop_front();

            if (contains(s.in_flight, index))
                continue;
        } else if (s.next_index < s.expected->chunk_count) {
            index = s.next_index++;
        } else {
            break;
        }

        if (!emit_chunk(t, index))
            return;

        sent++;
    }
}

void state_machine::begin_receive (transition & t, file_descriptor && fd)
{
    auto & s = t.state;
    error err;
    error meta_err;
    auto stored = _store->load_meta(fd.hash, & meta_err);

    // Chunks of content split by another chunk size can not be reused
    if (meta_err || (stored && stored->chunk_count != fd.chunk_count)) {
        LOGD(XFER_TAG, "channel {}: stale chunks of {} purged", s.channel, fd.hash);

        if (!_store->purge(fd.hash, & err)) {
            fail(t, errc::io_error, err.what(), true);
            return;
        }

        s.received.clear();
        stored = pfs::nullopt;
    }

    if (stored) {
        if (fd.name.empty())
            fd.name = stored->name;

        if (fd.mode == 0)
            fd.mode = stored->mode;
    }

    if (!_store->store_meta(fd, & err)) {
        fail(t, errc::io_error, err.what(), true);
        return;
    }

    auto present = _store->stored_chunks(fd.hash, fd.chunk_count);

    s.reused = std::any_of(present.begin(), present.end(), [& s] (chunk_index index) {
        return s.received.find(index) == s.received.end();
    });

    s.status = state_enum::receiving_chunks;
    s.received = std::move(present);
    s.expected = std::move(fd);
    s.timeouts = 0;

    LOGD(XFER_TAG, "channel {}: receiving {} ({} chunks, {} already stored)"
        , s.channel, s.expected->hash, s.expected->chunk_count, s.received.size());

    try_complete(t);
}

void state_machine::restart_receive (transition & t)
{
    auto & s = t.state;
    error err;

    LOGW(XFER_TAG, "channel {}: previously stored chunks of {} are corrupted, receiving anew"
        , s.channel, s.expected->hash);

    if (!_store->purge(s.expected->hash, & err) || !_store->store_meta(*s.expected, & err)) {
        fail(t, errc::io_error, err.what(), true);
        return;
    }

    s.reused = false;
    s.received.clear();

    t.outbound.push_back(nak {
          s.channel
        , s.expected->hash
        , missing_ranges(s.received, s.expected->chunk_count, MAX_NAK_RANGES)
    });
}

void state_machine::try_complete (transition & t)
{
    auto & s = t.state;

    if (s.status != state_enum::receiving_chunks || !s.expected || !s.target_path)
        return;

    if (s.received.size() < s.expected->chunk_count)
        return;

    auto mode = s.target_mode != 0 ? s.target_mode : s.expected->mode;
    error err;

    if (_store->reassemble_to(s.expected->hash, s.expected->chunk_count, *s.target_path, mode, & err)) {
        s.status = state_enum::done;
        s.delivered = true;
        t.outbound.push_back(success_receive {s.channel});

        LOGD(XFER_TAG, "channel {}: content {} placed at {}", s.channel, s.expected->hash
            , fs::utf8_encode(*s.target_path));

        return;
    }

    if (err.code() == errc::hash_mismatch) {
        // Chunks left by previous sessions could be split by another chunk size
        if (s.reused) {
            restart_receive(t);
            return;
        }

        error purge_err;

        if (!_store->purge(s.expected->hash, & purge_err))
            LOGE(XFER_TAG, "purge corrupted content failure: {}", purge_err.what());

        fail(t, errc::hash_mismatch, err.what(), true);
        return;
    }

    fail(t, err.code() == errc::incomplete ? errc::incomplete : errc::io_error, err.what(), true);
}

XFER__NAMESPACE_END
