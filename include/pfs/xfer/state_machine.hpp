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
#include "config.hpp"
#include "exports.hpp"
#include "message.hpp"
#include "namespace.hpp"
#include "transfer_state.hpp"
#include <vector>

XFER__NAMESPACE_BEGIN

struct transition
{
    transfer_state state;
    std::vector<message> outbound;
};

/**
 * Pure transition function of one transfer: `(state, event) -> (state, effects)`.
 * Side effects are limited to the chunk store and the returned outbound messages.
 */
class state_machine
{
public:
    // Upper bound of ranges in a single negative acknowledgement.
    static constexpr std::size_t MAX_NAK_RANGES = 1024;

private:
    chunk_store * _store {nullptr};
    protocol_config _conf;

public:
    XFER__EXPORT state_machine (chunk_store & store, protocol_config const & conf);

    /**
     * Emits messages due on entering @a state (fills sender window). Used when
     * the engine starts driving a transfer.
     */
    XFER__EXPORT transition resume (transfer_state state);

    XFER__EXPORT transition on_message (transfer_state state, message const & m);

    XFER__EXPORT transition on_timeout (transfer_state state);

private:
    transition on_metadata (transfer_state && state, metadata const & m);
    transition on_import_request (transfer_state && state, import_request const & m);
    transition on_export_request (transfer_state && state, export_request const & m);
    transition on_success_transmit (transfer_state && state, success_transmit const & m);
    transition on_receive_chunk (transfer_state && state, receive_chunk const & m);
    transition on_cleanup_request (transfer_state && state, cleanup_request const & m);
    transition on_ack (transfer_state && state, ack const & m);
    transition on_nak (transfer_state && state, nak const & m);
    transition on_success_receive (transfer_state && state, success_receive const & m);
    transition on_failure (transfer_state && state, failure const & m);

    // Enters `receiving_chunks` for content @a fd reusing chunks already stored
    void begin_receive (transition & t, file_descriptor && fd);

    // Checks receiver completion and reassembles the content if possible
    void try_complete (transition & t);

    // Drops stored chunks of content that failed verification and requests all chunks again
    void restart_receive (transition & t);

    // Sends chunks while the hold window is not full
    void fill_window (transition & t);

    bool emit_chunk (transition & t, chunk_index index);

    bool timeouts_exhausted (transfer_state const & state) const noexcept;

    static void fail (transition & t, errc ec, std::string const & text, bool notify_peer);
    static transition unexpected (transfer_state && state, message const & m);
};

XFER__NAMESPACE_END
