////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `xfer-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "tools.hpp"
#include <pfs/xfer/content_hasher.hpp>
#include <pfs/xfer/state_machine.hpp>
#include <deque>
#include <set>

using namespace xfer;
namespace fs = pfs::filesystem;

static constexpr channel_id kChannel = 77;

static protocol_config make_config (fs::path const & prefix, std::size_t chunk_size
    , std::size_t hold_count)
{
    protocol_config conf;
    conf.prefix = prefix;
    conf.chunk_size = chunk_size;
    conf.hold_count = hold_count;
    conf.max_retries = 3;
    return conf;
}

template <typename T>
static std::vector<T const *> select (std::vector<message> const & outbound)
{
    std::vector<T const *> result;

    for (auto const & m: outbound) {
        auto p = pfs::get_if<T>(& m);

        if (p != nullptr)
            result.push_back(p);
    }

    return result;
}

struct fixture
{
    tools::temp_dir dir;
    protocol_config sender_conf;
    protocol_config receiver_conf;
    chunk_store sender_store;
    chunk_store receiver_store;
    state_machine sender;
    state_machine receiver;
    file_descriptor fd;

    fixture (std::string const & content, std::size_t chunk_size, std::size_t hold_count)
        : sender_conf(make_config(dir / "sender", chunk_size, hold_count))
        , receiver_conf(make_config(dir / "receiver", chunk_size, hold_count))
        , sender_store(sender_conf.prefix)
        , receiver_store(receiver_conf.prefix)
        , sender(sender_store, sender_conf)
        , receiver(receiver_store, receiver_conf)
    {
        tools::write_file(dir / "source.txt", content);
        fd = *sender_store.initialize_file(dir / "source.txt", chunk_size, chunk_size * 2);
    }

    fs::path target () const
    {
        return dir / "target.txt";
    }

    // Delivers messages in both directions until there is nothing to deliver.
    // Returns maximum number of in-flight chunks observed on the sender side.
    std::size_t exchange (transfer_state & s, transfer_state & r
        , std::deque<message> to_receiver, std::deque<message> to_sender)
    {
        std::size_t max_in_flight = s.in_flight.size();

        while (!to_receiver.empty() || !to_sender.empty()) {
            if (!to_receiver.empty()) {
                auto t = receiver.on_message(r, to_receiver.front());
                to_receiver.pop_front();
                r = t.state;
                to_sender.insert(to_sender.end(), t.outbound.begin(), t.outbound.end());
            }

            if (!to_sender.empty()) {
                auto t = sender.on_message(s, to_sender.front());
                to_sender.pop_front();
                s = t.state;
                max_in_flight = (std::max)(max_in_flight, s.in_flight.size());
                to_receiver.insert(to_receiver.end(), t.outbound.begin(), t.outbound.end());
            }
        }

        return max_in_flight;
    }
};

TEST_CASE("ten bytes with chunk size four") {
    fixture f {"0123456789", 4, 2};

    REQUIRE_EQ(f.fd.chunk_count, 3);

    auto r = transfer_state::make_awaiting_metadata(kChannel);
    auto t = f.receiver.on_message(r, metadata {kChannel, f.fd.hash, f.fd.chunk_count});

    CHECK(t.state.status == state_enum::receiving_chunks);
    CHECK(t.outbound.empty());

    t = f.receiver.on_message(t.state, export_request {kChannel, f.fd.hash
        , fs::utf8_encode(f.target()), 0600});
    r = t.state;

    CHECK(r.status == state_enum::receiving_chunks);
    REQUIRE(r.target_path);

    auto s = transfer_state::make_transmitting(kChannel, f.fd);
    auto st = f.sender.resume(s);
    s = st.state;

    // Window is limited by hold count
    CHECK_EQ(select<receive_chunk>(st.outbound).size(), 2);
    CHECK_EQ(s.in_flight.size(), 2);

    std::deque<message> to_receiver(st.outbound.begin(), st.outbound.end());
    auto max_in_flight = f.exchange(s, r, std::move(to_receiver), {});

    CHECK_LE(max_in_flight, 2);
    CHECK(r.status == state_enum::done);
    CHECK(s.status == state_enum::done);
    CHECK_EQ(s.transmitted_files, 1);
    CHECK_EQ(tools::read_file(f.target()), tools::read_file(f.dir / "source.txt"));
    CHECK_EQ(fs::file_size(f.target()), 10);
}

TEST_CASE("hold count bound") {
    std::string content(1000, 'x');

    for (std::size_t i = 0; i < content.size(); i++)
        content[i] = static_cast<char>('a' + i % 26);

    for (std::size_t hold_count: {1, 3, 8}) {
        fixture f {content, 10, hold_count};
        auto r = transfer_state::make_awaiting_metadata(kChannel);

        r = f.receiver.on_message(r, metadata {kChannel, f.fd.hash, f.fd.chunk_count}).state;
        r = f.receiver.on_message(r, export_request {kChannel, f.fd.hash
            , fs::utf8_encode(f.target()), 0}).state;

        auto s = transfer_state::make_transmitting(kChannel, f.fd);
        auto st = f.sender.resume(s);
        s = st.state;

        std::deque<message> to_receiver(st.outbound.begin(), st.outbound.end());
        auto max_in_flight = f.exchange(s, r, std::move(to_receiver), {});

        CHECK_EQ(max_in_flight, hold_count);
        CHECK(r.status == state_enum::done);
        CHECK(s.status == state_enum::done);
    }
}

TEST_CASE("duplicate and out of range chunks") {
    fixture f {"0123456789", 4, 2};
    auto r = transfer_state::make_awaiting_metadata(kChannel);

    r = f.receiver.on_message(r, metadata {kChannel, f.fd.hash, f.fd.chunk_count}).state;

    auto chunk0 = receive_chunk {kChannel, f.fd.hash, 0, f.sender_store.get_chunk(f.fd.hash, 0)};
    auto t = f.receiver.on_message(r, chunk0);

    REQUIRE_EQ(select<ack>(t.outbound).size(), 1);
    CHECK_EQ(t.state.received.size(), 1);

    // Duplicate is acknowledged again, state unchanged
    auto t2 = f.receiver.on_message(t.state, chunk0);

    REQUIRE_EQ(select<ack>(t2.outbound).size(), 1);
    CHECK_EQ(select<ack>(t2.outbound)[0]->index, 0);
    CHECK(t2.state.received == t.state.received);
    CHECK(t2.state.status == state_enum::receiving_chunks);

    // Out of range index is dropped silently
    auto t3 = f.receiver.on_message(t2.state, receive_chunk {kChannel, f.fd.hash, 3, {'z'}});

    CHECK(t3.outbound.empty());
    CHECK(t3.state.received == t.state.received);
    CHECK_FALSE(f.receiver_store.has_chunk(f.fd.hash, 3));
}

TEST_CASE("partial announcement never completes") {
    fixture f {"0123456789", 4, 2};
    auto r = transfer_state::make_awaiting_metadata(kChannel);

    // One chunk less than the actual count
    r = f.receiver.on_message(r, metadata {kChannel, f.fd.hash, f.fd.chunk_count - 1}).state;
    r = f.receiver.on_message(r, export_request {kChannel, f.fd.hash
        , fs::utf8_encode(f.target()), 0}).state;

    transition t {r, {}};

    for (chunk_index i = 0; i < f.fd.chunk_count; i++) {
        t = f.receiver.on_message(t.state, receive_chunk {kChannel, f.fd.hash, i
            , f.sender_store.get_chunk(f.fd.hash, i)});

        if (t.state.is_terminal())
            break;
    }

    CHECK(t.state.status == state_enum::error);
    CHECK_EQ(t.state.cause, make_error_code(errc::hash_mismatch));
    CHECK_EQ(select<failure>(t.outbound).size(), 1);
    CHECK_FALSE(fs::exists(f.target()));

    // Corrupted content purged
    CHECK_FALSE(f.receiver_store.load_meta(f.fd.hash));
}

TEST_CASE("unexpected message") {
    fixture f {"0123456789", 4, 2};
    auto r = transfer_state::make_awaiting_metadata(kChannel);
    auto t = f.receiver.on_message(r, ack {kChannel, f.fd.hash, 0});

    CHECK(t.state.status == state_enum::error);
    CHECK_EQ(t.state.cause, make_error_code(errc::unexpected_message));
    CHECK_EQ(select<failure>(t.outbound).size(), 1);

    // Terminal state absorbs everything
    auto t2 = f.receiver.on_message(t.state, metadata {kChannel, f.fd.hash, 3});
    CHECK(t2.state.status == state_enum::error);
    CHECK(t2.outbound.empty());
}

TEST_CASE("sender timeouts") {
    fixture f {"0123456789", 4, 2};
    auto st = f.sender.resume(transfer_state::make_transmitting(kChannel, f.fd));

    REQUIRE_EQ(st.state.in_flight.size(), 2);

    // Oldest unacknowledged chunk is retransmitted
    auto t = f.sender.on_timeout(st.state);
    auto chunks = select<receive_chunk>(t.outbound);

    REQUIRE_EQ(chunks.size(), 1);
    CHECK_EQ(chunks[0]->index, 0);
    CHECK_EQ(t.state.in_flight.size(), 2);
    CHECK_EQ(t.state.timeouts, 1);

    t = f.sender.on_timeout(t.state);
    chunks = select<receive_chunk>(t.outbound);
    REQUIRE_EQ(chunks.size(), 1);
    CHECK_EQ(chunks[0]->index, 1);

    // Acknowledged chunk resets the counter
    t = f.sender.on_message(t.state, ack {kChannel, f.fd.hash, 0});
    CHECK_EQ(t.state.timeouts, 0);

    t = f.sender.on_timeout(t.state);
    t = f.sender.on_timeout(t.state);
    CHECK(t.state.status == state_enum::transmitting);

    t = f.sender.on_timeout(t.state);
    CHECK(t.state.status == state_enum::error);
    CHECK_EQ(t.state.cause, make_error_code(errc::timeout));

    // Stored chunks survive timeout
    CHECK(f.sender_store.has_chunk(f.fd.hash, 0));
}

TEST_CASE("receiver timeout reports missing chunks") {
    fixture f {"0123456789", 4, 2};
    auto r = transfer_state::make_awaiting_metadata(kChannel);

    r = f.receiver.on_message(r, metadata {kChannel, f.fd.hash, f.fd.chunk_count}).state;
    r = f.receiver.on_message(r, receive_chunk {kChannel, f.fd.hash, 1
        , f.sender_store.get_chunk(f.fd.hash, 1)}).state;

    auto t = f.receiver.on_timeout(r);
    auto naks = select<nak>(t.outbound);

    REQUIRE_EQ(naks.size(), 1);
    REQUIRE_EQ(naks[0]->ranges.size(), 2);
    CHECK_EQ(naks[0]->ranges[0], (chunk_range{0, 1}));
    CHECK_EQ(naks[0]->ranges[1], (chunk_range{2, 3}));

    // Sender retransmits requested chunks
    auto s = transfer_state::make_transmitting(kChannel, f.fd);
    s = f.sender.resume(s).state;
    s = f.sender.on_message(s, ack {kChannel, f.fd.hash, 0}).state;
    s = f.sender.on_message(s, ack {kChannel, f.fd.hash, 1}).state;
    s = f.sender.on_message(s, ack {kChannel, f.fd.hash, 2}).state;

    CHECK(s.in_flight.empty());

    auto st = f.sender.on_message(s, *naks[0]);
    auto chunks = select<receive_chunk>(st.outbound);

    REQUIRE_EQ(chunks.size(), 2);
    CHECK_EQ(chunks[0]->index, 0);
    CHECK_EQ(chunks[1]->index, 2);
}

TEST_CASE("import request") {
    fixture f {"0123456789", 4, 2};
    auto r = transfer_state::make_awaiting_metadata(kChannel);
    auto t = f.sender.on_message(r, import_request {kChannel
        , fs::utf8_encode(f.dir / "source.txt")});

    CHECK(t.state.status == state_enum::transmitting);
    REQUIRE_EQ(select<success_transmit>(t.outbound).size(), 1);

    auto reply = select<success_transmit>(t.outbound)[0];

    CHECK_EQ(reply->file_name, "source.txt");
    CHECK_EQ(reply->hash, f.fd.hash);
    CHECK_EQ(reply->num_chunks, 3);
    CHECK_EQ(select<receive_chunk>(t.outbound).size(), 2);

    // Absent source
    auto t2 = f.sender.on_message(r, import_request {kChannel
        , fs::utf8_encode(f.dir / "absent.txt")});

    CHECK(t2.state.status == state_enum::error);
    CHECK_EQ(t2.state.cause, make_error_code(errc::io_error));
    CHECK_EQ(select<failure>(t2.outbound).size(), 1);
}

TEST_CASE("download flow") {
    fixture f {"0123456789", 4, 2};

    auto s = f.sender.on_message(transfer_state::make_awaiting_metadata(kChannel)
        , import_request {kChannel, fs::utf8_encode(f.dir / "source.txt")});
    auto r = transfer_state::make_start_receive(kChannel, f.target());

    std::deque<message> to_receiver(s.outbound.begin(), s.outbound.end());
    f.exchange(s.state, r, std::move(to_receiver), {});

    CHECK(r.status == state_enum::done);
    CHECK(s.state.status == state_enum::done);
    CHECK_EQ(tools::read_file(f.target()), tools::read_file(f.dir / "source.txt"));
}

TEST_CASE("cleanup") {
    fixture f {"0123456789", 4, 2};
    auto r = transfer_state::make_awaiting_metadata(kChannel);

    r = f.receiver.on_message(r, metadata {kChannel, f.fd.hash, f.fd.chunk_count}).state;
    r = f.receiver.on_message(r, receive_chunk {kChannel, f.fd.hash, 0
        , f.sender_store.get_chunk(f.fd.hash, 0)}).state;

    REQUIRE(fs::exists(f.receiver_store.content_dir(f.fd.hash)));

    auto t = f.receiver.on_message(r, cleanup_request {kChannel, f.fd.hash});

    CHECK(t.state.status == state_enum::done);
    CHECK_FALSE(fs::exists(f.receiver_store.content_dir(f.fd.hash)));

    // Cleanup without hash on fresh responder purges whole storage
    auto t2 = f.sender.on_message(transfer_state::make_awaiting_metadata(kChannel)
        , cleanup_request {kChannel, pfs::nullopt});

    CHECK(t2.state.status == state_enum::done);
    CHECK_FALSE(fs::exists(f.sender_store.root()));
}

TEST_CASE("failure reported by peer") {
    fixture f {"0123456789", 4, 2};
    auto s = f.sender.resume(transfer_state::make_transmitting(kChannel, f.fd)).state;
    auto t = f.sender.on_message(s, failure {kChannel
        , static_cast<std::uint16_t>(errc::hash_mismatch), "mismatch"});

    CHECK(t.state.status == state_enum::error);
    CHECK_EQ(t.state.cause, make_error_code(errc::hash_mismatch));
    CHECK(t.outbound.empty());
}

TEST_CASE("stale chunks split by another chunk size") {
    // Both splittings give three chunks: 5 + 5 + 2 and 4 + 4 + 4
    fixture f {"0123456789AB", 4, 2};

    REQUIRE(f.receiver_store.initialize_file(f.dir / "source.txt", 5, 10));
    REQUIRE(fs::remove(f.receiver_store.content_dir(f.fd.hash) / "2"));

    auto r = transfer_state::make_awaiting_metadata(kChannel);

    r = f.receiver.on_message(r, metadata {kChannel, f.fd.hash, f.fd.chunk_count}).state;

    CHECK(r.reused);
    CHECK_EQ(r.received, (std::set<chunk_index>{0, 1}));

    r = f.receiver.on_message(r, export_request {kChannel, f.fd.hash
        , fs::utf8_encode(f.target()), 0}).state;

    REQUIRE(r.status == state_enum::receiving_chunks);

    // Last chunk completes the set, but stale chunks have other boundaries
    auto t = f.receiver.on_message(r, receive_chunk {kChannel, f.fd.hash, 2
        , f.sender_store.get_chunk(f.fd.hash, 2)});

    CHECK(t.state.status == state_enum::receiving_chunks);
    CHECK_FALSE(t.state.reused);
    CHECK(t.state.received.empty());
    CHECK_FALSE(fs::exists(f.target()));
    CHECK(f.receiver_store.stored_chunks(f.fd.hash, 3).empty());

    // Whole content is requested again
    auto naks = select<nak>(t.outbound);

    REQUIRE_EQ(naks.size(), 1);
    REQUIRE_EQ(naks[0]->ranges.size(), 1);
    CHECK_EQ(naks[0]->ranges[0], (chunk_range{0, 3}));

    r = t.state;

    auto st = f.sender.resume(transfer_state::make_transmitting(kChannel, f.fd));
    auto s = st.state;

    std::deque<message> to_receiver(st.outbound.begin(), st.outbound.end());
    f.exchange(s, r, std::move(to_receiver), {});

    CHECK(r.status == state_enum::done);
    CHECK(s.status == state_enum::done);
    CHECK_EQ(tools::read_file(f.target()), tools::read_file(f.dir / "source.txt"));
}

TEST_CASE("stale chunks with another chunk count") {
    fixture f {"0123456789", 4, 2};

    // 3 + 3 + 3 + 1
    REQUIRE(f.receiver_store.initialize_file(f.dir / "source.txt", 3, 6));

    auto r = transfer_state::make_awaiting_metadata(kChannel);

    r = f.receiver.on_message(r, metadata {kChannel, f.fd.hash, f.fd.chunk_count}).state;

    CHECK(r.status == state_enum::receiving_chunks);
    CHECK_FALSE(r.reused);
    CHECK(r.received.empty());
    CHECK(f.receiver_store.stored_chunks(f.fd.hash, 4).empty());

    auto meta = f.receiver_store.load_meta(f.fd.hash);

    REQUIRE(meta);
    CHECK_EQ(meta->chunk_count, 3);

    r = f.receiver.on_message(r, export_request {kChannel, f.fd.hash
        , fs::utf8_encode(f.target()), 0}).state;

    auto st = f.sender.resume(transfer_state::make_transmitting(kChannel, f.fd));
    auto s = st.state;

    std::deque<message> to_receiver(st.outbound.begin(), st.outbound.end());
    f.exchange(s, r, std::move(to_receiver), {});

    CHECK(r.status == state_enum::done);
    CHECK_EQ(tools::read_file(f.target()), tools::read_file(f.dir / "source.txt"));
}

TEST_CASE("repeated import request") {
    fixture f {"0123456789", 4, 2};
    auto t = f.sender.on_message(transfer_state::make_awaiting_metadata(kChannel)
        , import_request {kChannel, fs::utf8_encode(f.dir / "source.txt")});

    REQUIRE(t.state.status == state_enum::transmitting);

    // Initiator did not receive the reply
    auto t2 = f.sender.on_message(t.state, import_request {kChannel
        , fs::utf8_encode(f.dir / "source.txt")});

    CHECK(t2.state.status == state_enum::transmitting);
    REQUIRE_EQ(t2.outbound.size(), 1);
    REQUIRE_EQ(select<success_transmit>(t2.outbound).size(), 1);
    CHECK_EQ(select<success_transmit>(t2.outbound)[0]->hash, f.fd.hash);
    CHECK(select<success_transmit>(t2.outbound)[0]->last);
}

TEST_CASE("empty content reply repeated on timeout") {
    fixture f {"", 4, 2};

    REQUIRE_EQ(f.fd.chunk_count, 0);

    auto t = f.sender.on_message(transfer_state::make_awaiting_metadata(kChannel)
        , import_request {kChannel, fs::utf8_encode(f.dir / "source.txt")});

    REQUIRE(t.state.status == state_enum::transmitting);
    CHECK(select<receive_chunk>(t.outbound).empty());

    t = f.sender.on_timeout(t.state);

    CHECK(t.state.status == state_enum::transmitting);
    CHECK_EQ(select<success_transmit>(t.outbound).size(), 1);
}

TEST_CASE("all chunks acknowledged without confirmation") {
    fixture f {"0123456789", 4, 2};
    auto s = f.sender.resume(transfer_state::make_transmitting(kChannel, f.fd)).state;

    for (chunk_index i = 0; i < f.fd.chunk_count; i++)
        s = f.sender.on_message(s, ack {kChannel, f.fd.hash, i}).state;

    REQUIRE(s.all_acknowledged());

    // Last chunk is repeated to get `success_receive` again
    auto t = f.sender.on_timeout(s);
    auto chunks = select<receive_chunk>(t.outbound);

    REQUIRE_EQ(chunks.size(), 1);
    CHECK_EQ(chunks[0]->index, 2);
    CHECK_EQ(t.state.timeouts, 1);

    t = f.sender.on_timeout(t.state);
    CHECK_EQ(t.state.timeouts, 2);

    // Duplicate acknowledgement is not a progress
    t = f.sender.on_message(t.state, ack {kChannel, f.fd.hash, 0});
    CHECK_EQ(t.state.timeouts, 2);

    t = f.sender.on_timeout(t.state);
    CHECK(t.state.status == state_enum::error);
    CHECK_EQ(t.state.cause, make_error_code(errc::timeout));

    // Confirmation finishes the transmission
    t = f.sender.on_message(s, success_receive {kChannel});
    CHECK(t.state.status == state_enum::done);
}

TEST_CASE("multi-file transmit reply rejected") {
    fixture f {"0123456789", 4, 2};
    auto r = transfer_state::make_start_receive(kChannel, f.target());
    auto t = f.receiver.on_message(r, success_transmit {kChannel, "source.txt", f.fd.hash
        , f.fd.chunk_count, 0644, false});

    CHECK(t.state.status == state_enum::error);
    CHECK_EQ(t.state.cause, make_error_code(errc::invalid_argument));
    CHECK_EQ(select<failure>(t.outbound).size(), 1);
}
