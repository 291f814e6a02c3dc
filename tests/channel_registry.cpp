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
#include <pfs/xfer/channel_registry.hpp>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using xfer::channel_id;
using xfer::channel_registry;
using xfer::transfer_state;

TEST_CASE("generate registers channel") {
    channel_registry registry;

    auto ch = registry.generate_channel();

    CHECK_NE(ch, 0);
    CHECK_EQ(registry.size(), 1);

    auto state = registry.lookup(ch);

    REQUIRE(state);
    CHECK(state->status == xfer::state_enum::awaiting_metadata);
    CHECK_EQ(state->channel, ch);

    CHECK(registry.release(ch));
    CHECK_FALSE(registry.release(ch));
    CHECK_FALSE(registry.lookup(ch));
    CHECK_EQ(registry.size(), 0);
}

TEST_CASE("bind and update") {
    channel_registry registry;

    CHECK(registry.bind(10, transfer_state::make_awaiting_metadata(10)));
    CHECK_FALSE(registry.bind(10, transfer_state::make_awaiting_metadata(10)));

    registry.update(10, transfer_state::make_start_receive(10, "target"));

    auto state = registry.lookup(10);

    REQUIRE(state);
    CHECK(state->status == xfer::state_enum::start_receive);
    CHECK(state->hash.empty());

    xfer::file_descriptor fd;
    fd.hash = std::string(64, 'a');
    fd.chunk_count = 3;

    registry.update(10, transfer_state::make_transmitting(10, fd));
    state = registry.lookup(10);

    REQUIRE(state);
    CHECK(state->status == xfer::state_enum::transmitting);
    CHECK(state->role == xfer::role_enum::sender);
    CHECK_EQ(state->hash, fd.hash);
}

TEST_CASE("unique under concurrent allocation") {
    static constexpr int kThreads = 8;
    static constexpr int kPerThread = 1000;

    channel_registry registry;
    std::mutex mtx;
    std::set<channel_id> ids;
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; i++) {
        threads.emplace_back([& registry, & mtx, & ids] {
            std::vector<channel_id> local;

            for (int j = 0; j < kPerThread; j++)
                local.push_back(registry.generate_channel());

            std::lock_guard<std::mutex> locker{mtx};
            ids.insert(local.begin(), local.end());
        });
    }

    for (auto & t: threads)
        t.join();

    CHECK_EQ(ids.size(), kThreads * kPerThread);
    CHECK_EQ(registry.size(), kThreads * kPerThread);
    CHECK(ids.find(0) == ids.end());
}
