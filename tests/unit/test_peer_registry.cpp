#include <gtest/gtest.h>
#include "lanbeam/network/peer_registry.hpp"
#include <stdexcept>
#include <thread>

using namespace lanbeam::network;
using namespace std::chrono_literals;

class PeerRegistryTest : public ::testing::Test {
protected:
    struct Change {
        PeerChange change;
        std::string address;
        std::string username;
        std::size_t peer_count;
    };

    void SetUp() override {
        registry.set_change_handler([this](PeerChange change, const Peer& peer, const std::vector<Peer>& peers) {
            changes.push_back({change, peer.address, peer.username, peers.size()});
        });
    }

    PeerRegistry registry{3000ms};
    std::vector<Change> changes;
    PeerRegistry::Clock::time_point t0 = PeerRegistry::Clock::now();
};

TEST_F(PeerRegistryTest, AddRefreshAndRename) {
    EXPECT_EQ(registry.upsert("192.168.1.20:53318", "alice", t0), UpsertResult::ADDED);
    EXPECT_EQ(registry.upsert("192.168.1.20:53318", "alice", t0 + 500ms), UpsertResult::REFRESHED);
    EXPECT_EQ(registry.upsert("192.168.1.20:53318", "alice-pc", t0 + 900ms), UpsertResult::UPDATED);

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].change, PeerChange::ADDED);
    EXPECT_EQ(changes[0].peer_count, 1u);
    EXPECT_EQ(changes[1].change, PeerChange::UPDATED);
    EXPECT_EQ(changes[1].username, "alice-pc");

    auto peers = registry.snapshot();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].username, "alice-pc");
    EXPECT_EQ(peers[0].last_seen, t0 + 900ms);
}

TEST_F(PeerRegistryTest, ExpiresOnlyAfterWindow) {
    registry.upsert("10.0.0.2:53318", "bob", t0);
    registry.upsert("10.0.0.3:53318", "carol", t0 + 2000ms);

    EXPECT_TRUE(registry.remove_expired(t0 + 3000ms).empty());

    auto removed = registry.remove_expired(t0 + 3001ms);
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].address, "10.0.0.2:53318");
    EXPECT_EQ(registry.size(), 1u);

    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[2].change, PeerChange::REMOVED);
    EXPECT_EQ(changes[2].address, "10.0.0.2:53318");
    EXPECT_EQ(changes[2].peer_count, 1u);
}

TEST_F(PeerRegistryTest, RefreshKeepsPeerAlive) {
    registry.upsert("10.0.0.2:53318", "bob", t0);
    registry.upsert("10.0.0.2:53318", "bob", t0 + 2500ms);

    EXPECT_TRUE(registry.remove_expired(t0 + 4000ms).empty());
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(PeerRegistryTest, StaleRefreshDoesNotMoveLastSeenBackwards) {
    registry.upsert("10.0.0.2:53318", "bob", t0 + 1000ms);
    registry.upsert("10.0.0.2:53318", "bob", t0);

    EXPECT_EQ(registry.snapshot()[0].last_seen, t0 + 1000ms);
}

TEST_F(PeerRegistryTest, SnapshotIsOrderedByAddress) {
    registry.upsert("10.0.0.9:53318", "zed", t0);
    registry.upsert("10.0.0.1:53318", "amy", t0);
    registry.upsert("10.0.0.5:53318", "max", t0);

    auto peers = registry.snapshot();
    ASSERT_EQ(peers.size(), 3u);
    EXPECT_EQ(peers[0].address, "10.0.0.1:53318");
    EXPECT_EQ(peers[1].address, "10.0.0.5:53318");
    EXPECT_EQ(peers[2].address, "10.0.0.9:53318");
}

TEST_F(PeerRegistryTest, Resolve) {
    registry.upsert("10.0.0.2:53318", "bob", t0);
    registry.upsert("10.0.0.3:40000", "carol", t0);
    registry.upsert("10.0.0.3:40001", "carol-2", t0);

    EXPECT_EQ(registry.resolve("10.0.0.2:53318")->username, "bob");
    EXPECT_EQ(registry.resolve("10.0.0.2")->address, "10.0.0.2:53318");

    // Two nodes share 10.0.0.3, so the bare IP is ambiguous.
    EXPECT_FALSE(registry.resolve("10.0.0.3").has_value());
    EXPECT_EQ(registry.resolve("10.0.0.3:40001")->username, "carol-2");

    EXPECT_FALSE(registry.resolve("10.0.0.4").has_value());
    EXPECT_FALSE(registry.resolve("10.0.0.2:1").has_value());
}

TEST_F(PeerRegistryTest, ClearDoesNotNotify) {
    registry.upsert("10.0.0.2:53318", "bob", t0);
    changes.clear();

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(changes.empty());
}

TEST_F(PeerRegistryTest, ThrowingHandlerDoesNotBreakRegistry) {
    registry.set_change_handler([](PeerChange, const Peer&, const std::vector<Peer>&) {
        throw std::runtime_error("handler failure");
    });

    EXPECT_EQ(registry.upsert("10.0.0.2:53318", "bob", t0), UpsertResult::ADDED);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(PeerRegistryTest, ConcurrentUpserts) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 50; ++i) {
                registry.upsert("10.0." + std::to_string(t) + "." + std::to_string(i) + ":53318", "peer");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(registry.size(), 200u);
    EXPECT_EQ(changes.size(), 200u);
}
