#include <gtest/gtest.h>
#include "lanbeam/network/udp_discovery.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

using namespace lanbeam::network;
using lanbeam::core::Settings;
using lanbeam::core::SettingsStore;
using namespace std::chrono_literals;

namespace {

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(20ms);
    }
    return condition();
}

// Registry, settings and discovery of one simulated node. Announcements go
// to 127.0.0.1 so tests never touch the real LAN.
struct Node {
    Node(const std::filesystem::path& dir, const std::string& name, bool broadcasting,
         std::chrono::milliseconds expiry)
        : registry(expiry)
        , settings(dir / (name + ".conf")) {
        EXPECT_TRUE(settings.load());
        auto result = settings.update(Settings{name, broadcasting, "127.0.0.1"});
        EXPECT_TRUE(result) << result.describe();
    }

    void start(std::uint16_t announce_port, std::uint16_t offer_port) {
        DiscoveryOptions options;
        options.listen_port = 0;
        options.announce_port = announce_port;
        options.announce_interval = 50ms;

        discovery = std::make_unique<UdpDiscovery>(registry, settings, options);
        discovery->set_offer_port(offer_port);
        ASSERT_TRUE(discovery->start());
        ASSERT_TRUE(discovery->is_bound());
        ASSERT_NE(discovery->local_port(), 0);
    }

    PeerRegistry registry;
    SettingsStore settings;
    std::unique_ptr<UdpDiscovery> discovery;
};

}

class DiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "lanbeam_discovery_test";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

TEST_F(DiscoveryTest, AnnouncementRegistersSender) {
    Node listener(test_dir, "listener", true, 3000ms);
    listener.start(0, 41001);

    Node announcer(test_dir, "announcer", true, 3000ms);
    announcer.start(listener.discovery->local_port(), 41002);

    ASSERT_TRUE(wait_until([&]() { return listener.registry.size() == 1; }, 2000ms));

    auto peers = listener.registry.snapshot();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].address, "127.0.0.1:41002");
    EXPECT_EQ(peers[0].username, "announcer");

    // The listener announces to its own port and must not list itself.
    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(listener.registry.size(), 1u);
}

TEST_F(DiscoveryTest, RenameIsReportedAsUpdate) {
    std::vector<PeerChange> changes;
    std::mutex changes_mutex;
    Node listener(test_dir, "listener", true, 3000ms);
    listener.registry.set_change_handler([&](PeerChange change, const Peer&, const std::vector<Peer>&) {
        std::lock_guard<std::mutex> lock(changes_mutex);
        changes.push_back(change);
    });
    listener.start(0, 41001);

    Node announcer(test_dir, "before", true, 3000ms);
    announcer.start(listener.discovery->local_port(), 41002);
    ASSERT_TRUE(wait_until([&]() { return listener.registry.size() == 1; }, 2000ms));

    ASSERT_TRUE(announcer.settings.update(Settings{"after", true, "127.0.0.1"}));
    announcer.discovery->announce_now();

    ASSERT_TRUE(wait_until([&]() {
        auto peers = listener.registry.snapshot();
        return peers.size() == 1 && peers[0].username == "after";
    }, 2000ms));

    std::lock_guard<std::mutex> lock(changes_mutex);
    ASSERT_GE(changes.size(), 2u);
    EXPECT_EQ(changes[0], PeerChange::ADDED);
    EXPECT_EQ(changes[1], PeerChange::UPDATED);
}

TEST_F(DiscoveryTest, SilentPeerExpires) {
    Node listener(test_dir, "listener", true, 300ms);
    listener.start(0, 41001);

    {
        Node announcer(test_dir, "announcer", true, 3000ms);
        announcer.start(listener.discovery->local_port(), 41002);
        ASSERT_TRUE(wait_until([&]() { return listener.registry.size() == 1; }, 2000ms));
        announcer.discovery->stop();
    }

    EXPECT_TRUE(wait_until([&]() { return listener.registry.size() == 0; }, 2000ms));
}

TEST_F(DiscoveryTest, DisabledBroadcastingStaysHidden) {
    Node listener(test_dir, "listener", true, 3000ms);
    listener.start(0, 41001);

    Node hidden(test_dir, "hidden", false, 3000ms);
    hidden.start(listener.discovery->local_port(), 41002);
    hidden.discovery->announce_now();

    std::this_thread::sleep_for(400ms);
    EXPECT_EQ(listener.registry.size(), 0u);
}

TEST_F(DiscoveryTest, QueryCollectsReplies) {
    Node responder(test_dir, "responder", true, 3000ms);
    responder.start(0, 41001);

    // Broadcasting off: only the query reply can populate the registry.
    Node seeker(test_dir, "seeker", false, 3000ms);
    seeker.start(responder.discovery->local_port(), 41002);
    seeker.discovery->query_peers();

    ASSERT_TRUE(wait_until([&]() { return seeker.registry.size() == 1; }, 2000ms));
    auto peers = seeker.registry.snapshot();
    EXPECT_EQ(peers[0].address, "127.0.0.1:41001");
    EXPECT_EQ(peers[0].username, "responder");

    // A hidden node answers nobody, so the responder never learns of it.
    EXPECT_EQ(responder.registry.size(), 0u);
}

TEST_F(DiscoveryTest, HiddenNodeIgnoresQueries) {
    Node hidden(test_dir, "hidden", false, 3000ms);
    hidden.start(0, 41001);

    Node seeker(test_dir, "seeker", false, 3000ms);
    seeker.start(hidden.discovery->local_port(), 41002);
    seeker.discovery->query_peers();

    std::this_thread::sleep_for(400ms);
    EXPECT_EQ(seeker.registry.size(), 0u);
}

TEST_F(DiscoveryTest, StartTwiceIsInvalidState) {
    Node node(test_dir, "node", true, 3000ms);
    node.start(0, 41001);

    EXPECT_EQ(node.discovery->start().error, lanbeam::core::ErrorCode::INVALID_STATE);
    node.discovery->stop();
    EXPECT_FALSE(node.discovery->is_running());
}
