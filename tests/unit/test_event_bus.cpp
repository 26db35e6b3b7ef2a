#include <gtest/gtest.h>
#include "lanbeam/core/event_bus.hpp"
#include <map>
#include <stdexcept>

using namespace lanbeam::core;

class EventBusTest : public ::testing::Test {
protected:
    EventBus bus;
};

TEST_F(EventBusTest, PublishReachesEverySubscriber) {
    int first = 0;
    int second = 0;
    bus.subscribe([&](const Event&) { ++first; });
    bus.subscribe([&](const Event&) { ++second; });

    bus.publish(OfferResolvedEvent{"id", "10.0.0.2:53318", OfferOutcome::REJECTED, "declined"});

    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
    EXPECT_EQ(bus.subscriber_count(), 2u);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
    int calls = 0;
    auto id = bus.subscribe([&](const Event&) { ++calls; });

    EXPECT_TRUE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(id));

    bus.publish(SessionCompletedEvent{"id", lanbeam::transfer::TransferRole::SENDER, 1});
    EXPECT_EQ(calls, 0);
}

TEST_F(EventBusTest, ThrowingHandlerDoesNotStopOthers) {
    int calls = 0;
    bus.subscribe([](const Event&) { throw std::runtime_error("boom"); });
    bus.subscribe([&](const Event&) { ++calls; });

    bus.publish(SessionCompletedEvent{"id", lanbeam::transfer::TransferRole::RECEIVER, 2});
    EXPECT_EQ(calls, 1);
}

TEST_F(EventBusTest, HandlerMayUnsubscribeItself) {
    int calls = 0;
    EventBus::SubscriptionId id = 0;
    id = bus.subscribe([&](const Event&) {
        ++calls;
        bus.unsubscribe(id);
    });

    bus.publish(SessionCompletedEvent{"a", lanbeam::transfer::TransferRole::SENDER, 0});
    bus.publish(SessionCompletedEvent{"b", lanbeam::transfer::TransferRole::SENDER, 0});
    EXPECT_EQ(calls, 1);
}

TEST(EventFieldsTest, NamesAndFlattenedFields) {
    FileOfferEvent offer;
    offer.offer_id = "abc";
    offer.from = "10.0.0.2:53318";
    offer.sender_name = "bob";
    offer.files = {{"a.txt", 3}, {"b.bin", 5}};
    offer.total_size = 8;

    Event event = offer;
    EXPECT_STREQ(event_name(event), "file-offer");

    auto fields = event_fields(event);
    std::map<std::string, std::string> map(fields.begin(), fields.end());
    EXPECT_EQ(map["id"], "abc");
    EXPECT_EQ(map["file.count"], "2");
    EXPECT_EQ(map["file.1.name"], "b.bin");
    EXPECT_EQ(map["file.1.size"], "5");
    EXPECT_EQ(map["total_size"], "8");
}

TEST(EventFieldsTest, ProgressCarriesOnlyTheSideSpecificName) {
    TransferProgressEvent sender{"id", std::string("/home/a/report.pdf"), std::nullopt, 40};
    auto fields = event_fields(Event{sender});
    std::map<std::string, std::string> map(fields.begin(), fields.end());

    EXPECT_STREQ(event_name(Event{sender}), "transfer-progress");
    EXPECT_EQ(map["file_path"], "/home/a/report.pdf");
    EXPECT_EQ(map.count("file_name"), 0u);
    EXPECT_EQ(map["progress"], "40");
}

TEST(EventFieldsTest, PeersUpdatedListsEveryPeer) {
    lanbeam::network::Peer bob{"10.0.0.2:53318", "bob", {}};
    lanbeam::network::Peer carol{"10.0.0.3:53318", "carol", {}};
    PeersUpdatedEvent updated{lanbeam::network::PeerChange::ADDED, carol, {bob, carol}};

    auto fields = event_fields(Event{updated});
    std::map<std::string, std::string> map(fields.begin(), fields.end());

    EXPECT_STREQ(event_name(Event{updated}), "peers_updated");
    EXPECT_EQ(map["change"], "added");
    EXPECT_EQ(map["peer.count"], "2");
    EXPECT_EQ(map["peer.0.username"], "bob");
    EXPECT_EQ(map["peer.1.address"], "10.0.0.3:53318");
}
