// Hydromat - EventBus Tests

#include <gtest/gtest.h>

#include <stdexcept>

#include "core/events/event_bus.h"
#include "core/events/event_types.h"

TEST(EventBus, SubscribeAndReceive_SingleSubscriber) {
    hm::EventBus bus;
    int callCount = 0;
    int64_t receivedId = 0;
    std::string receivedCode;

    auto sub = bus.subscribe<hm::ToolCreated>([&](const hm::ToolCreated& event) {
        callCount++;
        receivedId = event.toolId;
        receivedCode = event.code;
    });

    bus.publish(hm::ToolCreated{42, 7, "211003"});

    EXPECT_EQ(callCount, 1);
    EXPECT_EQ(receivedId, 42);
    EXPECT_EQ(receivedCode, "211003");
}

TEST(EventBus, SubscribeAndReceive_MultipleSubscribers) {
    hm::EventBus bus;
    int callCount1 = 0;
    int callCount2 = 0;

    auto sub1 = bus.subscribe<hm::ProfileDeleted>(
        [&](const hm::ProfileDeleted& /*event*/) { callCount1++; });
    auto sub2 = bus.subscribe<hm::ProfileDeleted>(
        [&](const hm::ProfileDeleted& /*event*/) { callCount2++; });

    bus.publish(hm::ProfileDeleted{3});

    EXPECT_EQ(callCount1, 1);
    EXPECT_EQ(callCount2, 1);
    EXPECT_EQ(bus.subscriberCount<hm::ProfileDeleted>(), 2u);
}

TEST(EventBus, DifferentEventTypes_AreIndependent) {
    hm::EventBus bus;
    int assigned = 0;
    int cleared = 0;

    auto sub1 = bus.subscribe<hm::ToolAssigned>([&](const hm::ToolAssigned& /*event*/) {
        assigned++;
    });
    auto sub2 = bus.subscribe<hm::AssignmentCleared>(
        [&](const hm::AssignmentCleared& /*event*/) { cleared++; });

    bus.publish(hm::ToolAssigned{1, 3, 10, false, {}});

    EXPECT_EQ(assigned, 1);
    EXPECT_EQ(cleared, 0);
}

TEST(EventBus, Publish_NoSubscribers) {
    hm::EventBus bus;
    bus.publish(hm::AccessModeChanged{true});
    EXPECT_EQ(bus.subscriberCount<hm::AccessModeChanged>(), 0u);
}

TEST(EventBus, DroppedToken_Unsubscribes) {
    hm::EventBus bus;
    int callCount = 0;

    {
        auto sub = bus.subscribe<hm::CurrentProfileChanged>(
            [&](const hm::CurrentProfileChanged& /*event*/) { callCount++; });
        bus.publish(hm::CurrentProfileChanged{1});
    }

    bus.publish(hm::CurrentProfileChanged{2});
    EXPECT_EQ(callCount, 1);
    EXPECT_EQ(bus.subscriberCount<hm::CurrentProfileChanged>(), 0u);
}

TEST(EventBus, HandlerException_OthersStillRun) {
    hm::EventBus bus;
    int callCount = 0;

    auto sub1 = bus.subscribe<hm::ToolDeleted>(
        [](const hm::ToolDeleted& /*event*/) { throw std::runtime_error("handler failed"); });
    auto sub2 =
        bus.subscribe<hm::ToolDeleted>([&](const hm::ToolDeleted& /*event*/) { callCount++; });

    EXPECT_NO_THROW(bus.publish(hm::ToolDeleted{1, 1, "100011"}));
    EXPECT_EQ(callCount, 1);
}

TEST(EventBus, UnsubscribeDuringDispatch) {
    hm::EventBus bus;
    int callCount = 0;
    hm::EventBus::SubscriptionId sub2;

    auto sub1 = bus.subscribe<hm::ToolUpdated>([&](const hm::ToolUpdated& /*event*/) {
        callCount++;
        sub2.reset();
    });
    sub2 = bus.subscribe<hm::ToolUpdated>([&](const hm::ToolUpdated& /*event*/) { callCount++; });

    // Both were locked before dispatch started
    bus.publish(hm::ToolUpdated{1, 1, "100011", false});
    EXPECT_EQ(callCount, 2);

    bus.publish(hm::ToolUpdated{1, 1, "100011", false});
    EXPECT_EQ(callCount, 3);
}

TEST(EventBus, SubscribeDuringDispatch) {
    hm::EventBus bus;
    int inner = 0;
    hm::EventBus::SubscriptionId late;

    auto sub = bus.subscribe<hm::ProfileCreated>([&](const hm::ProfileCreated& /*event*/) {
        if (!late) {
            late = bus.subscribe<hm::ProfileCreated>(
                [&](const hm::ProfileCreated& /*event*/) { inner++; });
        }
    });

    bus.publish(hm::ProfileCreated{1, "A"});
    EXPECT_EQ(inner, 0);
    bus.publish(hm::ProfileCreated{2, "B"});
    EXPECT_EQ(inner, 1);
}
