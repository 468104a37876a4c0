#include "drop/events/components.hpp"
#include "drop/events/event_bus.hpp"
#include "drop/events/events.hpp"

#include <gtest/gtest.h>

using drop::events::EventBus;
using drop::events::LoggerComponent;

TEST(LoggerComponentTest, SubscribesWhileAliveAndUnsubscribesOnDestruction) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<drop::events::PeerConnectedEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<drop::events::TransferCompletedEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<drop::events::SessionFinishedEvent>(), 1u);

        EXPECT_NO_THROW(bus.emit(drop::events::TransferAbortedEvent{7, drop::Hash{1}, "peer went away"}));
        EXPECT_NO_THROW(bus.emit(drop::events::SessionFinishedEvent{"receive-1", "receive", "failed", "boom"}));
    }

    EXPECT_EQ(bus.subscriber_count<drop::events::PeerConnectedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<drop::events::ChunkServedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<drop::events::SessionStartedEvent>(), 0u);
}
