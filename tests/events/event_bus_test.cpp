#include <gtest/gtest.h>
#include "chunkup/events/event_bus.hpp"
#include "chunkup/events/events.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace chunkup::events;

TEST(EventBus, DeliversToSubscriber) {
    EventBus bus;

    std::string received_id;
    std::int32_t received_index = -1;
    bus.subscribe<ChunkAppendedEvent>([&](const ChunkAppendedEvent& e) {
        received_id = e.upload_id;
        received_index = e.chunk_index;
    });

    bus.emit(ChunkAppendedEvent{"u-1", 3, 1024, 4, 10, 4096});

    EXPECT_EQ(received_id, "u-1");
    EXPECT_EQ(received_index, 3);
}

TEST(EventBus, RoutesByEventType) {
    EventBus bus;

    int appended = 0;
    int skipped = 0;
    bus.subscribe<ChunkAppendedEvent>([&](const ChunkAppendedEvent&) { appended++; });
    bus.subscribe<ChunkSkippedEvent>([&](const ChunkSkippedEvent&) { skipped++; });

    bus.emit(ChunkAppendedEvent{"u-1", 0, 10, 1, 2, 10});
    bus.emit(ChunkSkippedEvent{"u-1", 0});
    bus.emit(ChunkAppendedEvent{"u-1", 1, 10, 2, 2, 20});

    EXPECT_EQ(appended, 2);
    EXPECT_EQ(skipped, 1);
}

TEST(EventBus, UnsubscribeStopsDelivery) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<UploadCancelledEvent>([&](const UploadCancelledEvent&) { count++; });

    bus.emit(UploadCancelledEvent{"u-1", "alice"});
    bus.unsubscribe<UploadCancelledEvent>(id);
    bus.emit(UploadCancelledEvent{"u-2", "alice"});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<UploadCancelledEvent>(), 0u);
}

TEST(EventBus, EmitWithoutSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(SessionsExpiredEvent{{"a", "b"}}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int delivered = 0;
    bus.subscribe<UploadRejectedEvent>([](const UploadRejectedEvent&) {
        throw std::runtime_error("handler failure");
    });
    bus.subscribe<UploadRejectedEvent>([&](const UploadRejectedEvent&) { delivered++; });

    EXPECT_NO_THROW(bus.emit(UploadRejectedEvent{"u-1", "chunk", chunkup::ErrorCode::Validation, "bad"}));
    EXPECT_EQ(delivered, 1);
}

TEST(EventBus, HandlerMaySubscribeDuringEmit) {
    EventBus bus;

    int late = 0;
    bus.subscribe<ServerStartedEvent>([&](const ServerStartedEvent&) {
        bus.subscribe<ServerShuttingDownEvent>([&](const ServerShuttingDownEvent&) { late++; });
    });

    bus.emit(ServerStartedEvent{8080, "http://node"});
    bus.emit(ServerShuttingDownEvent{"test"});

    EXPECT_EQ(late, 1);
}

TEST(EventBus, ConcurrentSubscribeAndEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> subscribers;
    for (int i = 0; i < 10; ++i) {
        subscribers.emplace_back([&bus, &count]() {
            bus.subscribe<ChunkSkippedEvent>([&count](const ChunkSkippedEvent&) { count++; });
        });
    }
    for (auto& t : subscribers) {
        t.join();
    }

    std::vector<std::thread> emitters;
    for (int i = 0; i < 20; ++i) {
        emitters.emplace_back([&bus, i]() {
            bus.emit(ChunkSkippedEvent{"u", i});
        });
    }
    for (auto& t : emitters) {
        t.join();
    }

    EXPECT_EQ(count, 200);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<UploadInitializedEvent>([](const UploadInitializedEvent&) {});
    bus.subscribe<UploadFinalizedEvent>([](const UploadFinalizedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<UploadInitializedEvent>(), 1u);

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<UploadInitializedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<UploadFinalizedEvent>(), 0u);
}
