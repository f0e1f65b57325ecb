#include "chunkyard/events/event_bus.hpp"
#include "chunkyard/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace chunkyard::events;

TEST(EventBus, DeliversChunkStoredToSubscriber) {
    EventBus bus;

    std::string identifier;
    std::uint64_t bytes = 0;
    bus.subscribe<ChunkStoredEvent>([&](const ChunkStoredEvent& e) {
        identifier = e.identifier;
        bytes = e.bytes;
    });

    bus.emit(ChunkStoredEvent{"abc123", 1, 3, 3});

    EXPECT_EQ(identifier, "abc123");
    EXPECT_EQ(bytes, 3u);
}

TEST(EventBus, OnlyMatchingTypeIsDelivered) {
    EventBus bus;

    int stored = 0;
    int completed = 0;
    bus.subscribe<ChunkStoredEvent>([&](const ChunkStoredEvent&) { stored++; });
    bus.subscribe<UploadCompletedEvent>([&](const UploadCompletedEvent&) { completed++; });

    bus.emit(ChunkStoredEvent{"a", 1, 2, 1});
    bus.emit(ChunkStoredEvent{"a", 2, 2, 1});
    bus.emit(UploadCompletedEvent{"a", "/tmp/a", 2});

    EXPECT_EQ(stored, 2);
    EXPECT_EQ(completed, 1);
}

TEST(EventBus, UnsubscribedHandlerStopsReceiving) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<UploadFailedEvent>([&](const UploadFailedEvent&) { count++; });

    bus.emit(UploadFailedEvent{"a", "store", "disk full"});
    bus.unsubscribe<UploadFailedEvent>(id);
    bus.emit(UploadFailedEvent{"a", "store", "disk full"});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<UploadFailedEvent>(), 0u);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;

    EXPECT_NO_THROW(bus.emit(SweepCompletedEvent{}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int reached = 0;
    bus.subscribe<ChunkStoredEvent>([](const ChunkStoredEvent&) {
        throw std::runtime_error("observer failure");
    });
    bus.subscribe<ChunkStoredEvent>([&](const ChunkStoredEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(ChunkStoredEvent{"a", 1, 1, 1}));
    EXPECT_EQ(reached, 1);
}

TEST(EventBus, HandlerMayEmitAnotherEvent) {
    EventBus bus;

    int completions = 0;
    bus.subscribe<UploadCompletedEvent>([&](const UploadCompletedEvent&) { completions++; });
    bus.subscribe<ChunkStoredEvent>([&](const ChunkStoredEvent& e) {
        if (e.chunk_number == e.total_chunks) {
            bus.emit(UploadCompletedEvent{e.identifier, "/x", e.bytes});
        }
    });

    bus.emit(ChunkStoredEvent{"a", 1, 2, 1});
    bus.emit(ChunkStoredEvent{"a", 2, 2, 1});

    EXPECT_EQ(completions, 1);
}

TEST(EventBus, ConcurrentSubscribeAndEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<ChunkStoredEvent>([&count](const ChunkStoredEvent&) { count++; });
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    threads.clear();

    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() { bus.emit(ChunkStoredEvent{"a", 1, 1, 1}); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count.load(), 500);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<ChunkStoredEvent>([](const ChunkStoredEvent&) {});
    bus.subscribe<SweepCompletedEvent>([](const SweepCompletedEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<ChunkStoredEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<SweepCompletedEvent>(), 0u);
}
