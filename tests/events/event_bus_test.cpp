#include <gtest/gtest.h>
#include "ftr/events/event_bus.hpp"
#include "ftr/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ftr::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    std::string removed;
    bus.subscribe<FileRemovedEvent>([&](const FileRemovedEvent& e) {
        removed = e.file_path;
    });

    bus.emit(FileRemovedEvent{"/tmp/a.bin"});

    EXPECT_EQ(removed, "/tmp/a.bin");
}

TEST(EventBus, DispatchesByEventType) {
    EventBus bus;

    int started = 0;
    int failed = 0;

    bus.subscribe<TransferStartedEvent>([&](const TransferStartedEvent&) { started++; });
    bus.subscribe<TransferFailedEvent>([&](const TransferFailedEvent&) { failed++; });

    bus.emit(TransferStartedEvent{"/tmp/a", "http://h/a", "local"});
    bus.emit(TransferFailedEvent{"/tmp/a", "local", ftr::StatusCode::NotFound, "missing"});
    bus.emit(TransferStartedEvent{"/tmp/b", "http://h/b", "dpu:0"});

    EXPECT_EQ(started, 2);
    EXPECT_EQ(failed, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<PutCompletedEvent>([&](const PutCompletedEvent&) { count++; });

    bus.emit(PutCompletedEvent{"/tmp/f", 4, "abcd"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<PutCompletedEvent>(id);

    bus.emit(PutCompletedEvent{"/tmp/f", 4, "abcd"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(FileRemovedEvent{"/tmp/x"}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int reached = 0;

    bus.subscribe<PutFailedEvent>([](const PutFailedEvent&) {
        throw std::runtime_error("observer bug");
    });
    bus.subscribe<PutFailedEvent>([&](const PutFailedEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(PutFailedEvent{"/tmp/f", ftr::StatusCode::DataLoss, "hash mismatch"}));
    EXPECT_EQ(reached, 1);
}

TEST(EventBus, ConcurrentSubscribe) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<DpuConnectionDialedEvent>([&count](const DpuConnectionDialedEvent&) {
                count++;
            });
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    bus.emit(DpuConnectionDialedEvent{"0", "127.0.0.1:50052"});

    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<uint64_t> bytes{0};

    bus.subscribe<PutCompletedEvent>([&bytes](const PutCompletedEvent& e) {
        bytes += e.total_bytes;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(PutCompletedEvent{"/tmp/f", 10, ""});
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes, 1000u);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<FileRemovedEvent>(), 0u);

    auto id = bus.subscribe<FileRemovedEvent>([](const FileRemovedEvent&) {});
    bus.subscribe<FileRemovedEvent>([](const FileRemovedEvent&) {});
    bus.subscribe<ServerStartedEvent>([](const ServerStartedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<FileRemovedEvent>(), 2u);

    bus.unsubscribe<FileRemovedEvent>(id);
    EXPECT_EQ(bus.subscriber_count<FileRemovedEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<FileRemovedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ServerStartedEvent>(), 0u);
}
