#include <gtest/gtest.h>
#include "dfm/events/event_bus.hpp"
#include "dfm/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace dfm::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::string received_path;

    bus.subscribe<DuplicateSkippedEvent>([&](const DuplicateSkippedEvent& e) {
        handler_called = true;
        received_path = e.path;
    });

    bus.emit(DuplicateSkippedEvent{"/mirror/a.bin"});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_path, "/mirror/a.bin");
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int started = 0;
    int failed = 0;

    bus.subscribe<DownloadStartedEvent>([&](const DownloadStartedEvent&) { started++; });
    bus.subscribe<DownloadFailedEvent>([&](const DownloadFailedEvent&) { failed++; });

    bus.emit(DownloadStartedEvent{"a.bin", "/m/a.bin", 10, 1});
    bus.emit(DownloadFailedEvent{"a.bin", "/m/a.bin", "boom"});
    bus.emit(DownloadStartedEvent{"b.bin", "/m/b.bin", 20, 2});

    EXPECT_EQ(started, 2);
    EXPECT_EQ(failed, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<EmptyDirectoryEvent>([&](const EmptyDirectoryEvent&) { count++; });

    bus.emit(EmptyDirectoryEvent{"d"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<EmptyDirectoryEvent>(id);

    bus.emit(EmptyDirectoryEvent{"d"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(EmptyDirectoryEvent{"d"}));
}

TEST(EventBus, HandlerExceptionDoesNotStopOthers) {
    EventBus bus;
    int reached = 0;

    bus.subscribe<EmptyDirectoryEvent>([](const EmptyDirectoryEvent&) {
        throw std::runtime_error("handler failure");
    });
    bus.subscribe<EmptyDirectoryEvent>([&](const EmptyDirectoryEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(EmptyDirectoryEvent{"d"}));
    EXPECT_EQ(reached, 1);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<TransferProgressEvent>([&bytes](const TransferProgressEvent& e) {
        bytes += e.bytes_written;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(TransferProgressEvent{"p", 0, 9, 10});
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes.load(), 500u);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<ResumeHintEvent>(), 0u);
    auto id = bus.subscribe<ResumeHintEvent>([](const ResumeHintEvent&) {});
    bus.subscribe<ResumeHintEvent>([](const ResumeHintEvent&) {});
    EXPECT_EQ(bus.subscriber_count<ResumeHintEvent>(), 2u);

    bus.unsubscribe<ResumeHintEvent>(id);
    EXPECT_EQ(bus.subscriber_count<ResumeHintEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<ResumeHintEvent>(), 0u);
}

TEST(SubscriptionSet, UnsubscribesOnDestruction) {
    EventBus bus;
    int count = 0;
    {
        SubscriptionSet subscriptions(bus);
        subscriptions.add<InvalidItemEvent>([&](const InvalidItemEvent&) { count++; });
        bus.emit(InvalidItemEvent{"l", "d/l", "link"});
        EXPECT_EQ(bus.subscriber_count<InvalidItemEvent>(), 1u);
    }
    bus.emit(InvalidItemEvent{"l", "d/l", "link"});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<InvalidItemEvent>(), 0u);
}
