#include <gtest/gtest.h>
#include "wfsync/events/event_bus.hpp"
#include "wfsync/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace wfsync::events;
using wfsync::workflow::SyncStatus;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    SyncStatus received = SyncStatus::CONFLICT;

    bus.subscribe<WorkflowStatusChangedEvent>([&](const WorkflowStatusChangedEvent& e) {
        handler_called = true;
        received = e.status;
    });

    bus.emit(WorkflowStatusChangedEvent("Flow.json", std::string("wf-1"), SyncStatus::IN_SYNC));

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received, SyncStatus::IN_SYNC);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int status_count = 0;
    int error_count = 0;

    bus.subscribe<WorkflowStatusChangedEvent>([&](const WorkflowStatusChangedEvent&) { status_count++; });
    bus.subscribe<SyncErrorEvent>([&](const SyncErrorEvent&) { error_count++; });

    bus.emit(WorkflowStatusChangedEvent("a.json", std::nullopt, SyncStatus::EXIST_ONLY_LOCALLY));
    bus.emit(SyncErrorEvent("boom"));
    bus.emit(WorkflowStatusChangedEvent("b.json", std::nullopt, SyncStatus::EXIST_ONLY_LOCALLY));

    EXPECT_EQ(status_count, 2);
    EXPECT_EQ(error_count, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<SyncErrorEvent>([&](const SyncErrorEvent&) { count++; });

    bus.emit(SyncErrorEvent("first"));
    EXPECT_EQ(count, 1);

    bus.unsubscribe<SyncErrorEvent>(id);

    bus.emit(SyncErrorEvent("second"));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, ScopedSubscriptionReleasesOnDestruction) {
    EventBus bus;
    int count = 0;

    {
        auto sub = bus.scoped_subscribe<SyncErrorEvent>([&](const SyncErrorEvent&) { count++; });
        EXPECT_TRUE(sub.active());
        EXPECT_EQ(bus.subscriber_count<SyncErrorEvent>(), 1u);
        bus.emit(SyncErrorEvent("inside"));
    }

    bus.emit(SyncErrorEvent("outside"));
    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<SyncErrorEvent>(), 0u);
}

TEST(EventBus, MovedSubscriptionUnsubscribesOnce) {
    EventBus bus;

    Subscription outer;
    {
        auto inner = bus.scoped_subscribe<SyncErrorEvent>([](const SyncErrorEvent&) {});
        outer = std::move(inner);
        EXPECT_FALSE(inner.active());
    }
    EXPECT_EQ(bus.subscriber_count<SyncErrorEvent>(), 1u);

    outer.reset();
    EXPECT_EQ(bus.subscriber_count<SyncErrorEvent>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopDelivery) {
    EventBus bus;
    int count = 0;

    bus.subscribe<SyncErrorEvent>([](const SyncErrorEvent&) { throw std::runtime_error("handler failure"); });
    bus.subscribe<SyncErrorEvent>([&](const SyncErrorEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(SyncErrorEvent("x")));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, HandlerMayEmitAndSubscribe) {
    EventBus bus;
    int errors = 0;

    bus.subscribe<WorkflowStatusChangedEvent>([&](const WorkflowStatusChangedEvent& e) {
        bus.subscribe<SyncErrorEvent>([&](const SyncErrorEvent&) { errors++; });
        bus.emit(SyncErrorEvent("from " + e.filename));
    });

    bus.emit(WorkflowStatusChangedEvent("a.json", std::nullopt, SyncStatus::CONFLICT));
    EXPECT_EQ(errors, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;

    EXPECT_NO_THROW(bus.emit(SyncErrorEvent("nobody listens")));
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    bus.subscribe<SyncErrorEvent>([&count](const SyncErrorEvent&) { count++; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus]() { bus.emit(SyncErrorEvent("concurrent")); });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 100);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<SyncErrorEvent>([](const SyncErrorEvent&) {});
    bus.subscribe<WorkflowPulledEvent>([](const WorkflowPulledEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<SyncErrorEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<WorkflowPulledEvent>(), 0u);
}
