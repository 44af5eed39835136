#include <gtest/gtest.h>
#include "dsync/events/event_bus.hpp"
#include "dsync/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace dsync::events;
using dsync::sync::Stage;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    Stage received = Stage::Idle;
    std::string job;

    bus.subscribe<StageEnteredEvent>([&](const StageEnteredEvent& e) {
        received = e.stage;
        job = e.job_id;
    });

    bus.emit(StageEnteredEvent{"job-1", Stage::Packing, Stage::Idle});

    EXPECT_EQ(received, Stage::Packing);
    EXPECT_EQ(job, "job-1");
}

TEST(EventBus, DeliversOnlyMatchingType) {
    EventBus bus;

    int stages = 0;
    int failures = 0;

    bus.subscribe<StageEnteredEvent>([&](const StageEnteredEvent&) { stages++; });
    bus.subscribe<JobFailedEvent>([&](const JobFailedEvent&) { failures++; });

    bus.emit(StageEnteredEvent{"j", Stage::Packing, Stage::Idle});
    bus.emit(JobFailedEvent{"j", Stage::Packing, dsync::Error(dsync::ErrorKind::PackError, "x")});
    bus.emit(StageEnteredEvent{"j", Stage::CleaningUp, Stage::Packing});

    EXPECT_EQ(stages, 2);
    EXPECT_EQ(failures, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<JobStartedEvent>([&](const JobStartedEvent&) { count++; });

    bus.emit(JobStartedEvent{"j", "/src", "/srv", "tar.gz"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<JobStartedEvent>(id);

    bus.emit(JobStartedEvent{"j", "/src", "/srv", "tar.gz"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, ScopedSubscriptionUnsubscribesOnDestruction) {
    EventBus bus;
    int count = 0;
    {
        ScopedSubscription<JobStartedEvent> subscription(bus, [&](const JobStartedEvent&) { count++; });
        EXPECT_EQ(bus.subscriber_count<JobStartedEvent>(), 1u);
        bus.emit(JobStartedEvent{});
    }
    EXPECT_EQ(bus.subscriber_count<JobStartedEvent>(), 0u);
    bus.emit(JobStartedEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    int later = 0;

    bus.subscribe<JobStartedEvent>([](const JobStartedEvent&) { throw std::runtime_error("renderer broke"); });
    bus.subscribe<JobStartedEvent>([&](const JobStartedEvent&) { later++; });

    EXPECT_NO_THROW(bus.emit(JobStartedEvent{}));
    EXPECT_EQ(later, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(JobCompletedEvent{}));
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<UploadProgressEvent>([&bytes](const UploadProgressEvent& e) {
        bytes += e.progress.bytes_sent;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(UploadProgressEvent{"j", dsync::ProgressEvent{2, 10, std::chrono::milliseconds(0)}});
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes.load(), 100u);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<RetryScheduledEvent>(), 0u);
    auto id = bus.subscribe<RetryScheduledEvent>([](const RetryScheduledEvent&) {});
    bus.subscribe<RetryScheduledEvent>([](const RetryScheduledEvent&) {});
    bus.subscribe<JobFailedEvent>([](const JobFailedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<RetryScheduledEvent>(), 2u);

    bus.unsubscribe<RetryScheduledEvent>(id);
    EXPECT_EQ(bus.subscriber_count<RetryScheduledEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<RetryScheduledEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<JobFailedEvent>(), 0u);
}
