#include "dsync/sync/progress_monitor.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

using dsync::ProgressEvent;
using dsync::events::EventBus;
using dsync::events::UploadProgressEvent;
using dsync::sync::ProgressMonitor;

TEST(ProgressMonitorTest, FormatsPercentAndMegabytes) {
    EXPECT_EQ(ProgressMonitor::format_line(ProgressEvent{524288, 1048576, std::chrono::milliseconds(0)}),
              "Upload progress: 50.0% (0.50/1.00 MB)");
    EXPECT_EQ(ProgressMonitor::format_line(ProgressEvent{3 * 1048576, 3 * 1048576, std::chrono::milliseconds(0)}),
              "Upload progress: 100.0% (3.00/3.00 MB)");
}

TEST(ProgressMonitorTest, EmptyTransferReportsComplete) {
    EXPECT_EQ(ProgressMonitor::format_line(ProgressEvent{0, 0, std::chrono::milliseconds(0)}),
              "Upload progress: 100.0% (0.00/0.00 MB)");
}

TEST(ProgressMonitorTest, RendersEveryEventInOrderOnStop) {
    EventBus bus;
    std::mutex mutex;
    std::vector<std::uint64_t> rendered;

    ProgressMonitor monitor(bus, [&](const ProgressEvent& e) {
        std::lock_guard<std::mutex> lock(mutex);
        rendered.push_back(e.bytes_sent);
    });

    for (std::uint64_t sent = 100; sent <= 1000; sent += 100) {
        bus.emit(UploadProgressEvent{"job", ProgressEvent{sent, 1000, std::chrono::milliseconds(0)}});
    }
    monitor.stop();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(rendered.size(), 10u);
    for (std::size_t i = 0; i < rendered.size(); ++i) {
        EXPECT_EQ(rendered[i], (i + 1) * 100);
    }
}

TEST(ProgressMonitorTest, StopUnsubscribesAndIsIdempotent) {
    EventBus bus;
    int rendered = 0;

    ProgressMonitor monitor(bus, [&](const ProgressEvent&) { ++rendered; });
    EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 1u);

    monitor.stop();
    monitor.stop();
    EXPECT_EQ(bus.subscriber_count<UploadProgressEvent>(), 0u);

    bus.emit(UploadProgressEvent{"job", ProgressEvent{1, 1, std::chrono::milliseconds(0)}});
    EXPECT_EQ(rendered, 0);
}
