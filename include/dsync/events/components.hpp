/**
 * @file components.hpp
 * @brief Listeners that turn job events into log lines and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * orchestrator.run(job);   // both react to the events it emits
 * metrics.print_stats();
 */

#pragma once

#include "dsync/events/event_bus.hpp"
#include "dsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace dsync::events {

/**
 * @brief Logs every job event with spdlog
 *
 * Upload progress is logged at debug level only; the console renderer
 * handles user-facing progress.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe<JobStartedEvent>([](const JobStartedEvent& e) {
            spdlog::info("[JobStarted] job={} local={} remote={} format={}",
                         e.job_id, e.local_root, e.remote_root, e.format);
        });

        bus.subscribe<StageEnteredEvent>([](const StageEnteredEvent& e) {
            spdlog::info("[Stage] job={} {} -> {}", e.job_id, to_string(e.previous), to_string(e.stage));
        });

        bus.subscribe<RetryScheduledEvent>([](const RetryScheduledEvent& e) {
            spdlog::warn("[Retry] job={} {} attempt {}/{} failed ({}); retrying in {}ms",
                         e.job_id, e.operation, e.failed_attempt, e.max_attempts,
                         e.error.describe(), e.delay.count());
        });

        bus.subscribe<UploadProgressEvent>([](const UploadProgressEvent& e) {
            spdlog::debug("[Upload] job={} {}/{} bytes", e.job_id, e.progress.bytes_sent, e.progress.total_bytes);
        });

        bus.subscribe<JobCompletedEvent>([](const JobCompletedEvent& e) {
            spdlog::info("[JobCompleted] job={} bytes={} duration={}ms{}",
                         e.job_id, e.bytes_transferred, e.duration.count(),
                         e.verified ? "" : " (unverified)");
        });

        bus.subscribe<JobFailedEvent>([](const JobFailedEvent& e) {
            spdlog::error("[JobFailed] job={} stage={} error={} duration={}ms",
                          e.job_id, to_string(e.stage), e.error.describe(), e.duration.count());
        });
    }
};

/**
 * @brief Counts jobs, stages, retries and uploaded bytes
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> jobs_started{0};
        std::atomic<std::uint64_t> jobs_succeeded{0};
        std::atomic<std::uint64_t> jobs_failed{0};
        std::atomic<std::uint64_t> stages_entered{0};
        std::atomic<std::uint64_t> retries{0};
        std::atomic<std::uint64_t> chunks_uploaded{0};
        std::atomic<std::uint64_t> bytes_uploaded{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        bus.subscribe<JobStartedEvent>([this](const JobStartedEvent&) { stats_.jobs_started++; });
        bus.subscribe<StageEnteredEvent>([this](const StageEnteredEvent&) { stats_.stages_entered++; });
        bus.subscribe<RetryScheduledEvent>([this](const RetryScheduledEvent&) { stats_.retries++; });
        bus.subscribe<UploadProgressEvent>([this](const UploadProgressEvent&) { stats_.chunks_uploaded++; });
        bus.subscribe<JobCompletedEvent>([this](const JobCompletedEvent& e) {
            stats_.jobs_succeeded++;
            stats_.bytes_uploaded += e.bytes_transferred;
        });
        bus.subscribe<JobFailedEvent>([this](const JobFailedEvent&) { stats_.jobs_failed++; });
    }

    const Stats& get_stats() const { return stats_; }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Jobs started:    {}", stats_.jobs_started.load());
        spdlog::info("  Jobs succeeded:  {}", stats_.jobs_succeeded.load());
        spdlog::info("  Jobs failed:     {}", stats_.jobs_failed.load());
        spdlog::info("  Stages entered:  {}", stats_.stages_entered.load());
        spdlog::info("  Retries:         {}", stats_.retries.load());
        spdlog::info("  Chunks uploaded: {}", stats_.chunks_uploaded.load());
        spdlog::info("  Bytes uploaded:  {}", stats_.bytes_uploaded.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
};

} // namespace dsync::events
