#pragma once

#include "dsync/archive/archiver.hpp"
#include "dsync/core/cancellation.hpp"
#include "dsync/events/event_bus.hpp"
#include "dsync/net/transport.hpp"
#include "dsync/sync/job.hpp"
#include "dsync/sync/retry.hpp"
#include "dsync/sync/types.hpp"

#include <atomic>
#include <filesystem>

namespace dsync::sync {

/**
 * @brief Runs one SyncJob through the stage state machine
 *
 * Pack, connect, optionally clear the remote root, upload, verify, extract
 * and clean up. Connection establishment and upload are retried on
 * transient errors; everything else fails the job at its current stage.
 * Cleanup runs on every path. Every stage entry is published on the
 * EventBus as a StageEnteredEvent.
 */
class SyncOrchestrator {
public:
    SyncOrchestrator(net::TransportFactory factory, events::EventBus& bus);

    /// Observer for upload progress; invoked on the upload thread
    void set_progress_sink(ProgressSink sink) { progress_sink_ = std::move(sink); }

    /// Replaces the wait between retries (tests pass a recording no-op)
    void set_retry_sleep(RetryPolicy::SleepFn sleep) { retry_sleep_ = std::move(sleep); }

    /// Parent directory for the local archive workspace (system temp dir by default)
    void set_work_root(std::filesystem::path root) { work_root_ = std::move(root); }

    SyncResult run(const SyncJob& job);

    /// Thread-safe; observed between stages, retry attempts and upload chunks
    void cancel() noexcept { cancel_.cancel(); }

    [[nodiscard]] const CancellationToken& cancellation_token() const noexcept { return cancel_; }

    [[nodiscard]] Stage stage() const noexcept { return stage_.load(); }

private:
    class Run;

    net::TransportFactory factory_;
    events::EventBus& bus_;
    ProgressSink progress_sink_;
    RetryPolicy::SleepFn retry_sleep_;
    std::filesystem::path work_root_;
    CancellationToken cancel_;
    std::atomic<Stage> stage_{Stage::Idle};
    archive::Archiver archiver_;
};

} // namespace dsync::sync
