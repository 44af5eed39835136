/**
 * @file events.hpp
 * @brief Events published while a sync job runs
 *
 * NAMING CONVENTION:
 * Events are past-tense or describe a fact: StageEnteredEvent,
 * RetryScheduledEvent, JobCompletedEvent.
 *
 * Every event carries the job id so listeners shared between jobs can
 * tell them apart.
 */

#pragma once

#include "dsync/core/error.hpp"
#include "dsync/core/progress.hpp"
#include "dsync/sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace dsync::events {

using sync::Stage;

/**
 * @brief Emitted once when the orchestrator accepts a job
 *
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct JobStartedEvent {
    std::string job_id;
    std::string local_root;
    std::string remote_root;
    std::string format;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted on every state-machine transition
 *
 * The sequence of `stage` values is the path the job took; tests assert
 * on it.
 */
struct StageEnteredEvent {
    std::string job_id;
    Stage stage = Stage::Idle;
    Stage previous = Stage::Idle;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted before sleeping between attempts of a retried operation
 */
struct RetryScheduledEvent {
    std::string job_id;
    std::string operation;          ///< "connect" or "upload"
    std::uint32_t failed_attempt = 0;
    std::uint32_t max_attempts = 0;
    std::chrono::milliseconds delay{0};
    Error error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief One acknowledged upload chunk
 *
 * Emitted from the upload thread; renderers that do I/O should hand it to
 * a worker (see ProgressMonitor).
 */
struct UploadProgressEvent {
    std::string job_id;
    ProgressEvent progress;
};

struct JobCompletedEvent {
    std::string job_id;
    std::uint64_t bytes_transferred = 0;
    std::chrono::milliseconds duration{0};
    bool verified = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct JobFailedEvent {
    std::string job_id;
    Stage stage = Stage::Failed;
    Error error;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace dsync::events
