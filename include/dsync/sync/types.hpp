#pragma once

#include "dsync/core/error.hpp"
#include "dsync/core/progress.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

namespace dsync::sync {

using ProgressEvent = dsync::ProgressEvent;
using ProgressSink = dsync::ProgressSink;

enum class Stage {
    Idle,
    Packing,
    Connecting,
    DeletingRemote,
    Uploading,
    VerifyingRemote,
    Unpacking,
    VerifyingExtracted,
    CleaningUp,
    Done,
    Failed
};

[[nodiscard]] const char* to_string(Stage stage) noexcept;

[[nodiscard]] inline bool is_terminal(Stage stage) noexcept {
    return stage == Stage::Done || stage == Stage::Failed;
}

/**
 * @brief Outcome of one orchestration
 */
struct SyncResult {
    enum class Status {
        Success,
        Failed
    };

    Status status = Status::Failed;
    std::optional<Stage> failure_stage;   ///< Set when status == Failed
    std::optional<Error> error;           ///< Set when status == Failed
    std::uint64_t bytes_transferred = 0;
    std::chrono::milliseconds duration{0};
    bool verified = false;                ///< False when checksum verification was off

    [[nodiscard]] bool ok() const noexcept { return status == Status::Success; }
};

} // namespace dsync::sync
