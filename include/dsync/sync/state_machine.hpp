#pragma once

#include "dsync/core/result.hpp"
#include "dsync/sync/types.hpp"

#include <chrono>
#include <vector>

namespace dsync::sync {

/**
 * @brief Orchestrator stages with an explicit transition table
 *
 * Forward path:
 *   Idle -> Packing -> Connecting -> [DeletingRemote] -> Uploading
 *        -> [VerifyingRemote] -> Unpacking -> [VerifyingExtracted]
 *        -> CleaningUp -> Done | Failed
 *
 * Every non-terminal stage may jump to CleaningUp (failure or
 * cancellation) and to Failed. Done and Failed are final.
 */
class StateMachine {
public:
    StateMachine();

    [[nodiscard]] Stage current() const noexcept { return current_; }

    /// Stages entered so far, starting with Idle
    [[nodiscard]] const std::vector<Stage>& history() const noexcept { return history_; }

    [[nodiscard]] bool can_transition(Stage target) const noexcept;

    dsync::Result<void> transition_to(Stage next);

    [[nodiscard]] std::chrono::steady_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

    /// The table itself, independent of any instance
    [[nodiscard]] static bool is_allowed(Stage from, Stage to) noexcept;

private:
    Stage current_ = Stage::Idle;
    std::vector<Stage> history_;
    std::chrono::steady_clock::time_point last_transition_{};
};

} // namespace dsync::sync
