#include "dsync/sync/state_machine.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

namespace dsync::sync {
namespace {

const std::unordered_map<Stage, std::vector<Stage>>& forward_transitions() {
    static const std::unordered_map<Stage, std::vector<Stage>> transitions {
        {Stage::Idle, {Stage::Packing}},
        {Stage::Packing, {Stage::Connecting}},
        {Stage::Connecting, {Stage::DeletingRemote, Stage::Uploading}},
        {Stage::DeletingRemote, {Stage::Uploading}},
        {Stage::Uploading, {Stage::VerifyingRemote, Stage::Unpacking}},
        {Stage::VerifyingRemote, {Stage::Unpacking}},
        {Stage::Unpacking, {Stage::VerifyingExtracted, Stage::CleaningUp}},
        {Stage::VerifyingExtracted, {Stage::CleaningUp}},
        {Stage::CleaningUp, {Stage::Done, Stage::Failed}},
    };
    return transitions;
}

} // namespace

const char* to_string(Stage stage) noexcept {
    switch (stage) {
        case Stage::Idle: return "Idle";
        case Stage::Packing: return "Packing";
        case Stage::Connecting: return "Connecting";
        case Stage::DeletingRemote: return "DeletingRemote";
        case Stage::Uploading: return "Uploading";
        case Stage::VerifyingRemote: return "VerifyingRemote";
        case Stage::Unpacking: return "Unpacking";
        case Stage::VerifyingExtracted: return "VerifyingExtracted";
        case Stage::CleaningUp: return "CleaningUp";
        case Stage::Done: return "Done";
        case Stage::Failed: return "Failed";
    }
    return "Unknown";
}

StateMachine::StateMachine()
    : history_{Stage::Idle}, last_transition_(std::chrono::steady_clock::now()) {}

bool StateMachine::is_allowed(Stage from, Stage to) noexcept {
    if (is_terminal(from)) {
        return false;
    }
    if (to == Stage::Failed || to == Stage::CleaningUp) {
        return from != to;
    }

    const auto& table = forward_transitions();
    const auto it = table.find(from);
    if (it == table.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), to) != it->second.end();
}

bool StateMachine::can_transition(Stage target) const noexcept {
    return is_allowed(current_, target);
}

dsync::Result<void> StateMachine::transition_to(Stage next) {
    if (!can_transition(next)) {
        return dsync::Result<void>(dsync::ErrValue<std::string>(
            std::string("Illegal stage transition ") + to_string(current_) + " -> " + to_string(next)));
    }
    current_ = next;
    history_.push_back(next);
    last_transition_ = std::chrono::steady_clock::now();
    return {};
}

} // namespace dsync::sync
