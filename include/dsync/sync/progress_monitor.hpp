#pragma once

#include "dsync/events/event_bus.hpp"
#include "dsync/events/event_queue.hpp"
#include "dsync/events/events.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace dsync::sync {

/**
 * @brief Renders upload progress on a worker thread
 *
 * Subscribes to UploadProgressEvent and forwards each event through a
 * ThreadSafeQueue, so a slow terminal never stalls the upload. Events are
 * rendered in the order they were emitted.
 */
class ProgressMonitor {
public:
    using Renderer = std::function<void(const ProgressEvent&)>;

    /// Renders to stdout with a carriage-return progress line
    explicit ProgressMonitor(events::EventBus& bus);
    ProgressMonitor(events::EventBus& bus, Renderer renderer);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    /// Stop listening, render what is queued and join the worker; idempotent
    void stop();

    /// "Upload progress: 42.0% (1.05/2.50 MB)"
    [[nodiscard]] static std::string format_line(const ProgressEvent& event);

private:
    void work();

    Renderer renderer_;
    events::ThreadSafeQueue<ProgressEvent> queue_;
    std::unique_ptr<events::ScopedSubscription<events::UploadProgressEvent>> subscription_;
    std::thread worker_;
};

} // namespace dsync::sync
