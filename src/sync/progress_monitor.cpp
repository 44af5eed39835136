#include "dsync/sync/progress_monitor.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstdio>

namespace dsync::sync {
namespace {

constexpr double kBytesPerMegabyte = 1024.0 * 1024.0;

void render_to_console(const ProgressEvent& event) {
    std::printf("\r%s", ProgressMonitor::format_line(event).c_str());
    if (event.bytes_sent >= event.total_bytes) {
        std::printf("\n");
    }
    std::fflush(stdout);
}

} // namespace

ProgressMonitor::ProgressMonitor(events::EventBus& bus)
    : ProgressMonitor(bus, render_to_console) {}

ProgressMonitor::ProgressMonitor(events::EventBus& bus, Renderer renderer)
    : renderer_(std::move(renderer)) {
    worker_ = std::thread([this] { work(); });
    subscription_ = std::make_unique<events::ScopedSubscription<events::UploadProgressEvent>>(
        bus, [this](const events::UploadProgressEvent& e) { queue_.push(e.progress); });
}

ProgressMonitor::~ProgressMonitor() {
    stop();
}

void ProgressMonitor::stop() {
    subscription_.reset();
    queue_.shutdown();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::string ProgressMonitor::format_line(const ProgressEvent& event) {
    return fmt::format("Upload progress: {:.1f}% ({:.2f}/{:.2f} MB)",
                       event.fraction() * 100.0,
                       static_cast<double>(event.bytes_sent) / kBytesPerMegabyte,
                       static_cast<double>(event.total_bytes) / kBytesPerMegabyte);
}

void ProgressMonitor::work() {
    while (auto event = queue_.pop()) {
        if (renderer_) {
            renderer_(*event);
        }
    }
}

} // namespace dsync::sync
