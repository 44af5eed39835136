#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace dsync {

/**
 * @brief Snapshot of an upload after one acknowledged chunk
 */
struct ProgressEvent {
    std::uint64_t bytes_sent = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] double fraction() const noexcept {
        return total_bytes == 0 ? 1.0
                                : static_cast<double>(bytes_sent) / static_cast<double>(total_bytes);
    }
};

/// Observer invoked by the transport in increasing byte order
using ProgressSink = std::function<void(const ProgressEvent&)>;

} // namespace dsync
