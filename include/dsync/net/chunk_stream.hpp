#pragma once

#include "dsync/core/cancellation.hpp"
#include "dsync/core/error.hpp"
#include "dsync/core/progress.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>

namespace dsync::net {

/// Writes one chunk to the remote end; returns once the chunk is acknowledged
using ChunkWriter = std::function<Outcome<void>(const char* data, std::size_t size)>;

/**
 * @brief Feed `source` to `write` in `chunk_size` pieces
 *
 * Reports a ProgressEvent after every chunk `write` accepted, with
 * bytes_sent strictly increasing, and checks `cancel` before each chunk.
 * Returns the number of bytes written.
 *
 * Errors: UploadError (permanent) when the local file cannot be read,
 * Cancelled, or whatever `write` reports.
 */
Outcome<std::uint64_t> stream_file_chunks(const std::filesystem::path& source,
                                          std::size_t chunk_size,
                                          const ChunkWriter& write,
                                          const ProgressSink& on_progress,
                                          const CancellationToken& cancel);

} // namespace dsync::net
