#include "dsync/net/chunk_stream.hpp"

#include <chrono>
#include <fstream>
#include <system_error>
#include <vector>

namespace dsync::net {
namespace fs = std::filesystem;

Outcome<std::uint64_t> stream_file_chunks(const fs::path& source,
                                          std::size_t chunk_size,
                                          const ChunkWriter& write,
                                          const ProgressSink& on_progress,
                                          const CancellationToken& cancel) {
    if (chunk_size == 0) {
        return fail<std::uint64_t>(Error(ErrorKind::UploadError, "chunk_size must be > 0", false));
    }

    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return fail<std::uint64_t>(Error(ErrorKind::UploadError, "Failed to open source file: " + source.string(), false));
    }

    std::error_code ec;
    const std::uint64_t total = fs::file_size(source, ec);
    if (ec) {
        return fail<std::uint64_t>(Error(ErrorKind::UploadError, "Cannot stat " + source.string(), false));
    }

    const auto started = std::chrono::steady_clock::now();
    std::vector<char> buffer(chunk_size);
    std::uint64_t sent = 0;

    while (input) {
        if (cancel.is_cancelled()) {
            return fail<std::uint64_t>(ErrorKind::Cancelled, "Upload cancelled after " + std::to_string(sent) + " bytes");
        }

        input.read(buffer.data(), static_cast<std::streamsize>(chunk_size));
        const auto bytes_read = static_cast<std::size_t>(input.gcount());
        if (bytes_read == 0) {
            break;
        }

        if (auto res = write(buffer.data(), bytes_read); res.is_error()) {
            return res.forward_error<std::uint64_t>();
        }
        sent += bytes_read;

        if (on_progress) {
            ProgressEvent event;
            event.bytes_sent = sent;
            event.total_bytes = total;
            event.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            on_progress(event);
        }
    }

    if (input.bad()) {
        return fail<std::uint64_t>(Error(ErrorKind::UploadError, "Read failed for " + source.string(), false));
    }
    return succeed(sent);
}

} // namespace dsync::net
