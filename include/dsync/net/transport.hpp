#pragma once

#include "dsync/core/cancellation.hpp"
#include "dsync/core/error.hpp"
#include "dsync/core/progress.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace dsync::net {

struct CommandOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
};

/**
 * @brief Authenticated channel to the remote host
 *
 * A Transport handed out by a TransportFactory is already connected and
 * authenticated. After close() or a transient failure the orchestrator
 * discards it and asks the factory for a fresh one.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Copy `local_file` to `remote_path`, replacing any existing file
     *
     * `on_progress` runs after every acknowledged chunk. Transient failures
     * are reported as UploadError or ConnectionError.
     */
    virtual Outcome<void> upload(const std::filesystem::path& local_file,
                                 const std::string& remote_path,
                                 const ProgressSink& on_progress) = 0;

    /// Runs `command` in the remote shell; a non-zero exit is not an error
    virtual Outcome<CommandOutput> execute(const std::string& command) = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

using TransportPtr = std::unique_ptr<Transport>;

/// Opens a new authenticated transport; observes `cancel` while connecting and uploading
using TransportFactory = std::function<Outcome<TransportPtr>(const CancellationToken& cancel)>;

} // namespace dsync::net
