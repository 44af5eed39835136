#include "dsync/sync/orchestrator.hpp"
#include "dsync/archive/scoped_archive.hpp"
#include "dsync/digest/digest.hpp"
#include "dsync/events/events.hpp"
#include "dsync/sync/remote_paths.hpp"
#include "dsync/sync/state_machine.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <utility>

namespace dsync::sync {
namespace {

std::string make_job_id() {
    std::random_device rd;
    std::uniform_int_distribution<std::uint64_t> dist(0, (1ULL << 48) - 1);
    std::ostringstream oss;
    oss << std::hex << std::setw(12) << std::setfill('0') << dist(rd);
    return oss.str();
}

std::string trimmed(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

std::string command_failure(const char* what, const net::CommandOutput& output) {
    std::string message = std::string(what) + " (exit " + std::to_string(output.exit_code) + ")";
    const std::string detail = trimmed(output.stderr_text);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

} // namespace

// ──────────────────────────────────────────────────────────
// One orchestration; owns everything that lives for a single job
// ──────────────────────────────────────────────────────────

class SyncOrchestrator::Run {
public:
    Run(SyncOrchestrator& owner, const SyncJob& job)
        : owner_(owner), job_(job), job_id_(make_job_id()) {}

    SyncResult execute();

private:
    using StageBody = Outcome<void> (Run::*)();

    Outcome<void> run_stages();
    Outcome<void> step(Stage stage, StageBody body);
    void enter(Stage stage);

    Outcome<void> pack();
    Outcome<void> connect();
    Outcome<void> delete_remote();
    Outcome<void> upload();
    Outcome<void> verify_uploaded() { return verify_remote_digest("uploaded archive"); }
    Outcome<void> unpack();
    Outcome<void> verify_extracted() { return verify_remote_digest("archive after extraction"); }
    Outcome<void> clean_up();

    Outcome<void> verify_remote_digest(const char* label);
    Outcome<void> open_transport(const CancellationToken& cancel);
    Outcome<void> ensure_remote_root();
    Outcome<net::CommandOutput> run_command(const std::string& command);
    void drop_transport();
    RetryPolicy retry_policy(const char* operation) const;

    [[nodiscard]] bool verifying() const noexcept { return job_.options.checksum_verify; }

    SyncOrchestrator& owner_;
    const SyncJob& job_;
    const std::string job_id_;
    StateMachine machine_;
    std::optional<archive::ScopedArchive> archive_;
    net::TransportPtr transport_;
    std::string remote_archive_;
    bool remote_archive_written_ = false;
    std::uint64_t bytes_sent_ = 0;
    bool verified_ = false;
    std::chrono::steady_clock::time_point started_{};
};

SyncResult SyncOrchestrator::Run::execute() {
    started_ = std::chrono::steady_clock::now();
    owner_.stage_.store(Stage::Idle);
    owner_.bus_.emit(events::JobStartedEvent{job_id_, job_.local_root.string(), job_.remote_root,
                                             archive::to_string(job_.options.format)});

    std::optional<std::pair<Stage, Error>> failure;
    if (auto outcome = run_stages(); outcome.is_error()) {
        failure.emplace(machine_.current(), outcome.error());
        spdlog::error("Stage {} failed: {}", to_string(machine_.current()), outcome.error().describe());
    }

    enter(Stage::CleaningUp);
    if (auto cleaned = clean_up(); cleaned.is_error()) {
        if (!failure) {
            failure.emplace(Stage::CleaningUp, cleaned.error());
        } else {
            spdlog::warn("Cleanup after failure also failed: {}", cleaned.error().describe());
        }
    }

    SyncResult result;
    result.bytes_transferred = bytes_sent_;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);

    if (failure) {
        enter(Stage::Failed);
        result.status = SyncResult::Status::Failed;
        result.failure_stage = failure->first;
        result.error = failure->second;
        result.verified = false;
        owner_.bus_.emit(events::JobFailedEvent{job_id_, failure->first, failure->second, result.duration});
        return result;
    }

    enter(Stage::Done);
    result.status = SyncResult::Status::Success;
    result.verified = verified_;
    if (!verified_) {
        spdlog::warn("Checksum verification disabled; deployment is unverified");
    }
    owner_.bus_.emit(events::JobCompletedEvent{job_id_, bytes_sent_, result.duration, verified_});
    return result;
}

Outcome<void> SyncOrchestrator::Run::run_stages() {
    if (auto res = step(Stage::Packing, &Run::pack); res.is_error()) {
        return res;
    }
    if (auto res = step(Stage::Connecting, &Run::connect); res.is_error()) {
        return res;
    }
    if (job_.options.delete_before_sync) {
        if (auto res = step(Stage::DeletingRemote, &Run::delete_remote); res.is_error()) {
            return res;
        }
    }
    if (auto res = step(Stage::Uploading, &Run::upload); res.is_error()) {
        return res;
    }
    if (verifying()) {
        if (auto res = step(Stage::VerifyingRemote, &Run::verify_uploaded); res.is_error()) {
            return res;
        }
    }
    if (auto res = step(Stage::Unpacking, &Run::unpack); res.is_error()) {
        return res;
    }
    if (verifying() && job_.options.verify_after_extract) {
        if (auto res = step(Stage::VerifyingExtracted, &Run::verify_extracted); res.is_error()) {
            return res;
        }
    }
    return succeed();
}

Outcome<void> SyncOrchestrator::Run::step(Stage stage, StageBody body) {
    enter(stage);
    if (owner_.cancel_.is_cancelled()) {
        return fail(ErrorKind::Cancelled, std::string("Cancelled at ") + to_string(stage));
    }
    return (this->*body)();
}

void SyncOrchestrator::Run::enter(Stage stage) {
    const Stage previous = machine_.current();
    if (auto moved = machine_.transition_to(stage); moved.is_error()) {
        spdlog::critical("{}", moved.error());
        return;
    }
    owner_.stage_.store(stage);
    owner_.bus_.emit(events::StageEnteredEvent{job_id_, stage, previous});
}

// ──────────────────────────────────────────────────────────
// Stages
// ──────────────────────────────────────────────────────────

Outcome<void> SyncOrchestrator::Run::pack() {
    auto workspace = archive::ScopedArchive::create_workspace(owner_.work_root_);
    if (workspace.is_error()) {
        return workspace.forward_error<void>();
    }
    archive_.emplace(workspace.take_value());

    auto packed = owner_.archiver_.pack(job_.local_root, job_.options.format, archive_->workspace());
    if (packed.is_error()) {
        return packed.forward_error<void>();
    }
    archive_->adopt(packed.take_value());

    if (verifying()) {
        auto local_digest = digest::compute(archive_->archive().path);
        if (local_digest.is_error()) {
            return local_digest.forward_error<void>();
        }
        archive_->archive().digest = local_digest.value().hex();
        spdlog::info("Local archive SHA-256: {}", local_digest.value().hex());
    }
    return succeed();
}

Outcome<void> SyncOrchestrator::Run::connect() {
    if (auto valid = validate_remote_root(job_.remote_root); valid.is_error()) {
        return valid;
    }

    return with_retry([this]() -> Outcome<void> {
        if (auto opened = open_transport(owner_.cancel_); opened.is_error()) {
            return opened;
        }
        return ensure_remote_root();
    }, retry_policy("connect"), owner_.cancel_);
}

Outcome<void> SyncOrchestrator::Run::delete_remote() {
    if (is_filesystem_root(job_.remote_root)) {
        return fail(ErrorKind::InvalidRemotePath, "Refusing to delete the remote filesystem root");
    }

    spdlog::warn("Deleting remote directory {} before sync", job_.remote_root);
    auto removed = run_command(remove_tree_command(job_.remote_root));
    if (removed.is_error()) {
        return removed.forward_error<void>();
    }
    if (!removed.value().succeeded()) {
        return fail(ErrorKind::RemoteCommandError, command_failure("Removing remote directory failed", removed.value()));
    }
    return ensure_remote_root();
}

Outcome<void> SyncOrchestrator::Run::upload() {
    remote_archive_ = remote_temp_archive(job_.remote_root, job_id_, job_.options.format);
    const archive::Archive& local = archive_->archive();

    const ProgressSink sink = [this](const ProgressEvent& event) {
        bytes_sent_ = event.bytes_sent;
        owner_.bus_.emit(events::UploadProgressEvent{job_id_, event});
        if (owner_.progress_sink_) {
            owner_.progress_sink_(event);
        }
    };

    auto uploaded = with_retry([&]() -> Outcome<void> {
        if (!transport_ || !transport_->is_open()) {
            spdlog::info("Re-establishing SSH session before upload");
            if (auto opened = open_transport(owner_.cancel_); opened.is_error()) {
                return opened;
            }
            if (auto ready = ensure_remote_root(); ready.is_error()) {
                return ready;
            }
        }

        remote_archive_written_ = true;
        bytes_sent_ = 0;
        auto res = transport_->upload(local.path, remote_archive_, sink);
        if (res.is_error() && res.error().transient) {
            drop_transport();
        }
        return res;
    }, retry_policy("upload"), owner_.cancel_);

    if (uploaded.is_error()) {
        return uploaded;
    }
    bytes_sent_ = local.size;
    spdlog::info("Uploaded {} ({} bytes) to {}", local.path.filename().string(), local.size, remote_archive_);
    return succeed();
}

Outcome<void> SyncOrchestrator::Run::verify_remote_digest(const char* label) {
    auto output = run_command(digest::remote_command(remote_archive_));
    if (output.is_error()) {
        return output.forward_error<void>();
    }
    if (!output.value().succeeded()) {
        return fail(ErrorKind::DigestError, command_failure("Remote digest command failed", output.value()));
    }

    auto remote = digest::parse_remote_output(output.value().stdout_text);
    if (remote.is_error()) {
        return remote.forward_error<void>();
    }

    const std::string& expected = archive_->archive().digest.value();
    if (!digest::compare(remote.value().hex(), expected)) {
        return fail(ErrorKind::IntegrityError,
                    std::string("SHA-256 mismatch for ") + label + ": local " + expected +
                    ", remote " + remote.value().hex());
    }

    verified_ = true;
    spdlog::info("Checksum verified for {}", label);
    return succeed();
}

Outcome<void> SyncOrchestrator::Run::unpack() {
    const auto command = archive::Archiver::extract_command(remote_archive_, job_.remote_root, job_.options.format);
    auto output = run_command(command);
    if (output.is_error()) {
        return output.forward_error<void>();
    }
    if (!output.value().succeeded()) {
        return fail(ErrorKind::UnpackError, command_failure("Remote extraction failed", output.value()));
    }
    spdlog::info("Extracted archive into {}", job_.remote_root);
    return succeed();
}

Outcome<void> SyncOrchestrator::Run::clean_up() {
    std::optional<Error> first_error;
    auto note = [&first_error](Error error) {
        spdlog::warn("Cleanup: {}", error.describe());
        if (!first_error) {
            first_error = std::move(error);
        }
    };

    if (remote_archive_written_) {
        if (!transport_ || !transport_->is_open()) {
            // Cleanup must also run after cancellation, so it gets its own token
            const CancellationToken cleanup_token;
            if (auto reopened = open_transport(cleanup_token); reopened.is_error()) {
                note(reopened.error());
            }
        }
        if (transport_) {
            auto removed = run_command(remove_file_command(remote_archive_));
            if (removed.is_error()) {
                note(removed.error());
            } else if (!removed.value().succeeded()) {
                note(Error(ErrorKind::RemoteCommandError,
                           command_failure("Removing remote temporary archive failed", removed.value())));
            } else {
                remote_archive_written_ = false;
            }
        }
    }

    drop_transport();

    if (archive_) {
        if (auto released = archive_->release(); released.is_error()) {
            note(released.error());
        }
    }

    if (first_error) {
        return fail(std::move(*first_error));
    }
    return succeed();
}

// ──────────────────────────────────────────────────────────
// Helpers
// ──────────────────────────────────────────────────────────

Outcome<void> SyncOrchestrator::Run::open_transport(const CancellationToken& cancel) {
    drop_transport();
    auto opened = owner_.factory_(cancel);
    if (opened.is_error()) {
        return opened.forward_error<void>();
    }
    transport_ = opened.take_value();
    if (!transport_) {
        return fail(ErrorKind::ConnectionError, "Transport factory returned no transport");
    }
    return succeed();
}

Outcome<void> SyncOrchestrator::Run::ensure_remote_root() {
    auto output = run_command(make_directory_command(job_.remote_root));
    if (output.is_error()) {
        if (output.error().transient) {
            drop_transport();
        }
        return output.forward_error<void>();
    }
    if (!output.value().succeeded()) {
        return fail(ErrorKind::RemoteCommandError, command_failure("Creating remote directory failed", output.value()));
    }
    return succeed();
}

Outcome<net::CommandOutput> SyncOrchestrator::Run::run_command(const std::string& command) {
    if (!transport_) {
        return fail<net::CommandOutput>(ErrorKind::ConnectionError, "Not connected");
    }
    spdlog::debug("Remote: {}", command);
    return transport_->execute(command);
}

void SyncOrchestrator::Run::drop_transport() {
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
}

RetryPolicy SyncOrchestrator::Run::retry_policy(const char* operation) const {
    RetryPolicy policy;
    policy.max_attempts = job_.options.retry_attempts;
    policy.base_delay = job_.options.retry_delay;
    policy.sleep = owner_.retry_sleep_;
    policy.on_retry = [this, operation, max = policy.max_attempts](std::uint32_t attempt, const Error& error,
                                                                   std::chrono::milliseconds delay) {
        owner_.bus_.emit(events::RetryScheduledEvent{job_id_, operation, attempt, max, delay, error});
    };
    return policy;
}

// ──────────────────────────────────────────────────────────

SyncOrchestrator::SyncOrchestrator(net::TransportFactory factory, events::EventBus& bus)
    : factory_(std::move(factory)), bus_(bus) {}

SyncResult SyncOrchestrator::run(const SyncJob& job) {
    Run run(*this, job);
    return run.execute();
}

} // namespace dsync::sync
