#include "dsync/net/ssh_transport.hpp"
#include "dsync/net/chunk_stream.hpp"
#include "dsync/net/proxy.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>
#include <spdlog/spdlog.h>

#include <poll.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <map>
#include <mutex>
#include <utility>

namespace dsync::net {
namespace {

constexpr int kKeepaliveIntervalSeconds = 30;
constexpr std::size_t kHostKeyDigestLength = 32;

Outcome<void> init_libssh2() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    if (rc != 0) {
        return fail(Error(ErrorKind::ConnectionError, "libssh2_init failed", false));
    }
    return succeed();
}

void trace_to_spdlog(LIBSSH2_SESSION*, void*, const char* data, std::size_t length) {
    spdlog::trace("libssh2: {}", std::string(data, length));
}

struct ChannelDeleter {
    void operator()(LIBSSH2_CHANNEL* channel) const noexcept { libssh2_channel_free(channel); }
};

using ChannelHandle = std::unique_ptr<LIBSSH2_CHANNEL, ChannelDeleter>;

// Puts the session into non-blocking mode for the lifetime of the guard
class NonBlockingScope {
public:
    explicit NonBlockingScope(LIBSSH2_SESSION* session) : session_(session) {
        libssh2_session_set_blocking(session_, 0);
    }
    ~NonBlockingScope() { libssh2_session_set_blocking(session_, 1); }

    NonBlockingScope(const NonBlockingScope&) = delete;
    NonBlockingScope& operator=(const NonBlockingScope&) = delete;

private:
    LIBSSH2_SESSION* session_;
};

class AuthAttempt {
public:
    AuthAttempt(LIBSSH2_SESSION* session, const std::string& username)
        : session_(session), username_(username) {}

    int operator()(const KeyAuth& key) const {
        spdlog::debug("Trying public key authentication with {}", key.key_file.string());
        return libssh2_userauth_publickey_fromfile(session_, username_.c_str(), nullptr,
                                                   key.key_file.c_str(),
                                                   key.passphrase.empty() ? nullptr : key.passphrase.c_str());
    }

    int operator()(const PasswordAuth& password) const {
        spdlog::debug("Trying password authentication");
        return libssh2_userauth_password(session_, username_.c_str(), password.password.c_str());
    }

private:
    LIBSSH2_SESSION* session_;
    const std::string& username_;
};

const char* method_name(const AuthMethod& method) {
    return std::holds_alternative<KeyAuth>(method) ? "publickey" : "password";
}

} // namespace

std::vector<AuthMethod> plan_authentication(const Credentials& credentials) {
    std::vector<AuthMethod> plan;
    if (credentials.key_file && !credentials.key_file->empty()) {
        plan.emplace_back(KeyAuth{*credentials.key_file, credentials.key_passphrase.value_or("")});
    }
    if (credentials.password) {
        plan.emplace_back(PasswordAuth{*credentials.password});
    }
    return plan;
}

int exit_code_for(int exit_status, const std::string& exit_signal) {
    if (exit_signal.empty()) {
        return exit_status;
    }
    static const std::map<std::string, int> kSignalNumbers = {
        {"HUP", 1}, {"INT", 2}, {"QUIT", 3}, {"ILL", 4}, {"ABRT", 6}, {"FPE", 8},
        {"KILL", 9}, {"SEGV", 11}, {"PIPE", 13}, {"ALRM", 14}, {"TERM", 15},
    };
    std::string name = exit_signal;
    if (name.rfind("SIG", 0) == 0) {
        name.erase(0, 3);
    }
    auto it = kSignalNumbers.find(name);
    return it != kSignalNumbers.end() ? 128 + it->second : 255;
}

SshTransport::SshTransport(ConnectionConfig config, SshTransportOptions options)
    : config_(std::move(config)), options_(std::move(options)) {}

SshTransport::~SshTransport() {
    close();
}

Outcome<void> SshTransport::connect() {
    if (options_.cancel.is_cancelled()) {
        return fail(ErrorKind::Cancelled, "Connection cancelled");
    }
    if (auto res = init_libssh2(); res.is_error()) {
        return res;
    }

    close();
    socket_ = std::make_unique<boost::asio::ip::tcp::socket>(io_);

    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.timeout);
    const auto route = select_route(config_);
    if (auto res = open_tunnel(io_, *socket_, route, Endpoint{config_.hostname, config_.port}, timeout);
        res.is_error()) {
        close();
        return res;
    }

    // libssh2 drives the descriptor with blocking reads and writes
    boost::system::error_code ec;
    socket_->native_non_blocking(false, ec);
    socket_->non_blocking(false, ec);

    if (auto res = start_session(); res.is_error()) {
        close();
        return res;
    }
    if (auto res = authenticate(); res.is_error()) {
        close();
        return res;
    }

    spdlog::info("SSH session established with {}@{}:{}", config_.username, config_.hostname, config_.port);
    return succeed();
}

Outcome<void> SshTransport::start_session() {
    session_ = libssh2_session_init();
    if (session_ == nullptr) {
        return fail(ErrorKind::ConnectionError, "libssh2_session_init failed");
    }

    if (spdlog::should_log(spdlog::level::trace)) {
        libssh2_trace(session_, ~0);
        libssh2_trace_sethandler(session_, nullptr, trace_to_spdlog);
    }

    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.timeout).count()));

    if (libssh2_session_handshake(session_, socket_->native_handle()) != 0) {
        return fail(ErrorKind::ConnectionError, "SSH handshake with " + config_.hostname + " failed: " + last_error());
    }
    libssh2_keepalive_config(session_, 1, kKeepaliveIntervalSeconds);
    log_host_key();
    return succeed();
}

void SshTransport::log_host_key() const {
    const char* hash = libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (hash == nullptr) {
        spdlog::warn("Host key fingerprint for {} unavailable", config_.hostname);
        return;
    }
    std::string fingerprint = base64_encode(std::string_view(hash, kHostKeyDigestLength));
    while (!fingerprint.empty() && fingerprint.back() == '=') {
        fingerprint.pop_back();
    }
    // Host keys are accepted on first sight; the fingerprint is logged for audit
    spdlog::info("Host key for {}: SHA256:{}", config_.hostname, fingerprint);
}

Outcome<void> SshTransport::authenticate() {
    const auto plan = plan_authentication(config_.credentials);
    if (plan.empty()) {
        return fail(ErrorKind::AuthError, "No SSH credentials configured (need key_file or password)");
    }

    std::string failures;
    for (const auto& method : plan) {
        if (std::visit(AuthAttempt(session_, config_.username), method) == 0) {
            spdlog::info("Authenticated as {} using {}", config_.username, method_name(method));
            return succeed();
        }
        const std::string reason = last_error();
        spdlog::warn("{} authentication failed: {}", method_name(method), reason);
        if (!failures.empty()) {
            failures += "; ";
        }
        failures += std::string(method_name(method)) + ": " + reason;
    }
    return fail(ErrorKind::AuthError, "SSH authentication failed for " + config_.username + " (" + failures + ")");
}

Outcome<void> SshTransport::ensure_sftp() {
    if (sftp_ != nullptr) {
        return succeed();
    }
    sftp_ = libssh2_sftp_init(session_);
    if (sftp_ == nullptr) {
        return fail(ErrorKind::ConnectionError, "Cannot start SFTP subsystem: " + last_error());
    }
    return succeed();
}

Outcome<void> SshTransport::upload(const std::filesystem::path& local_file,
                                   const std::string& remote_path,
                                   const ProgressSink& on_progress) {
    if (!is_open()) {
        return fail(ErrorKind::ConnectionError, "Upload attempted without an open SSH session");
    }
    if (auto res = ensure_sftp(); res.is_error()) {
        return res;
    }

    LIBSSH2_SFTP_HANDLE* handle = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned int>(remote_path.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH,
        LIBSSH2_SFTP_OPENFILE);
    if (handle == nullptr) {
        return fail(ErrorKind::UploadError, "Cannot open remote file " + remote_path + ": " + last_error());
    }

    spdlog::info("Uploading {} to {}", local_file.string(), remote_path);
    auto write_chunk = [&](const char* data, std::size_t size) -> Outcome<void> {
        while (size > 0) {
            const auto written = libssh2_sftp_write(handle, data, size);
            if (written < 0) {
                return fail(ErrorKind::UploadError, "SFTP write to " + remote_path + " failed: " + last_error());
            }
            data += written;
            size -= static_cast<std::size_t>(written);
        }
        return succeed();
    };

    // libssh2_sftp_write returns acknowledged bytes only, so a chunk is
    // acknowledged once write_chunk returns; close reports late errors
    auto streamed = stream_file_chunks(local_file, options_.chunk_size, write_chunk, on_progress, options_.cancel);
    const int close_rc = libssh2_sftp_close_handle(handle);
    if (streamed.is_error()) {
        return streamed.forward_error<void>();
    }
    if (close_rc != 0) {
        return fail(ErrorKind::UploadError, "Closing remote file " + remote_path + " failed: " + last_error());
    }

    spdlog::info("Upload complete: {} bytes", streamed.value());
    return succeed();
}

Outcome<CommandOutput> SshTransport::execute(const std::string& command) {
    if (!is_open()) {
        return fail<CommandOutput>(ErrorKind::ConnectionError, "Command attempted without an open SSH session");
    }

    spdlog::debug("Executing remote command: {}", command);
    ChannelHandle channel(libssh2_channel_open_session(session_));
    if (!channel) {
        return fail<CommandOutput>(ErrorKind::ConnectionError, "Cannot open SSH channel: " + last_error());
    }
    if (libssh2_channel_exec(channel.get(), command.c_str()) != 0) {
        return fail<CommandOutput>(ErrorKind::ConnectionError, "Cannot start remote command: " + last_error());
    }

    CommandOutput output;
    {
        // stdout and stderr are drained together so neither can fill the channel window
        NonBlockingScope non_blocking(session_);
        std::array<char, 4096> buffer{};

        auto drain = [&](int stream, std::string& into) -> Outcome<bool> {
            bool progressed = false;
            for (;;) {
                const auto n = libssh2_channel_read_ex(channel.get(), stream, buffer.data(), buffer.size());
                if (n == LIBSSH2_ERROR_EAGAIN || n == 0) {
                    return succeed(progressed);
                }
                if (n < 0) {
                    return fail<bool>(ErrorKind::ConnectionError, "Reading command output failed: " + last_error());
                }
                into.append(buffer.data(), static_cast<std::size_t>(n));
                progressed = true;
            }
        };

        for (;;) {
            auto out = drain(0, output.stdout_text);
            if (out.is_error()) {
                return out.forward_error<CommandOutput>();
            }
            auto err = drain(SSH_EXTENDED_DATA_STDERR, output.stderr_text);
            if (err.is_error()) {
                return err.forward_error<CommandOutput>();
            }
            if (out.value() || err.value()) {
                continue;
            }
            if (libssh2_channel_eof(channel.get()) == 1) {
                break;
            }
            if (auto waited = wait_for_socket(); waited.is_error()) {
                return waited.forward_error<CommandOutput>();
            }
        }
    }

    libssh2_channel_close(channel.get());
    libssh2_channel_wait_closed(channel.get());

    char* exit_signal = nullptr;
    libssh2_channel_get_exit_signal(channel.get(), &exit_signal, nullptr, nullptr, nullptr, nullptr, nullptr);
    std::string signal_name;
    if (exit_signal != nullptr) {
        signal_name = exit_signal;
        libssh2_free(session_, exit_signal);
    }
    output.exit_code = exit_code_for(libssh2_channel_get_exit_status(channel.get()), signal_name);
    if (!signal_name.empty()) {
        spdlog::warn("Remote command killed by signal {}", signal_name);
        output.stderr_text += "Killed by signal " + signal_name;
    }

    spdlog::debug("Remote command exited with {}", output.exit_code);
    return succeed(std::move(output));
}

Outcome<void> SshTransport::wait_for_socket() {
    const int directions = libssh2_session_block_directions(session_);
    pollfd pfd{};
    pfd.fd = socket_->native_handle();
    if (directions & LIBSSH2_SESSION_BLOCK_INBOUND) {
        pfd.events |= POLLIN;
    }
    if (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) {
        pfd.events |= POLLOUT;
    }
    if (pfd.events == 0) {
        pfd.events = POLLIN;
    }

    const int rv = ::poll(&pfd, 1, kKeepaliveIntervalSeconds * 1000);
    if (rv < 0 && errno != EINTR) {
        return fail(ErrorKind::ConnectionError, std::string("poll failed: ") + std::strerror(errno));
    }
    if (rv == 0) {
        // Idle remote command; keep NAT and proxy state alive
        int next = 0;
        const int rc = libssh2_keepalive_send(session_, &next);
        if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
            return fail(ErrorKind::ConnectionError, "Keepalive failed: " + last_error());
        }
    }
    return succeed();
}

void SshTransport::close() {
    if (sftp_ != nullptr) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_ != nullptr) {
        libssh2_session_disconnect(session_, "dsync closing");
        libssh2_session_free(session_);
        session_ = nullptr;
        spdlog::debug("SSH session to {} closed", config_.hostname);
    }
    if (socket_) {
        boost::system::error_code ec;
        socket_->close(ec);
        socket_.reset();
    }
}

std::string SshTransport::last_error() const {
    if (session_ == nullptr) {
        return "no session";
    }
    char* message = nullptr;
    int length = 0;
    libssh2_session_last_error(session_, &message, &length, 0);
    return message != nullptr ? std::string(message, static_cast<std::size_t>(length)) : "unknown error";
}

TransportFactory make_ssh_transport_factory(ConnectionConfig config, std::size_t chunk_size) {
    return [config = std::move(config), chunk_size](const CancellationToken& cancel) -> Outcome<TransportPtr> {
        SshTransportOptions options;
        options.chunk_size = chunk_size;
        options.cancel = cancel;
        auto transport = std::make_unique<SshTransport>(config, options);
        if (auto res = transport->connect(); res.is_error()) {
            return res.forward_error<TransportPtr>();
        }
        return succeed<TransportPtr>(std::move(transport));
    };
}

} // namespace dsync::net
