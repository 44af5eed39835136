#pragma once

#include "dsync/net/connection.hpp"
#include "dsync/net/transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

// libssh2 handles stay opaque here
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

namespace dsync::net {

struct KeyAuth {
    std::filesystem::path key_file;
    std::string passphrase;
};

struct PasswordAuth {
    std::string password;
};

using AuthMethod = std::variant<KeyAuth, PasswordAuth>;

/// Private key first (when configured), then password
[[nodiscard]] std::vector<AuthMethod> plan_authentication(const Credentials& credentials);

/**
 * @brief Exit code reported for a finished exec channel
 *
 * libssh2 reports status 0 when the remote sent no exit-status, which is
 * what happens when the command dies from a signal. A signal therefore
 * maps to 128 + its number (255 for names we do not know), like a shell.
 */
[[nodiscard]] int exit_code_for(int exit_status, const std::string& exit_signal);

struct SshTransportOptions {
    std::size_t chunk_size = 8192;
    CancellationToken cancel;
};

/**
 * @brief Transport over libssh2 with SFTP uploads and exec channels
 *
 * The TCP stream is opened with Boost.Asio (directly or through a proxy
 * tunnel) and handed to libssh2 in blocking mode. The session is either
 * fully authenticated after connect() or torn down.
 *
 * Handshake, authentication and SFTP writes are bounded by the configured
 * timeout. Remote commands are not: they are read in non-blocking mode with
 * keepalives, since an extraction may stay silent for a long time.
 */
class SshTransport : public Transport {
public:
    SshTransport(ConnectionConfig config, SshTransportOptions options);
    ~SshTransport() override;

    SshTransport(const SshTransport&) = delete;
    SshTransport& operator=(const SshTransport&) = delete;

    /// Tunnel, SSH handshake and authentication
    Outcome<void> connect();

    Outcome<void> upload(const std::filesystem::path& local_file,
                         const std::string& remote_path,
                         const ProgressSink& on_progress) override;

    Outcome<CommandOutput> execute(const std::string& command) override;

    void close() override;

    [[nodiscard]] bool is_open() const override { return session_ != nullptr; }

private:
    Outcome<void> start_session();
    Outcome<void> authenticate();
    Outcome<void> ensure_sftp();
    Outcome<void> wait_for_socket();
    void log_host_key() const;
    [[nodiscard]] std::string last_error() const;

    ConnectionConfig config_;
    SshTransportOptions options_;
    boost::asio::io_context io_;
    std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
    LIBSSH2_SESSION* session_ = nullptr;
    LIBSSH2_SFTP* sftp_ = nullptr;
};

/// Factory producing connected SshTransport instances for the orchestrator
[[nodiscard]] TransportFactory make_ssh_transport_factory(ConnectionConfig config, std::size_t chunk_size);

} // namespace dsync::net
