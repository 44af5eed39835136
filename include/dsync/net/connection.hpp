#pragma once

#include "dsync/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace dsync::net {

enum class ProxyKind {
    HttpConnect,
    Socks5,
    Auto        ///< SOCKS5 first, then HTTP CONNECT
};

[[nodiscard]] const char* to_string(ProxyKind kind) noexcept;

/// Accepts "http", "http-connect", "socks5" and "auto"
Outcome<ProxyKind> parse_proxy_kind(std::string_view text);

struct ProxyConfig {
    std::string hostname;
    std::uint16_t port = 0;
    std::optional<std::string> username;
    std::optional<std::string> password;
    ProxyKind kind = ProxyKind::Auto;
};

struct Credentials {
    std::optional<std::string> password;
    std::optional<std::filesystem::path> key_file;
    std::optional<std::string> key_passphrase;
};

/**
 * @brief Everything needed to reach and authenticate against the SSH host
 */
struct ConnectionConfig {
    std::string hostname;
    std::uint16_t port = 22;
    std::string username;
    Credentials credentials;
    std::optional<ProxyConfig> proxy;
    std::chrono::seconds timeout{30};
};

/// host:port pair the tunnel must reach
struct Endpoint {
    std::string host;
    std::uint16_t port = 0;
};

} // namespace dsync::net
