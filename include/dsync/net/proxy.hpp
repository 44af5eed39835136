#pragma once

#include "dsync/core/error.hpp"
#include "dsync/net/connection.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

namespace dsync::net {

// ════════════════════════════════════════════════════════
// Routes
// ════════════════════════════════════════════════════════

struct DirectRoute {};

struct HttpConnectRoute {
    ProxyConfig proxy;
};

struct Socks5Route {
    ProxyConfig proxy;
};

struct AutoRoute {
    ProxyConfig proxy;
};

/**
 * @brief How the TCP stream to the SSH server is established
 *
 * Chosen once per connection attempt from the ConnectionConfig and
 * dispatched with std::visit.
 */
using ProxyRoute = std::variant<DirectRoute, HttpConnectRoute, Socks5Route, AutoRoute>;

[[nodiscard]] ProxyRoute select_route(const ConnectionConfig& config);

/// "direct", "http-connect via host:port", ...
[[nodiscard]] std::string describe(const ProxyRoute& route);

/**
 * @brief Connect `socket` to `target`, tunnelling through the route's proxy
 *
 * Every resolve, connect, read and write is bounded by `timeout`. On return
 * the socket carries a byte stream to `target` with nothing buffered on our
 * side, so it can be handed to another protocol library.
 *
 * Errors: ConnectionError (direct route), ProxyError (proxy routes; transient
 * for timeouts and resets, permanent for rejections).
 */
Outcome<void> open_tunnel(boost::asio::io_context& io,
                          boost::asio::ip::tcp::socket& socket,
                          const ProxyRoute& route,
                          const Endpoint& target,
                          std::chrono::milliseconds timeout);

// Individual handshakes on an already connected socket

Outcome<void> http_connect_handshake(boost::asio::io_context& io,
                                     boost::asio::ip::tcp::socket& socket,
                                     const ProxyConfig& proxy,
                                     const Endpoint& target,
                                     std::chrono::milliseconds timeout);

Outcome<void> socks5_handshake(boost::asio::io_context& io,
                               boost::asio::ip::tcp::socket& socket,
                               const ProxyConfig& proxy,
                               const Endpoint& target,
                               std::chrono::milliseconds timeout);

/// Standard base64 with padding
[[nodiscard]] std::string base64_encode(std::string_view data);

} // namespace dsync::net
