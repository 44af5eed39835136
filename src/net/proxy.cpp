#include "dsync/net/proxy.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace dsync::net {
namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using boost::system::error_code;

namespace {

constexpr std::size_t kMaxHttpResponseHeader = 16 * 1024;

constexpr std::uint8_t kSocksVersion = 0x05;
constexpr std::uint8_t kSocksAuthNone = 0x00;
constexpr std::uint8_t kSocksAuthPassword = 0x02;
constexpr std::uint8_t kSocksAuthRejected = 0xff;
constexpr std::uint8_t kSocksPasswordVersion = 0x01;
constexpr std::uint8_t kSocksCmdConnect = 0x01;
constexpr std::uint8_t kSocksAtypIpv4 = 0x01;
constexpr std::uint8_t kSocksAtypDomain = 0x03;
constexpr std::uint8_t kSocksAtypIpv6 = 0x04;

struct IoStatus {
    error_code ec;
    std::size_t bytes = 0;
    bool timed_out = false;

    [[nodiscard]] bool ok() const noexcept { return !timed_out && !ec; }

    [[nodiscard]] std::string message() const {
        return timed_out ? std::string("timed out") : ec.message();
    }
};

// Runs one asynchronous socket operation to completion or until `timeout`
// expires; on timeout the operation is cancelled and drained.
template<typename Initiate>
IoStatus run_timed(asio::io_context& io, tcp::socket& socket, std::chrono::milliseconds timeout, Initiate&& initiate) {
    IoStatus status;
    bool done = false;
    initiate([&](const error_code& ec, std::size_t bytes) {
        status.ec = ec;
        status.bytes = bytes;
        done = true;
    });
    io.restart();
    io.run_for(timeout);
    if (!done) {
        status.timed_out = true;
        error_code ignored;
        socket.cancel(ignored);
        io.restart();
        io.run();
    }
    return status;
}

IoStatus write_all(asio::io_context& io, tcp::socket& socket, const std::string& data,
                   std::chrono::milliseconds timeout) {
    return run_timed(io, socket, timeout, [&](auto handler) {
        asio::async_write(socket, asio::buffer(data), handler);
    });
}

IoStatus read_exact(asio::io_context& io, tcp::socket& socket, void* data, std::size_t size,
                    std::chrono::milliseconds timeout) {
    return run_timed(io, socket, timeout, [&](auto handler) {
        asio::async_read(socket, asio::buffer(data, size), handler);
    });
}

IoStatus connect_socket(asio::io_context& io, tcp::socket& socket, const Endpoint& endpoint,
                        std::chrono::milliseconds timeout) {
    IoStatus status;
    error_code ignored;
    if (socket.is_open()) {
        socket.close(ignored);
    }

    tcp::resolver resolver(io);
    tcp::resolver::results_type endpoints;
    bool resolved = false;
    resolver.async_resolve(endpoint.host, std::to_string(endpoint.port),
                           [&](const error_code& ec, tcp::resolver::results_type results) {
                               status.ec = ec;
                               endpoints = std::move(results);
                               resolved = true;
                           });
    io.restart();
    io.run_for(timeout);
    if (!resolved) {
        resolver.cancel();
        io.restart();
        io.run();
        status.timed_out = true;
        return status;
    }
    if (status.ec) {
        return status;
    }

    bool connected = false;
    asio::async_connect(socket, endpoints, [&](const error_code& ec, const tcp::endpoint&) {
        status.ec = ec;
        connected = true;
    });
    io.restart();
    io.run_for(timeout);
    if (!connected) {
        socket.close(ignored);
        io.restart();
        io.run();
        status.timed_out = true;
    }
    return status;
}

std::string authority(const Endpoint& endpoint) {
    const bool ipv6_literal = endpoint.host.find(':') != std::string::npos;
    return (ipv6_literal ? "[" + endpoint.host + "]" : endpoint.host) + ":" + std::to_string(endpoint.port);
}

std::string proxy_label(const ProxyConfig& proxy) {
    return authority(Endpoint{proxy.hostname, proxy.port});
}

Error proxy_io_error(const ProxyConfig& proxy, const std::string& step, const IoStatus& status) {
    return Error(ErrorKind::ProxyError,
                 "Proxy " + proxy_label(proxy) + " " + step + ": " + status.message(),
                 /*is_transient=*/true);
}

Error proxy_rejection(const ProxyConfig& proxy, const std::string& reason) {
    return Error(ErrorKind::ProxyError, "Proxy " + proxy_label(proxy) + " " + reason, /*is_transient=*/false);
}

Outcome<void> connect_to_proxy(asio::io_context& io, tcp::socket& socket, const ProxyConfig& proxy,
                               std::chrono::milliseconds timeout) {
    spdlog::debug("Connecting to proxy {}", proxy_label(proxy));
    const auto status = connect_socket(io, socket, Endpoint{proxy.hostname, proxy.port}, timeout);
    if (!status.ok()) {
        return fail(proxy_io_error(proxy, "unreachable", status));
    }
    return succeed();
}

const char* socks_reply_text(std::uint8_t code) {
    switch (code) {
        case 0x01: return "general SOCKS server failure";
        case 0x02: return "connection not allowed by ruleset";
        case 0x03: return "network unreachable";
        case 0x04: return "host unreachable";
        case 0x05: return "connection refused";
        case 0x06: return "TTL expired";
        case 0x07: return "command not supported";
        case 0x08: return "address type not supported";
        default: return "unknown SOCKS reply";
    }
}

class TunnelOpener {
public:
    TunnelOpener(asio::io_context& io, tcp::socket& socket, const Endpoint& target, std::chrono::milliseconds timeout)
        : io_(io), socket_(socket), target_(target), timeout_(timeout) {}

    Outcome<void> operator()(const DirectRoute&) const {
        const auto status = connect_socket(io_, socket_, target_, timeout_);
        if (!status.ok()) {
            return fail(Error(ErrorKind::ConnectionError,
                              "Cannot connect to " + authority(target_) + ": " + status.message(), true));
        }
        return succeed();
    }

    Outcome<void> operator()(const HttpConnectRoute& route) const {
        if (auto res = connect_to_proxy(io_, socket_, route.proxy, timeout_); res.is_error()) {
            return res;
        }
        return http_connect_handshake(io_, socket_, route.proxy, target_, timeout_);
    }

    Outcome<void> operator()(const Socks5Route& route) const {
        if (auto res = connect_to_proxy(io_, socket_, route.proxy, timeout_); res.is_error()) {
            return res;
        }
        return socks5_handshake(io_, socket_, route.proxy, target_, timeout_);
    }

    Outcome<void> operator()(const AutoRoute& route) const {
        auto socks = (*this)(Socks5Route{route.proxy});
        if (socks.is_ok()) {
            return socks;
        }
        spdlog::warn("SOCKS5 via {} failed ({}), trying HTTP CONNECT",
                     proxy_label(route.proxy), socks.error().message);

        error_code ignored;
        socket_.close(ignored);
        return (*this)(HttpConnectRoute{route.proxy});
    }

private:
    asio::io_context& io_;
    tcp::socket& socket_;
    const Endpoint& target_;
    std::chrono::milliseconds timeout_;
};

} // namespace

ProxyRoute select_route(const ConnectionConfig& config) {
    if (!config.proxy || config.proxy->hostname.empty()) {
        return DirectRoute{};
    }
    switch (config.proxy->kind) {
        case ProxyKind::HttpConnect: return HttpConnectRoute{*config.proxy};
        case ProxyKind::Socks5: return Socks5Route{*config.proxy};
        case ProxyKind::Auto: return AutoRoute{*config.proxy};
    }
    return DirectRoute{};
}

std::string describe(const ProxyRoute& route) {
    struct Describer {
        std::string operator()(const DirectRoute&) const { return "direct"; }
        std::string operator()(const HttpConnectRoute& r) const { return "http-connect via " + proxy_label(r.proxy); }
        std::string operator()(const Socks5Route& r) const { return "socks5 via " + proxy_label(r.proxy); }
        std::string operator()(const AutoRoute& r) const { return "auto (socks5, http-connect) via " + proxy_label(r.proxy); }
    };
    return std::visit(Describer{}, route);
}

Outcome<void> open_tunnel(asio::io_context& io,
                          tcp::socket& socket,
                          const ProxyRoute& route,
                          const Endpoint& target,
                          std::chrono::milliseconds timeout) {
    spdlog::info("Opening connection to {} ({})", authority(target), describe(route));
    return std::visit(TunnelOpener(io, socket, target, timeout), route);
}

Outcome<void> http_connect_handshake(asio::io_context& io,
                                     tcp::socket& socket,
                                     const ProxyConfig& proxy,
                                     const Endpoint& target,
                                     std::chrono::milliseconds timeout) {
    const std::string target_authority = authority(target);
    std::string request = "CONNECT " + target_authority + " HTTP/1.1\r\n"
                          "Host: " + target_authority + "\r\n";
    if (proxy.username && proxy.password) {
        request += "Proxy-Authorization: Basic " + base64_encode(*proxy.username + ":" + *proxy.password) + "\r\n";
    }
    request += "\r\n";

    if (auto status = write_all(io, socket, request, timeout); !status.ok()) {
        return fail(proxy_io_error(proxy, "CONNECT request", status));
    }

    // One byte at a time: anything after the blank line belongs to the tunnelled protocol
    std::string response;
    while (response.size() < 4 || response.compare(response.size() - 4, 4, "\r\n\r\n") != 0) {
        if (response.size() >= kMaxHttpResponseHeader) {
            return fail(proxy_rejection(proxy, "sent an oversized CONNECT response"));
        }
        char c = 0;
        if (auto status = read_exact(io, socket, &c, 1, timeout); !status.ok()) {
            return fail(proxy_io_error(proxy, "CONNECT response", status));
        }
        response.push_back(c);
    }

    const std::string status_line = response.substr(0, response.find("\r\n"));
    if (status_line.rfind("HTTP/", 0) != 0) {
        return fail(proxy_rejection(proxy, "sent a malformed CONNECT response: " + status_line));
    }
    const auto space = status_line.find(' ');
    const std::string code = space == std::string::npos ? std::string() : status_line.substr(space + 1, 3);
    if (code.size() != 3 || code[0] != '2') {
        if (code == "407") {
            return fail(proxy_rejection(proxy, "requires authentication (" + status_line + ")"));
        }
        return fail(proxy_rejection(proxy, "rejected CONNECT: " + status_line));
    }

    spdlog::info("HTTP CONNECT tunnel to {} established via {}", target_authority, proxy_label(proxy));
    return succeed();
}

Outcome<void> socks5_handshake(asio::io_context& io,
                               tcp::socket& socket,
                               const ProxyConfig& proxy,
                               const Endpoint& target,
                               std::chrono::milliseconds timeout) {
    const bool with_password = proxy.username.has_value();

    std::string greeting{static_cast<char>(kSocksVersion)};
    if (with_password) {
        greeting += static_cast<char>(2);
        greeting += static_cast<char>(kSocksAuthNone);
        greeting += static_cast<char>(kSocksAuthPassword);
    } else {
        greeting += static_cast<char>(1);
        greeting += static_cast<char>(kSocksAuthNone);
    }
    if (auto status = write_all(io, socket, greeting, timeout); !status.ok()) {
        return fail(proxy_io_error(proxy, "SOCKS5 greeting", status));
    }

    std::array<std::uint8_t, 2> choice{};
    if (auto status = read_exact(io, socket, choice.data(), choice.size(), timeout); !status.ok()) {
        return fail(proxy_io_error(proxy, "SOCKS5 greeting reply", status));
    }
    if (choice[0] != kSocksVersion) {
        return fail(proxy_rejection(proxy, "is not a SOCKS5 proxy"));
    }

    if (choice[1] == kSocksAuthPassword) {
        if (!with_password) {
            return fail(proxy_rejection(proxy, "demands credentials that are not configured"));
        }
        const std::string& user = *proxy.username;
        const std::string pass = proxy.password.value_or("");
        if (user.size() > 255 || pass.size() > 255) {
            return fail(proxy_rejection(proxy, "credentials exceed the SOCKS5 length limit"));
        }
        std::string auth{static_cast<char>(kSocksPasswordVersion)};
        auth += static_cast<char>(user.size());
        auth += user;
        auth += static_cast<char>(pass.size());
        auth += pass;
        if (auto status = write_all(io, socket, auth, timeout); !status.ok()) {
            return fail(proxy_io_error(proxy, "SOCKS5 authentication", status));
        }
        std::array<std::uint8_t, 2> verdict{};
        if (auto status = read_exact(io, socket, verdict.data(), verdict.size(), timeout); !status.ok()) {
            return fail(proxy_io_error(proxy, "SOCKS5 authentication reply", status));
        }
        if (verdict[1] != 0x00) {
            return fail(proxy_rejection(proxy, "rejected SOCKS5 username/password"));
        }
    } else if (choice[1] == kSocksAuthRejected) {
        return fail(proxy_rejection(proxy, "accepted none of the offered SOCKS5 auth methods"));
    } else if (choice[1] != kSocksAuthNone) {
        return fail(proxy_rejection(proxy, "selected an unsupported SOCKS5 auth method"));
    }

    if (target.host.size() > 255) {
        return fail(proxy_rejection(proxy, "cannot carry a host name longer than 255 bytes"));
    }
    std::string request{static_cast<char>(kSocksVersion), static_cast<char>(kSocksCmdConnect), '\0',
                        static_cast<char>(kSocksAtypDomain)};
    request += static_cast<char>(target.host.size());
    request += target.host;
    request += static_cast<char>((target.port >> 8) & 0xff);
    request += static_cast<char>(target.port & 0xff);
    if (auto status = write_all(io, socket, request, timeout); !status.ok()) {
        return fail(proxy_io_error(proxy, "SOCKS5 CONNECT request", status));
    }

    std::array<std::uint8_t, 4> reply{};
    if (auto status = read_exact(io, socket, reply.data(), reply.size(), timeout); !status.ok()) {
        return fail(proxy_io_error(proxy, "SOCKS5 CONNECT reply", status));
    }
    if (reply[0] != kSocksVersion) {
        return fail(proxy_rejection(proxy, "sent a malformed SOCKS5 reply"));
    }
    if (reply[1] != 0x00) {
        return fail(proxy_rejection(proxy, std::string("refused SOCKS5 CONNECT: ") + socks_reply_text(reply[1])));
    }

    // Drain the bound address so the stream starts at the tunnelled protocol
    std::size_t address_length = 0;
    switch (reply[3]) {
        case kSocksAtypIpv4: address_length = 4; break;
        case kSocksAtypIpv6: address_length = 16; break;
        case kSocksAtypDomain: {
            std::uint8_t length = 0;
            if (auto status = read_exact(io, socket, &length, 1, timeout); !status.ok()) {
                return fail(proxy_io_error(proxy, "SOCKS5 CONNECT reply", status));
            }
            address_length = length;
            break;
        }
        default:
            return fail(proxy_rejection(proxy, "sent an unknown SOCKS5 address type"));
    }
    std::vector<std::uint8_t> bound(address_length + 2);
    if (auto status = read_exact(io, socket, bound.data(), bound.size(), timeout); !status.ok()) {
        return fail(proxy_io_error(proxy, "SOCKS5 CONNECT reply", status));
    }

    spdlog::info("SOCKS5 tunnel to {} established via {}", authority(target), proxy_label(proxy));
    return succeed();
}

std::string base64_encode(std::string_view data) {
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(data.data()),
                                        static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
    return out;
}

} // namespace dsync::net
