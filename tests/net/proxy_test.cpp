#include "dsync/net/proxy.hpp"

#include "fake_proxy.hpp"

#include <gtest/gtest.h>

#include <boost/asio/read.hpp>

#include <chrono>
#include <string>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using dsync::ErrorKind;
using dsync::testing::FakeProxyServer;
using namespace dsync::net;
using namespace std::chrono_literals;

namespace {

const std::string kBanner = "SSH-2.0-OpenSSH_9.6\r\n";

ProxyConfig local_proxy(std::uint16_t port) {
    ProxyConfig proxy;
    proxy.hostname = "127.0.0.1";
    proxy.port = port;
    return proxy;
}

FakeProxyServer::Session http_session(std::string status_line) {
    return [status_line](FakeProxyServer& server, tcp::socket& socket) {
        server.record(FakeProxyServer::read_http_header(socket));
        // Banner goes out in the same segment as the response on purpose
        FakeProxyServer::send(socket, status_line + "\r\nProxy-Agent: fake\r\n\r\n" + kBanner);
    };
}

// Minimal RFC 1928 server; `reply_code` 0 grants the CONNECT
FakeProxyServer::Session socks_session(std::uint8_t reply_code, bool require_password) {
    return [reply_code, require_password](FakeProxyServer& server, tcp::socket& socket) {
        const std::string head = FakeProxyServer::read_n(socket, 2);
        if (head.size() != 2) {
            return;
        }
        const std::string methods = FakeProxyServer::read_n(socket, static_cast<unsigned char>(head[1]));
        server.record(head + methods);

        if (require_password) {
            FakeProxyServer::send(socket, std::string("\x05\x02", 2));
            const std::string ver_ulen = FakeProxyServer::read_n(socket, 2);
            if (ver_ulen.size() != 2) {
                return;
            }
            const std::string user = FakeProxyServer::read_n(socket, static_cast<unsigned char>(ver_ulen[1]));
            const std::string plen = FakeProxyServer::read_n(socket, 1);
            const std::string pass = plen.empty() ? std::string()
                                                  : FakeProxyServer::read_n(socket, static_cast<unsigned char>(plen[0]));
            server.record(user + ":" + pass);
            FakeProxyServer::send(socket, std::string("\x01\x00", 2));
        } else {
            FakeProxyServer::send(socket, std::string("\x05\x00", 2));
        }

        const std::string request = FakeProxyServer::read_n(socket, 5);
        if (request.size() != 5) {
            return;
        }
        const std::string host = FakeProxyServer::read_n(socket, static_cast<unsigned char>(request[4]));
        const std::string port = FakeProxyServer::read_n(socket, 2);
        server.record(host + ":" + std::to_string((static_cast<unsigned char>(port[0]) << 8) |
                                                  static_cast<unsigned char>(port[1])));

        std::string reply{'\x05', static_cast<char>(reply_code), '\x00', '\x01'};
        reply += std::string("\x7f\x00\x00\x01\x1f\x90", 6);
        FakeProxyServer::send(socket, reply + (reply_code == 0 ? kBanner : std::string()));
    };
}

std::string read_banner(tcp::socket& socket) {
    std::string banner(kBanner.size(), '\0');
    boost::system::error_code ec;
    asio::read(socket, asio::buffer(banner), ec);
    return ec ? std::string() : banner;
}

} // namespace

TEST(ProxyRouteTest, SelectsRouteFromConfig) {
    ConnectionConfig config;
    config.hostname = "example.com";
    EXPECT_TRUE(std::holds_alternative<DirectRoute>(select_route(config)));

    config.proxy = local_proxy(3128);
    config.proxy->kind = ProxyKind::HttpConnect;
    EXPECT_TRUE(std::holds_alternative<HttpConnectRoute>(select_route(config)));
    config.proxy->kind = ProxyKind::Socks5;
    EXPECT_TRUE(std::holds_alternative<Socks5Route>(select_route(config)));
    config.proxy->kind = ProxyKind::Auto;
    EXPECT_TRUE(std::holds_alternative<AutoRoute>(select_route(config)));
    EXPECT_EQ(describe(select_route(config)), "auto (socks5, http-connect) via 127.0.0.1:3128");

    config.proxy->hostname.clear();
    EXPECT_TRUE(std::holds_alternative<DirectRoute>(select_route(config)));
}

TEST(ProxyKindTest, ParsesKnownNames) {
    auto http = parse_proxy_kind("HTTP");
    ASSERT_TRUE(http.is_ok());
    EXPECT_EQ(http.value(), ProxyKind::HttpConnect);
    auto socks = parse_proxy_kind("socks5");
    ASSERT_TRUE(socks.is_ok());
    EXPECT_EQ(socks.value(), ProxyKind::Socks5);
    auto automatic = parse_proxy_kind("");
    ASSERT_TRUE(automatic.is_ok());
    EXPECT_EQ(automatic.value(), ProxyKind::Auto);

    auto bad = parse_proxy_kind("ftp");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().kind, ErrorKind::ConfigError);
}

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("user:pass"), "dXNlcjpwYXNz");
}

TEST(HttpConnectTest, TunnelLeavesBannerUnread) {
    FakeProxyServer server({http_session("HTTP/1.1 200 Connection established")});

    ProxyConfig proxy = local_proxy(server.port());
    proxy.username = "user";
    proxy.password = "pass";

    asio::io_context io;
    tcp::socket socket(io);
    auto res = open_tunnel(io, socket, HttpConnectRoute{proxy}, Endpoint{"ssh.example.com", 2222}, 2000ms);
    ASSERT_TRUE(res.is_ok()) << res.error().describe();
    EXPECT_EQ(read_banner(socket), kBanner);

    socket.close();
    const auto received = server.received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].rfind("CONNECT ssh.example.com:2222 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(received[0].find("Host: ssh.example.com:2222\r\n"), std::string::npos);
    EXPECT_NE(received[0].find("Proxy-Authorization: Basic dXNlcjpwYXNz\r\n"), std::string::npos);
}

TEST(HttpConnectTest, RejectionIsPermanentProxyError) {
    FakeProxyServer server({http_session("HTTP/1.1 407 Proxy Authentication Required")});

    asio::io_context io;
    tcp::socket socket(io);
    auto res = open_tunnel(io, socket, HttpConnectRoute{local_proxy(server.port())}, Endpoint{"h", 22}, 2000ms);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, ErrorKind::ProxyError);
    EXPECT_FALSE(res.error().transient);
    EXPECT_NE(res.error().message.find("407"), std::string::npos);
}

TEST(HttpConnectTest, SilentProxyTimesOutTransiently) {
    FakeProxyServer server({[](FakeProxyServer&, tcp::socket& socket) {
        FakeProxyServer::read_http_header(socket);
        FakeProxyServer::read_n(socket, 1); // holds the line until the client gives up
    }});

    asio::io_context io;
    tcp::socket socket(io);
    const auto started = std::chrono::steady_clock::now();
    auto res = open_tunnel(io, socket, HttpConnectRoute{local_proxy(server.port())}, Endpoint{"h", 22}, 300ms);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, ErrorKind::ProxyError);
    EXPECT_TRUE(res.error().transient);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
    socket.close();
}

TEST(Socks5Test, DomainConnectWithoutAuthentication) {
    FakeProxyServer server({socks_session(0, false)});

    asio::io_context io;
    tcp::socket socket(io);
    auto res = open_tunnel(io, socket, Socks5Route{local_proxy(server.port())}, Endpoint{"ssh.example.com", 22}, 2000ms);
    ASSERT_TRUE(res.is_ok()) << res.error().describe();
    EXPECT_EQ(read_banner(socket), kBanner);

    socket.close();
    const auto received = server.received();
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], std::string("\x05\x01\x00", 3));
    EXPECT_EQ(received[1], "ssh.example.com:22");
}

TEST(Socks5Test, UsernamePasswordSubnegotiation) {
    FakeProxyServer server({socks_session(0, true)});

    ProxyConfig proxy = local_proxy(server.port());
    proxy.username = "alice";
    proxy.password = "secret";

    asio::io_context io;
    tcp::socket socket(io);
    auto res = open_tunnel(io, socket, Socks5Route{proxy}, Endpoint{"10.0.0.5", 2200}, 2000ms);
    ASSERT_TRUE(res.is_ok()) << res.error().describe();
    EXPECT_EQ(read_banner(socket), kBanner);

    socket.close();
    const auto received = server.received();
    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(received[0], std::string("\x05\x02\x00\x02", 4));
    EXPECT_EQ(received[1], "alice:secret");
    EXPECT_EQ(received[2], "10.0.0.5:2200");
}

TEST(Socks5Test, RefusedConnectIsPermanent) {
    FakeProxyServer server({socks_session(0x05, false)});

    asio::io_context io;
    tcp::socket socket(io);
    auto res = open_tunnel(io, socket, Socks5Route{local_proxy(server.port())}, Endpoint{"h", 22}, 2000ms);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, ErrorKind::ProxyError);
    EXPECT_FALSE(res.error().transient);
    EXPECT_NE(res.error().message.find("connection refused"), std::string::npos);
}

TEST(AutoRouteTest, FallsBackToHttpConnect) {
    FakeProxyServer server({
        [](FakeProxyServer&, tcp::socket& socket) {
            // An HTTP-only proxy answering the SOCKS greeting
            FakeProxyServer::read_n(socket, 3);
            FakeProxyServer::send(socket, "HTTP/1.1 400 Bad Request\r\n\r\n");
        },
        http_session("HTTP/1.0 200 OK"),
    });

    asio::io_context io;
    tcp::socket socket(io);
    auto res = open_tunnel(io, socket, AutoRoute{local_proxy(server.port())}, Endpoint{"ssh.example.com", 22}, 2000ms);
    ASSERT_TRUE(res.is_ok()) << res.error().describe();
    EXPECT_EQ(read_banner(socket), kBanner);
    socket.close();
}

TEST(AutoRouteTest, SurfacesLastErrorWhenBothFail) {
    FakeProxyServer server({
        [](FakeProxyServer&, tcp::socket& socket) {
            FakeProxyServer::read_n(socket, 3);
            FakeProxyServer::send(socket, "HTTP/1.1 400 Bad Request\r\n\r\n");
        },
        http_session("HTTP/1.1 403 Forbidden"),
    });

    asio::io_context io;
    tcp::socket socket(io);
    auto res = open_tunnel(io, socket, AutoRoute{local_proxy(server.port())}, Endpoint{"h", 22}, 2000ms);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, ErrorKind::ProxyError);
    EXPECT_NE(res.error().message.find("403"), std::string::npos);
}

TEST(DirectRouteTest, ClosedPortIsTransientConnectionError) {
    asio::io_context io;
    tcp::socket socket(io);
    auto res = open_tunnel(io, socket, DirectRoute{}, Endpoint{"127.0.0.1", dsync::testing::closed_port()}, 2000ms);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, ErrorKind::ConnectionError);
    EXPECT_TRUE(res.error().transient);
}

TEST(DirectRouteTest, UnreachableProxyIsTransientProxyError) {
    asio::io_context io;
    tcp::socket socket(io);
    auto res = open_tunnel(io, socket, HttpConnectRoute{local_proxy(dsync::testing::closed_port())},
                           Endpoint{"h", 22}, 2000ms);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().kind, ErrorKind::ProxyError);
    EXPECT_TRUE(res.error().transient);
}
