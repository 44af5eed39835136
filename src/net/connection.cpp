#include "dsync/net/connection.hpp"

#include <algorithm>
#include <cctype>

namespace dsync::net {

const char* to_string(ProxyKind kind) noexcept {
    switch (kind) {
        case ProxyKind::HttpConnect: return "http";
        case ProxyKind::Socks5: return "socks5";
        case ProxyKind::Auto: return "auto";
    }
    return "unknown";
}

Outcome<ProxyKind> parse_proxy_kind(std::string_view text) {
    std::string value(text);
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "http" || value == "http-connect" || value == "https") {
        return succeed(ProxyKind::HttpConnect);
    }
    if (value == "socks5" || value == "socks") {
        return succeed(ProxyKind::Socks5);
    }
    if (value == "auto" || value.empty()) {
        return succeed(ProxyKind::Auto);
    }
    return fail<ProxyKind>(ErrorKind::ConfigError, "Unknown proxy type: " + std::string(text));
}

} // namespace dsync::net
