#include "dsync/config/job_loader.hpp"

#include "dsync/sync/remote_paths.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace dsync::config {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

Error config_error(std::string message) {
    return Error(ErrorKind::ConfigError, std::move(message));
}

// Missing or null sections read as empty objects
const json& section(const json& document, const char* name) {
    static const json empty = json::object();
    auto it = document.find(name);
    if (it == document.end() || it->is_null()) {
        return empty;
    }
    return *it;
}

// j.value() with the offending key named on a type mismatch
template<typename T>
Outcome<T> read(const json& object, const char* section_name, const char* key, T fallback) {
    try {
        return succeed<T>(object.value(key, fallback));
    } catch (const json::exception& e) {
        return fail<T>(config_error(fmt::format("{}.{}: {}", section_name, key, e.what())));
    }
}

template<typename T>
Outcome<std::optional<T>> read_optional(const json& object, const char* section_name, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return succeed<std::optional<T>>(std::nullopt);
    }
    try {
        return succeed<std::optional<T>>(it->template get<T>());
    } catch (const json::exception& e) {
        return fail<std::optional<T>>(config_error(fmt::format("{}.{}: {}", section_name, key, e.what())));
    }
}

Outcome<std::uint16_t> check_port(std::int64_t port, const char* key) {
    if (port < 1 || port > 65535) {
        return fail<std::uint16_t>(config_error(fmt::format("{} must be between 1 and 65535, got {}", key, port)));
    }
    return succeed(static_cast<std::uint16_t>(port));
}

Outcome<std::optional<net::ProxyConfig>> parse_proxy(const json& ssh) {
    const json& proxy = section(ssh, "proxy");
    if (!proxy.is_object()) {
        return fail<std::optional<net::ProxyConfig>>(config_error("ssh.proxy must be an object"));
    }

    auto hostname = read<std::string>(proxy, "ssh.proxy", "hostname", "");
    if (hostname.is_error()) return hostname.forward_error<std::optional<net::ProxyConfig>>();
    if (hostname.value().empty()) {
        return succeed<std::optional<net::ProxyConfig>>(std::nullopt);
    }

    net::ProxyConfig config;
    config.hostname = hostname.take_value();

    auto port = read<std::int64_t>(proxy, "ssh.proxy", "port", 0);
    if (port.is_error()) return port.forward_error<std::optional<net::ProxyConfig>>();
    auto checked = check_port(port.value(), "ssh.proxy.port");
    if (checked.is_error()) return checked.forward_error<std::optional<net::ProxyConfig>>();
    config.port = checked.value();

    auto username = read_optional<std::string>(proxy, "ssh.proxy", "username");
    if (username.is_error()) return username.forward_error<std::optional<net::ProxyConfig>>();
    config.username = username.take_value();

    auto password = read_optional<std::string>(proxy, "ssh.proxy", "password");
    if (password.is_error()) return password.forward_error<std::optional<net::ProxyConfig>>();
    config.password = password.take_value();

    auto type = read<std::string>(proxy, "ssh.proxy", "type", "auto");
    if (type.is_error()) return type.forward_error<std::optional<net::ProxyConfig>>();
    auto kind = net::parse_proxy_kind(type.value());
    if (kind.is_error()) return kind.forward_error<std::optional<net::ProxyConfig>>();
    config.kind = kind.value();

    return succeed<std::optional<net::ProxyConfig>>(std::move(config));
}

Outcome<net::ConnectionConfig> parse_connection(const json& document) {
    const json& ssh = section(document, "ssh");
    if (!ssh.is_object()) {
        return fail<net::ConnectionConfig>(config_error("ssh must be an object"));
    }

    net::ConnectionConfig config;

    auto hostname = read<std::string>(ssh, "ssh", "hostname", "");
    if (hostname.is_error()) return hostname.forward_error<net::ConnectionConfig>();
    if (hostname.value().empty()) {
        return fail<net::ConnectionConfig>(config_error("ssh.hostname is required"));
    }
    config.hostname = hostname.take_value();

    auto username = read<std::string>(ssh, "ssh", "username", "");
    if (username.is_error()) return username.forward_error<net::ConnectionConfig>();
    if (username.value().empty()) {
        return fail<net::ConnectionConfig>(config_error("ssh.username is required"));
    }
    config.username = username.take_value();

    auto port = read<std::int64_t>(ssh, "ssh", "port", 22);
    if (port.is_error()) return port.forward_error<net::ConnectionConfig>();
    auto checked = check_port(port.value(), "ssh.port");
    if (checked.is_error()) return checked.forward_error<net::ConnectionConfig>();
    config.port = checked.value();

    auto timeout = read<std::int64_t>(ssh, "ssh", "timeout", 30);
    if (timeout.is_error()) return timeout.forward_error<net::ConnectionConfig>();
    if (timeout.value() <= 0 || timeout.value() > kMaxTimeout.count()) {
        return fail<net::ConnectionConfig>(config_error(
            fmt::format("ssh.timeout must be between 1 and {} seconds", kMaxTimeout.count())));
    }
    config.timeout = std::chrono::seconds(timeout.value());

    auto password = read_optional<std::string>(ssh, "ssh", "password");
    if (password.is_error()) return password.forward_error<net::ConnectionConfig>();
    if (password.value() && !password.value()->empty()) {
        config.credentials.password = password.take_value();
    }

    auto key_file = read_optional<std::string>(ssh, "ssh", "key_file");
    if (key_file.is_error()) return key_file.forward_error<net::ConnectionConfig>();
    if (key_file.value() && !key_file.value()->empty()) {
        config.credentials.key_file = expand_user(*key_file.value());
    }

    auto passphrase = read_optional<std::string>(ssh, "ssh", "key_passphrase");
    if (passphrase.is_error()) return passphrase.forward_error<net::ConnectionConfig>();
    config.credentials.key_passphrase = passphrase.take_value();

    auto proxy = parse_proxy(ssh);
    if (proxy.is_error()) return proxy.forward_error<net::ConnectionConfig>();
    config.proxy = proxy.take_value();

    return succeed(std::move(config));
}

Outcome<sync::SyncOptions> parse_options(const json& document, const CliOverrides& overrides) {
    const json& deploy = section(document, "deploy");
    if (!deploy.is_object()) {
        return fail<sync::SyncOptions>(config_error("deploy must be an object"));
    }

    sync::SyncOptions options;

    auto format_name = read<std::string>(deploy, "deploy", "compression_format", "tar.gz");
    if (format_name.is_error()) return format_name.forward_error<sync::SyncOptions>();
    auto format = archive::parse_format(format_name.value());
    if (format.is_error()) {
        return fail<sync::SyncOptions>(config_error(
            fmt::format("deploy.compression_format: {}", format.error().message)));
    }
    options.format = format.value();

    auto checksum = read<bool>(deploy, "deploy", "checksum_verify", true);
    if (checksum.is_error()) return checksum.forward_error<sync::SyncOptions>();
    options.checksum_verify = checksum.value();

    auto after_extract = read<bool>(deploy, "deploy", "verify_after_extract", false);
    if (after_extract.is_error()) return after_extract.forward_error<sync::SyncOptions>();
    options.verify_after_extract = after_extract.value();

    auto attempts = read<std::int64_t>(deploy, "deploy", "retry_attempts", 3);
    if (attempts.is_error()) return attempts.forward_error<sync::SyncOptions>();
    if (attempts.value() < 1 || attempts.value() > kMaxRetryAttempts) {
        return fail<sync::SyncOptions>(config_error(
            fmt::format("deploy.retry_attempts must be between 1 and {}", kMaxRetryAttempts)));
    }
    options.retry_attempts = static_cast<std::uint32_t>(attempts.value());

    // Seconds, fractions allowed
    auto delay = read<double>(deploy, "deploy", "retry_delay", 5.0);
    if (delay.is_error()) return delay.forward_error<sync::SyncOptions>();
    if (!std::isfinite(delay.value()) || delay.value() < 0.0 ||
        delay.value() > static_cast<double>(kMaxRetryDelay.count())) {
        return fail<sync::SyncOptions>(config_error(
            fmt::format("deploy.retry_delay must be between 0 and {} seconds", kMaxRetryDelay.count())));
    }
    options.retry_delay = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(delay.value() * 1000.0)));

    auto chunk = read<std::int64_t>(deploy, "deploy", "chunk_size", 8192);
    if (chunk.is_error()) return chunk.forward_error<sync::SyncOptions>();
    if (chunk.value() <= 0 || static_cast<std::uint64_t>(chunk.value()) > kMaxChunkSize) {
        return fail<sync::SyncOptions>(config_error(
            fmt::format("deploy.chunk_size must be between 1 and {} bytes", kMaxChunkSize)));
    }
    options.chunk_size = static_cast<std::size_t>(chunk.value());

    auto remove_first = read<bool>(deploy, "deploy", "delete_before_sync", false);
    if (remove_first.is_error()) return remove_first.forward_error<sync::SyncOptions>();
    options.delete_before_sync = overrides.delete_before_sync.value_or(remove_first.value());

    return succeed(options);
}

Outcome<LoggingConfig> parse_logging(const json& document) {
    const json& logging = section(document, "logging");
    if (!logging.is_object()) {
        return fail<LoggingConfig>(config_error("logging must be an object"));
    }

    LoggingConfig config;
    auto level = read<std::string>(logging, "logging", "level", "INFO");
    if (level.is_error()) return level.forward_error<LoggingConfig>();
    config.level = level.take_value();

    auto file = read_optional<std::string>(logging, "logging", "file");
    if (file.is_error()) return file.forward_error<LoggingConfig>();
    if (file.value() && !file.value()->empty()) {
        config.file = expand_user(*file.value());
    }
    return succeed(std::move(config));
}

// Plain YAML scalars are typed the way YAML 1.1 loaders do; quoted ones stay strings
json yaml_scalar(const YAML::Node& node) {
    if (node.Tag() == "!") {
        return node.Scalar();
    }
    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag)) {
        return flag;
    }
    std::int64_t integer = 0;
    if (YAML::convert<std::int64_t>::decode(node, integer)) {
        return integer;
    }
    double real = 0.0;
    if (YAML::convert<double>::decode(node, real)) {
        return real;
    }
    return node.Scalar();
}

json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            json object = json::object();
            for (const auto& item : node) {
                object[item.first.Scalar()] = yaml_to_json(item.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            json array = json::array();
            for (const auto& item : node) {
                array.push_back(yaml_to_json(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar:
            return yaml_scalar(node);
        default:
            return nullptr;
    }
}

bool is_yaml_file(const fs::path& path) {
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension == ".yml" || extension == ".yaml";
}

Outcome<json> read_document(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return fail<json>(config_error(fmt::format("Cannot open config file {}", path.string())));
    }

    if (is_yaml_file(path)) {
        try {
            return succeed(yaml_to_json(YAML::Load(input)));
        } catch (const YAML::Exception& e) {
            return fail<json>(config_error(fmt::format("Invalid YAML in {}: {}", path.string(), e.what())));
        }
    }

    json document;
    try {
        input >> document;
    } catch (const json::exception& e) {
        return fail<json>(config_error(fmt::format("Invalid JSON in {}: {}", path.string(), e.what())));
    }
    return succeed(std::move(document));
}

Outcome<void> check_local_root(const fs::path& local) {
    std::error_code ec;
    if (!fs::exists(local, ec)) {
        return fail(config_error(fmt::format("Local path does not exist: {}", local.string())));
    }
    if (!fs::is_directory(local, ec)) {
        return fail(config_error(fmt::format("Local path is not a directory: {}", local.string())));
    }
    return succeed();
}

} // namespace

fs::path expand_user(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return fs::path(path);
    }
    if (path.size() > 1 && path[1] != '/') {
        // ~user forms are left alone
        return fs::path(path);
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return fs::path(path);
    }
    if (path.size() <= 2) {
        return fs::path(home);
    }
    return fs::path(home) / path.substr(2);
}

Outcome<fs::path> resolve_config_path(const std::optional<fs::path>& explicit_path,
                                      const fs::path& working_dir) {
    std::error_code ec;
    if (explicit_path) {
        if (!fs::is_regular_file(*explicit_path, ec)) {
            return fail<fs::path>(config_error(
                fmt::format("Config file not found: {}", explicit_path->string())));
        }
        return succeed(*explicit_path);
    }

    for (const char* name : kConfigSearchOrder) {
        fs::path candidate = working_dir / name;
        if (fs::is_regular_file(candidate, ec)) {
            spdlog::debug("Using config file {}", candidate.string());
            return succeed(std::move(candidate));
        }
    }
    return fail<fs::path>(config_error(fmt::format(
        "No config file found: pass -c FILE or create {} or {} in {}",
        kConfigSearchOrder[2], kConfigSearchOrder[0], working_dir.string())));
}

Outcome<LoadedConfig> load_job_file(const fs::path& path, const CliOverrides& overrides) {
    auto document = read_document(path);
    if (document.is_error()) {
        return document.forward_error<LoadedConfig>();
    }

    auto loaded = parse_job(document.value(), overrides);
    if (loaded.is_ok()) {
        loaded.value().source = path;
    }
    return loaded;
}

Outcome<LoadedConfig> parse_job(const json& document, const CliOverrides& overrides) {
    if (!document.is_object()) {
        return fail<LoadedConfig>(config_error("Config document must be a mapping of sections"));
    }

    LoadedConfig loaded;

    auto connection = parse_connection(document);
    if (connection.is_error()) return connection.forward_error<LoadedConfig>();
    loaded.job.connection = connection.take_value();

    auto options = parse_options(document, overrides);
    if (options.is_error()) return options.forward_error<LoadedConfig>();
    loaded.job.options = options.take_value();

    auto logging = parse_logging(document);
    if (logging.is_error()) return logging.forward_error<LoadedConfig>();
    loaded.logging = logging.take_value();

    const json& paths = section(document, "paths");
    if (!paths.is_object()) {
        return fail<LoadedConfig>(config_error("paths must be an object"));
    }

    if (overrides.local_path) {
        loaded.job.local_root = expand_user(overrides.local_path->string());
    } else {
        auto local = read<std::string>(paths, "paths", "local", "");
        if (local.is_error()) return local.forward_error<LoadedConfig>();
        if (local.value().empty()) {
            return fail<LoadedConfig>(config_error("Local path not provided via CLI or config"));
        }
        loaded.job.local_root = expand_user(local.value());
    }

    if (overrides.remote_path) {
        loaded.job.remote_root = *overrides.remote_path;
    } else {
        auto remote = read<std::string>(paths, "paths", "remote", "");
        if (remote.is_error()) return remote.forward_error<LoadedConfig>();
        if (remote.value().empty()) {
            return fail<LoadedConfig>(config_error("Remote path not provided via CLI or config"));
        }
        loaded.job.remote_root = remote.take_value();
    }

    auto remote_ok = sync::validate_remote_root(loaded.job.remote_root);
    if (remote_ok.is_error()) {
        return fail<LoadedConfig>(config_error(remote_ok.error().message));
    }

    auto local_ok = check_local_root(loaded.job.local_root);
    if (local_ok.is_error()) return local_ok.forward_error<LoadedConfig>();

    return succeed(std::move(loaded));
}

} // namespace dsync::config
