#pragma once

#include "dsync/core/error.hpp"
#include "dsync/sync/job.hpp"

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dsync::config {

/// Command-line values that take precedence over the job file
struct CliOverrides {
    std::optional<std::filesystem::path> local_path;
    std::optional<std::string> remote_path;
    std::optional<bool> delete_before_sync;
};

struct LoggingConfig {
    std::string level = "INFO";
    std::optional<std::filesystem::path> file;
};

struct LoadedConfig {
    sync::SyncJob job;
    LoggingConfig logging;
    std::filesystem::path source;
};

/// Looked up in `working_dir` in this order when no file is given
inline constexpr std::array<const char*, 4> kConfigSearchOrder = {
    "dev.config.yml", "dev.config.json", "config.yml", "config.json"};

// Upper bounds; larger values are configuration mistakes
inline constexpr std::size_t kMaxChunkSize = 64u << 20;
inline constexpr std::int64_t kMaxRetryAttempts = 100;
inline constexpr std::chrono::seconds kMaxRetryDelay{3600};
inline constexpr std::chrono::seconds kMaxTimeout{3600};

/**
 * @brief Pick the job file to load
 *
 * An explicit path wins (and must exist); otherwise the first of
 * kConfigSearchOrder found in `working_dir`. ConfigError when nothing is
 * found.
 */
Outcome<std::filesystem::path> resolve_config_path(const std::optional<std::filesystem::path>& explicit_path,
                                                   const std::filesystem::path& working_dir);

/// Read, parse and validate a job file; .yml and .yaml are YAML, anything else JSON
Outcome<LoadedConfig> load_job_file(const std::filesystem::path& path, const CliOverrides& overrides);

/**
 * @brief Build a validated SyncJob from a parsed document
 *
 * Applies defaults for missing keys and the CLI overrides, expands `~` in
 * the local path and key file, then validates. Any type mismatch or
 * invalid value is a ConfigError naming the key.
 */
Outcome<LoadedConfig> parse_job(const nlohmann::json& document, const CliOverrides& overrides);

/// "~" and "~/x" relative to $HOME; other paths unchanged
[[nodiscard]] std::filesystem::path expand_user(const std::string& path);

} // namespace dsync::config
