#pragma once

#include "dsync/config/job_loader.hpp"
#include "dsync/core/error.hpp"

#include <spdlog/common.h>

#include <string_view>

namespace dsync::cli {

/// DEBUG, INFO, WARNING/WARN, ERROR, CRITICAL or TRACE (case-insensitive)
Outcome<spdlog::level::level_enum> parse_level(std::string_view name);

/**
 * @brief Install the default logger
 *
 * Colored stdout sink plus an optional append-mode file sink. `verbose`
 * forces debug regardless of the configured level.
 */
Outcome<void> configure_logging(const config::LoggingConfig& logging, bool verbose);

} // namespace dsync::cli
