#include "dsync/cli/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>

namespace dsync::cli {

namespace {
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S] [%^%l%$] %v";
}

Outcome<spdlog::level::level_enum> parse_level(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return succeed(spdlog::level::trace);
    if (upper == "DEBUG") return succeed(spdlog::level::debug);
    if (upper == "INFO") return succeed(spdlog::level::info);
    if (upper == "WARNING" || upper == "WARN") return succeed(spdlog::level::warn);
    if (upper == "ERROR") return succeed(spdlog::level::err);
    if (upper == "CRITICAL") return succeed(spdlog::level::critical);
    return fail<spdlog::level::level_enum>(ErrorKind::ConfigError,
                                           "Unknown log level '" + std::string(name) + "'");
}

Outcome<void> configure_logging(const config::LoggingConfig& logging, bool verbose) {
    auto level = parse_level(logging.level);
    if (level.is_error()) {
        return level.forward_error<void>();
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (logging.file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file->string()));
        } catch (const spdlog::spdlog_ex& e) {
            return fail(ErrorKind::ConfigError,
                        "Cannot open log file " + logging.file->string() + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("dsync", sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(verbose ? spdlog::level::debug : level.value());
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::info("Logging configured - Level: {}, File: {}",
                 spdlog::level::to_string_view(logger->level()),
                 logging.file ? logging.file->string() : std::string("none"));
    return succeed();
}

} // namespace dsync::cli
