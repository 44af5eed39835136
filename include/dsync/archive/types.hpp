#pragma once

#include "dsync/core/error.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace dsync::archive {

enum class ArchiveFormat {
    TarGz,
    Zip
};

[[nodiscard]] const char* to_string(ArchiveFormat format) noexcept;

/// ".tar.gz" or ".zip"
[[nodiscard]] const char* file_extension(ArchiveFormat format) noexcept;

/// Accepts "tar.gz", "tgz" and "zip" (case-insensitive)
Outcome<ArchiveFormat> parse_format(std::string_view text);

/**
 * @brief Packed artifact for one job
 */
struct Archive {
    std::filesystem::path path;
    ArchiveFormat format = ArchiveFormat::TarGz;
    std::uint64_t size = 0;
    std::optional<std::string> digest; ///< Set when checksum verification is enabled
};

} // namespace dsync::archive
