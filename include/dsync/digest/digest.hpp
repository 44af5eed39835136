#pragma once

#include "dsync/core/error.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace dsync::digest {

/**
 * @brief SHA-256 digest as 64 lowercase hex characters
 */
class DigestValue {
public:
    DigestValue() = default;

    /// Stores `hex` lowercased; callers validate the length first
    explicit DigestValue(std::string hex);

    [[nodiscard]] const std::string& hex() const noexcept { return hex_; }
    [[nodiscard]] bool empty() const noexcept { return hex_.empty(); }

private:
    std::string hex_;
};

constexpr std::size_t kDefaultChunkSize = 8192;
constexpr std::size_t kHexLength = 64;

/// Streams `path` through SHA-256 in `chunk_size` blocks; DigestError on I/O failure
Outcome<DigestValue> compute(const std::filesystem::path& path,
                             std::size_t chunk_size = kDefaultChunkSize);

/// SHA-256 of an in-memory buffer
Outcome<DigestValue> digest_of(std::string_view data);

/**
 * @brief Compare two hex digests
 *
 * Visits every character regardless of where the first difference is and
 * ignores hex case. Different lengths compare unequal.
 */
[[nodiscard]] bool compare(std::string_view a, std::string_view b) noexcept;
[[nodiscard]] bool compare(const DigestValue& a, const DigestValue& b) noexcept;

/// Shell command printing the SHA-256 of `remote_path` on Linux and BSD hosts
[[nodiscard]] std::string remote_command(const std::string& remote_path);

/**
 * @brief Extract the digest from the output of remote_command()
 *
 * Accepts "<hex>  <name>", "<hex> *<name>", "\<hex> ..." and bare hex with
 * trailing CR/LF. Fails with DigestError when the first token is not
 * 64 hex digits.
 */
Outcome<DigestValue> parse_remote_output(std::string_view output);

} // namespace dsync::digest
