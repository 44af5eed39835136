#pragma once

#include "dsync/archive/types.hpp"
#include "dsync/net/connection.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace dsync::sync {

struct SyncOptions {
    archive::ArchiveFormat format = archive::ArchiveFormat::TarGz;
    bool checksum_verify = true;
    bool verify_after_extract = false;    ///< Only honoured when checksum_verify is on
    std::uint32_t retry_attempts = 3;     ///< Total attempts, not retries
    std::chrono::milliseconds retry_delay{5000};
    std::size_t chunk_size = 8192;
    bool delete_before_sync = false;
};

/**
 * @brief Immutable description of one deployment
 *
 * `local_root` is an existing directory whose contents end up directly
 * under the absolute `remote_root`.
 */
struct SyncJob {
    std::filesystem::path local_root;
    std::string remote_root;
    net::ConnectionConfig connection;
    SyncOptions options;
};

} // namespace dsync::sync
