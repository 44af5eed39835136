#pragma once

#include "dsync/archive/types.hpp"
#include "dsync/core/error.hpp"

#include <filesystem>
#include <string>

namespace dsync::archive {

/**
 * @brief Packs a directory tree into a single compressed file and back
 *
 * tar.gz keeps POSIX permission bits, modification times and symlinks.
 * zip keeps names and regular-file content; permission bits are recorded
 * in the Unix external attributes but only Info-ZIP style extractors
 * restore them, and symlinks are stored as the files they point to.
 */
class Archiver {
public:
    /**
     * @brief Pack the contents of `source_dir` (not the directory itself)
     *
     * The archive is written to `output_dir/<source name><extension>`.
     * Fails with PackError when the source is missing, not a directory,
     * unreadable, or the output cannot be written.
     */
    Outcome<Archive> pack(const std::filesystem::path& source_dir,
                          ArchiveFormat format,
                          const std::filesystem::path& output_dir) const;

    /**
     * @brief Extract `archive_path` into `dest_dir`
     *
     * Validates the container (header checksums, CRCs, signatures) and
     * refuses entries that would land outside `dest_dir`. Fails with
     * UnpackError.
     */
    Outcome<void> unpack(const std::filesystem::path& archive_path,
                         const std::filesystem::path& dest_dir) const;

    /// Shell command that extracts an uploaded archive on the remote host
    [[nodiscard]] static std::string extract_command(const std::string& remote_archive,
                                                     const std::string& remote_dest,
                                                     ArchiveFormat format);

    /// Detects the format from the file name; tar.gz when unknown
    [[nodiscard]] static ArchiveFormat detect_format(const std::filesystem::path& archive_path);
};

} // namespace dsync::archive
