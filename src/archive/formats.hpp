#pragma once

#include "dsync/core/error.hpp"

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace dsync::archive::detail {

struct TreeEntry {
    enum class Type {
        Directory,
        Regular,
        Symlink
    };

    Type type = Type::Regular;
    std::filesystem::path absolute;
    std::string relative;          ///< POSIX style, no trailing slash
    std::filesystem::perms perms = std::filesystem::perms::none;
    std::uint64_t size = 0;
    std::time_t modified_time = 0;
    std::string link_target;       ///< Symlinks only
};

/// Walks `root` without following symlinks; entries sorted by relative path
Outcome<std::vector<TreeEntry>> collect_tree(const std::filesystem::path& root);

/// Rejects absolute names and names with ".." components, returns dest/name
Outcome<std::filesystem::path> resolve_inside(const std::filesystem::path& dest,
                                              const std::string& entry_name);

/// True when a directory between `dest` and `target` is a symlink
bool has_symlink_ancestor(const std::filesystem::path& dest, const std::filesystem::path& target);

/**
 * @brief resolve_inside plus the on-disk check for symlinked parents
 *
 * A symlink extracted earlier must never redirect a later entry (or a hard
 * link source) outside `dest`.
 */
Outcome<std::filesystem::path> resolve_extract_target(const std::filesystem::path& dest,
                                                      const std::string& entry_name);

/// Removes whatever non-directory sits at `path` so writes never follow links
void clear_target(const std::filesystem::path& path);

std::time_t to_time_t(std::filesystem::file_time_type time);
std::filesystem::file_time_type from_time_t(std::time_t time);

Outcome<void> write_tar_gz(const std::vector<TreeEntry>& entries, const std::filesystem::path& output);
Outcome<void> read_tar_gz(const std::filesystem::path& archive, const std::filesystem::path& dest);

Outcome<void> write_zip(const std::vector<TreeEntry>& entries, const std::filesystem::path& output);
Outcome<void> read_zip(const std::filesystem::path& archive, const std::filesystem::path& dest);

} // namespace dsync::archive::detail
