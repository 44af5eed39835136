#pragma once

#include "dsync/archive/types.hpp"
#include "dsync/core/error.hpp"

#include <string>

namespace dsync::sync {

/// Absolute, non-empty, free of NUL and newlines; InvalidRemotePath otherwise
Outcome<void> validate_remote_root(const std::string& remote_root);

/// True for "/" and anything that normalises to it ("//", "/.", "/..")
[[nodiscard]] bool is_filesystem_root(const std::string& remote_root);

[[nodiscard]] std::string join_remote(const std::string& directory, const std::string& name);

/// `<remote_root>/.dsync-<job_id><ext>`
[[nodiscard]] std::string remote_temp_archive(const std::string& remote_root,
                                              const std::string& job_id,
                                              archive::ArchiveFormat format);

[[nodiscard]] std::string make_directory_command(const std::string& remote_root);
[[nodiscard]] std::string remove_tree_command(const std::string& remote_root);
[[nodiscard]] std::string remove_file_command(const std::string& remote_path);

} // namespace dsync::sync
