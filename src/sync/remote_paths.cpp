#include "dsync/sync/remote_paths.hpp"
#include "dsync/core/shell.hpp"

#include <filesystem>

namespace dsync::sync {

Outcome<void> validate_remote_root(const std::string& remote_root) {
    if (remote_root.empty()) {
        return fail(ErrorKind::InvalidRemotePath, "Remote path is empty");
    }
    if (remote_root.front() != '/') {
        return fail(ErrorKind::InvalidRemotePath, "Remote path must be absolute: " + remote_root);
    }
    if (remote_root.find('\0') != std::string::npos ||
        remote_root.find('\n') != std::string::npos ||
        remote_root.find('\r') != std::string::npos) {
        return fail(ErrorKind::InvalidRemotePath, "Remote path contains control characters");
    }
    return succeed();
}

bool is_filesystem_root(const std::string& remote_root) {
    // POSIX semantics regardless of the local platform
    const auto normal = std::filesystem::path(remote_root).lexically_normal().generic_string();
    return normal == "/" || normal == "//";
}

std::string join_remote(const std::string& directory, const std::string& name) {
    if (directory.empty()) {
        return name;
    }
    if (directory.back() == '/') {
        return directory + name;
    }
    return directory + "/" + name;
}

std::string remote_temp_archive(const std::string& remote_root,
                                const std::string& job_id,
                                archive::ArchiveFormat format) {
    return join_remote(remote_root, ".dsync-" + job_id + archive::file_extension(format));
}

std::string make_directory_command(const std::string& remote_root) {
    return "mkdir -p -- " + shell_quote(remote_root);
}

std::string remove_tree_command(const std::string& remote_root) {
    return "rm -rf -- " + shell_quote(remote_root);
}

std::string remove_file_command(const std::string& remote_path) {
    return "rm -f -- " + shell_quote(remote_path);
}

} // namespace dsync::sync
