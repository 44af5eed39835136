#include "dsync/archive/archiver.hpp"
#include "dsync/core/shell.hpp"
#include "formats.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <system_error>

#include <sys/stat.h>

namespace dsync::archive {
namespace fs = std::filesystem;

const char* to_string(ArchiveFormat format) noexcept {
    switch (format) {
        case ArchiveFormat::TarGz: return "tar.gz";
        case ArchiveFormat::Zip: return "zip";
    }
    return "unknown";
}

const char* file_extension(ArchiveFormat format) noexcept {
    return format == ArchiveFormat::Zip ? ".zip" : ".tar.gz";
}

Outcome<ArchiveFormat> parse_format(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "tar.gz" || lowered == "tgz") {
        return succeed(ArchiveFormat::TarGz);
    }
    if (lowered == "zip") {
        return succeed(ArchiveFormat::Zip);
    }
    return fail<ArchiveFormat>(ErrorKind::ConfigError,
                               "Unsupported compression format: " + std::string(text));
}

namespace detail {

std::time_t to_time_t(fs::file_time_type time) {
    using namespace std::chrono;
    const auto system_time = time_point_cast<system_clock::duration>(
        time - fs::file_time_type::clock::now() + system_clock::now());
    return system_clock::to_time_t(system_time);
}

fs::file_time_type from_time_t(std::time_t time) {
    using namespace std::chrono;
    const auto system_time = system_clock::from_time_t(time);
    return time_point_cast<fs::file_time_type::duration>(
        system_time - system_clock::now() + fs::file_time_type::clock::now());
}

Outcome<std::vector<TreeEntry>> collect_tree(const fs::path& source) {
    fs::path root = source;
    if (!root.empty() && root.filename().empty()) {
        root = root.parent_path();
    }

    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return fail<std::vector<TreeEntry>>(ErrorKind::PackError,
                                            "Source directory does not exist: " + root.string());
    }
    if (!fs::is_directory(root, ec)) {
        return fail<std::vector<TreeEntry>>(ErrorKind::PackError,
                                            "Source is not a directory: " + root.string());
    }

    std::vector<TreeEntry> entries;
    fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
    if (ec) {
        return fail<std::vector<TreeEntry>>(ErrorKind::PackError,
                                            "Cannot read " + root.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const fs::path& absolute = it->path();

        struct stat info {};
        if (::lstat(absolute.c_str(), &info) != 0) {
            return fail<std::vector<TreeEntry>>(ErrorKind::PackError,
                                                "Cannot stat " + absolute.string());
        }

        TreeEntry entry;
        entry.absolute = absolute;
        entry.relative = absolute.lexically_relative(root).generic_string();
        if (entry.relative.empty() || entry.relative.rfind("..", 0) == 0) {
            return fail<std::vector<TreeEntry>>(ErrorKind::PackError,
                                                "Cannot relativize " + absolute.string());
        }
        entry.perms = static_cast<fs::perms>(info.st_mode & 07777);
        entry.modified_time = info.st_mtime;

        if (S_ISLNK(info.st_mode)) {
            entry.type = TreeEntry::Type::Symlink;
            entry.link_target = fs::read_symlink(absolute, ec).string();
            if (ec) {
                return fail<std::vector<TreeEntry>>(ErrorKind::PackError,
                                                    "Cannot read symlink " + absolute.string());
            }
        } else if (S_ISDIR(info.st_mode)) {
            entry.type = TreeEntry::Type::Directory;
        } else if (S_ISREG(info.st_mode)) {
            entry.type = TreeEntry::Type::Regular;
            entry.size = static_cast<std::uint64_t>(info.st_size);
        } else {
            spdlog::warn("Skipping special file {}", absolute.string());
            continue;
        }
        entries.push_back(std::move(entry));
    }

    if (ec) {
        return fail<std::vector<TreeEntry>>(ErrorKind::PackError,
                                            "Cannot read " + root.string() + ": " + ec.message());
    }

    std::sort(entries.begin(), entries.end(), [](const TreeEntry& a, const TreeEntry& b) {
        return a.relative < b.relative;
    });
    return succeed(std::move(entries));
}

Outcome<fs::path> resolve_inside(const fs::path& dest, const std::string& entry_name) {
    fs::path name(entry_name);
    if (entry_name.empty() || name.is_absolute()) {
        return fail<fs::path>(ErrorKind::UnpackError, "Illegal entry name: '" + entry_name + "'");
    }
    for (const auto& part : name) {
        if (part == "..") {
            return fail<fs::path>(ErrorKind::UnpackError, "Entry escapes destination: " + entry_name);
        }
    }
    return succeed(dest / name.relative_path());
}

bool has_symlink_ancestor(const fs::path& dest, const fs::path& target) {
    std::error_code ec;
    for (fs::path current = target.parent_path();
         !current.empty() && current != dest && current.native().size() > dest.native().size();
         current = current.parent_path()) {
        if (fs::is_symlink(fs::symlink_status(current, ec))) {
            return true;
        }
    }
    return false;
}

Outcome<fs::path> resolve_extract_target(const fs::path& dest, const std::string& entry_name) {
    auto target = resolve_inside(dest, entry_name);
    if (target.is_error()) {
        return target;
    }
    if (has_symlink_ancestor(dest, target.value())) {
        return fail<fs::path>(ErrorKind::UnpackError, "Entry would be written through a symlink: " + entry_name);
    }
    return target;
}

void clear_target(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (!ec && fs::exists(status) && !fs::is_directory(status)) {
        fs::remove(path, ec);
    }
}

} // namespace detail

Outcome<Archive> Archiver::pack(const fs::path& source_dir,
                                ArchiveFormat format,
                                const fs::path& output_dir) const {
    auto tree = detail::collect_tree(source_dir);
    if (tree.is_error()) {
        return tree.forward_error<Archive>();
    }

    std::string base_name = fs::absolute(source_dir).lexically_normal().filename().string();
    if (base_name.empty() || base_name == ".") {
        base_name = fs::absolute(source_dir).lexically_normal().parent_path().filename().string();
    }
    if (base_name.empty()) {
        base_name = "archive";
    }

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec && !fs::is_directory(output_dir)) {
        return fail<Archive>(ErrorKind::PackError, "Cannot create " + output_dir.string());
    }

    Archive archive;
    archive.format = format;
    archive.path = output_dir / (base_name + file_extension(format));

    spdlog::info("Packing {} ({} entries) into {}", source_dir.string(), tree.value().size(),
                 archive.path.string());

    auto written = format == ArchiveFormat::Zip ? detail::write_zip(tree.value(), archive.path)
                                                : detail::write_tar_gz(tree.value(), archive.path);
    if (written.is_error()) {
        fs::remove(archive.path, ec);
        return written.forward_error<Archive>();
    }

    archive.size = fs::file_size(archive.path, ec);
    if (ec) {
        return fail<Archive>(ErrorKind::PackError, "Cannot stat " + archive.path.string());
    }
    spdlog::info("Created archive: {} ({} bytes)", archive.path.string(), archive.size);
    return succeed(std::move(archive));
}

Outcome<void> Archiver::unpack(const fs::path& archive_path, const fs::path& dest_dir) const {
    std::error_code ec;
    if (!fs::is_regular_file(archive_path, ec)) {
        return fail(ErrorKind::UnpackError, "Archive not found: " + archive_path.string());
    }
    fs::create_directories(dest_dir, ec);
    if (ec || !fs::is_directory(dest_dir)) {
        return fail(ErrorKind::UnpackError, "Cannot create destination " + dest_dir.string());
    }

    const auto format = detect_format(archive_path);
    spdlog::debug("Unpacking {} ({}) into {}", archive_path.string(), to_string(format), dest_dir.string());
    return format == ArchiveFormat::Zip ? detail::read_zip(archive_path, dest_dir)
                                        : detail::read_tar_gz(archive_path, dest_dir);
}

std::string Archiver::extract_command(const std::string& remote_archive,
                                      const std::string& remote_dest,
                                      ArchiveFormat format) {
    if (format == ArchiveFormat::Zip) {
        return "unzip -o -q " + shell_quote(remote_archive) + " -d " + shell_quote(remote_dest);
    }
    return "tar -xzpf " + shell_quote(remote_archive) + " -C " + shell_quote(remote_dest);
}

ArchiveFormat Archiver::detect_format(const fs::path& archive_path) {
    const auto name = archive_path.filename().string();
    const std::string zip_ext = ".zip";
    if (name.size() >= zip_ext.size() &&
        name.compare(name.size() - zip_ext.size(), zip_ext.size(), zip_ext) == 0) {
        return ArchiveFormat::Zip;
    }
    return ArchiveFormat::TarGz;
}

} // namespace dsync::archive
