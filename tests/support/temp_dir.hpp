#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include <unistd.h>

namespace dsync::testing {

namespace fs = std::filesystem;

inline fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<std::uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = fs::temp_directory_path() /
                   fs::path(prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline void remove_temp_dir(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

/// Regular files below `root` count; directories do not
inline std::size_t count_files(const fs::path& root) {
    std::size_t count = 0;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            ++count;
        }
    }
    return count;
}

} // namespace dsync::testing
