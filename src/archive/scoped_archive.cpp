#include "dsync/archive/scoped_archive.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace dsync::archive {
namespace fs = std::filesystem;

namespace {

std::string random_suffix() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << gen();
    return oss.str();
}

} // namespace

Outcome<ScopedArchive> ScopedArchive::create_workspace(const fs::path& parent) {
    std::error_code ec;
    fs::path base = parent;
    if (base.empty()) {
        base = fs::temp_directory_path(ec);
        if (ec) {
            return fail<ScopedArchive>(ErrorKind::PackError, "No temporary directory: " + ec.message());
        }
    }

    for (int attempt = 0; attempt < 8; ++attempt) {
        fs::path candidate = base / ("dsync-" + random_suffix());
        // create_directory reports false when the name is already taken
        if (fs::create_directory(candidate, ec)) {
            spdlog::debug("Created archive workspace {}", candidate.string());
            return succeed(ScopedArchive(std::move(candidate)));
        }
        if (ec) {
            return fail<ScopedArchive>(ErrorKind::PackError,
                                       "Cannot create workspace under " + base.string() + ": " + ec.message());
        }
    }
    return fail<ScopedArchive>(ErrorKind::PackError, "Cannot allocate a unique workspace under " + base.string());
}

ScopedArchive::ScopedArchive(fs::path workspace) : workspace_(std::move(workspace)) {}

ScopedArchive::~ScopedArchive() {
    if (released()) {
        return;
    }
    auto res = release();
    if (res.is_error()) {
        spdlog::error("Failed to remove archive workspace: {}", res.error().describe());
    }
}

ScopedArchive::ScopedArchive(ScopedArchive&& other) noexcept
    : workspace_(std::move(other.workspace_)), archive_(std::move(other.archive_)) {
    other.workspace_.clear();
}

ScopedArchive& ScopedArchive::operator=(ScopedArchive&& other) noexcept {
    if (this != &other) {
        if (!released()) {
            std::error_code ec;
            fs::remove_all(workspace_, ec);
        }
        workspace_ = std::move(other.workspace_);
        archive_ = std::move(other.archive_);
        other.workspace_.clear();
    }
    return *this;
}

Outcome<void> ScopedArchive::release() {
    if (released()) {
        return succeed();
    }
    std::error_code ec;
    fs::remove_all(workspace_, ec);
    const std::string removed = workspace_.string();
    workspace_.clear();
    if (ec) {
        return fail(ErrorKind::PackError, "Cannot remove " + removed + ": " + ec.message());
    }
    spdlog::debug("Removed archive workspace {}", removed);
    return succeed();
}

} // namespace dsync::archive
