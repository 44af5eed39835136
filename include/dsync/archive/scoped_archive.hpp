#pragma once

#include "dsync/archive/types.hpp"
#include "dsync/core/error.hpp"

#include <filesystem>

namespace dsync::archive {

/**
 * @brief Owns the private work directory holding one job's archive
 *
 * release() removes it and reports failures; the destructor removes it on
 * any path that skipped release(), including exceptions.
 */
class ScopedArchive {
public:
    /// Creates a uniquely named directory under `parent` (the system temp dir by default)
    static Outcome<ScopedArchive> create_workspace(const std::filesystem::path& parent = {});

    ~ScopedArchive();

    ScopedArchive(const ScopedArchive&) = delete;
    ScopedArchive& operator=(const ScopedArchive&) = delete;
    ScopedArchive(ScopedArchive&& other) noexcept;
    ScopedArchive& operator=(ScopedArchive&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }

    void adopt(Archive archive) { archive_ = std::move(archive); }
    [[nodiscard]] const Archive& archive() const noexcept { return archive_; }
    Archive& archive() noexcept { return archive_; }

    [[nodiscard]] bool released() const noexcept { return workspace_.empty(); }

    Outcome<void> release();

private:
    explicit ScopedArchive(std::filesystem::path workspace);

    std::filesystem::path workspace_;
    Archive archive_;
};

} // namespace dsync::archive
