#include "formats.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <optional>
#include <system_error>
#include <utility>

namespace dsync::archive::detail {
namespace fs = std::filesystem;
namespace {

constexpr std::size_t kBlockSize = 512;
constexpr std::size_t kCopyBufferSize = 64 * 1024;

using Block = std::array<char, kBlockSize>;

// GNU tar header layout
constexpr std::size_t kNameOffset = 0, kNameSize = 100;
constexpr std::size_t kModeOffset = 100, kModeSize = 8;
constexpr std::size_t kUidOffset = 108, kGidOffset = 116, kIdSize = 8;
constexpr std::size_t kSizeOffset = 124, kSizeSize = 12;
constexpr std::size_t kMtimeOffset = 136, kMtimeSize = 12;
constexpr std::size_t kChecksumOffset = 148, kChecksumSize = 8;
constexpr std::size_t kTypeOffset = 156;
constexpr std::size_t kLinkOffset = 157, kLinkSize = 100;
constexpr std::size_t kMagicOffset = 257;
constexpr std::size_t kPrefixOffset = 345, kPrefixSize = 155;

constexpr char kTypeRegular = '0';
constexpr char kTypeRegularOld = '\0';
constexpr char kTypeHardLink = '1';
constexpr char kTypeSymlink = '2';
constexpr char kTypeDirectory = '5';
constexpr char kTypeContiguous = '7';
constexpr char kTypeLongName = 'L';
constexpr char kTypeLongLink = 'K';

const char kLongLinkName[] = "././@LongLink";

class GzHandle {
public:
    GzHandle(const fs::path& path, const char* mode) : file_(gzopen(path.c_str(), mode)) {}

    ~GzHandle() {
        if (file_ != nullptr) {
            gzclose(file_);
        }
    }

    GzHandle(const GzHandle&) = delete;
    GzHandle& operator=(const GzHandle&) = delete;

    explicit operator bool() const noexcept { return file_ != nullptr; }
    gzFile get() const noexcept { return file_; }

    int close() {
        const int rc = gzclose(file_);
        file_ = nullptr;
        return rc;
    }

    std::string last_error() const {
        int code = Z_OK;
        const char* message = gzerror(file_, &code);
        return message != nullptr ? message : "zlib error";
    }

private:
    gzFile file_;
};

std::size_t padding_for(std::uint64_t size) {
    const auto remainder = static_cast<std::size_t>(size % kBlockSize);
    return remainder == 0 ? 0 : kBlockSize - remainder;
}

// ──────────────────────────────────────────────────────────
// Header encoding
// ──────────────────────────────────────────────────────────

void put_string(Block& block, std::size_t offset, std::size_t size, const std::string& value) {
    std::memcpy(block.data() + offset, value.data(), std::min(size, value.size()));
}

void put_number(Block& block, std::size_t offset, std::size_t size, std::uint64_t value) {
    const std::uint64_t octal_limit = size - 1 >= 22 ? ~0ULL : (1ULL << (3 * (size - 1)));
    if (value < octal_limit) {
        char text[32];
        std::snprintf(text, sizeof(text), "%0*llo", static_cast<int>(size - 1),
                      static_cast<unsigned long long>(value));
        std::memcpy(block.data() + offset, text, size - 1);
        block[offset + size - 1] = '\0';
        return;
    }
    // GNU base-256 for values that overflow the octal field
    block[offset] = static_cast<char>(0x80);
    for (std::size_t i = size - 1; i > 0; --i) {
        block[offset + i] = static_cast<char>(value & 0xff);
        value >>= 8;
    }
}

unsigned int header_checksum(const Block& block) {
    unsigned int sum = 0;
    for (std::size_t i = 0; i < kBlockSize; ++i) {
        const bool in_checksum = i >= kChecksumOffset && i < kChecksumOffset + kChecksumSize;
        sum += in_checksum ? static_cast<unsigned char>(' ') : static_cast<unsigned char>(block[i]);
    }
    return sum;
}

void seal_header(Block& block) {
    char text[kChecksumSize];
    std::snprintf(text, sizeof(text), "%06o", header_checksum(block));
    std::memcpy(block.data() + kChecksumOffset, text, 6);
    block[kChecksumOffset + 6] = '\0';
    block[kChecksumOffset + 7] = ' ';
}

Block make_header(const std::string& name, char type, std::uint64_t size,
                  unsigned int mode, std::time_t mtime, const std::string& link) {
    Block block{};
    put_string(block, kNameOffset, kNameSize, name);
    put_number(block, kModeOffset, kModeSize, mode);
    put_number(block, kUidOffset, kIdSize, 0);
    put_number(block, kGidOffset, kIdSize, 0);
    put_number(block, kSizeOffset, kSizeSize, size);
    put_number(block, kMtimeOffset, kMtimeSize, mtime < 0 ? 0 : static_cast<std::uint64_t>(mtime));
    block[kTypeOffset] = type;
    put_string(block, kLinkOffset, kLinkSize, link);
    std::memcpy(block.data() + kMagicOffset, "ustar  ", 8); // GNU magic + version
    seal_header(block);
    return block;
}

// ──────────────────────────────────────────────────────────
// Writing
// ──────────────────────────────────────────────────────────

class TarWriter {
public:
    explicit TarWriter(GzHandle& gz) : gz_(gz) {}

    Outcome<void> write(const char* data, std::size_t size) {
        while (size > 0) {
            const auto step = static_cast<unsigned int>(std::min(size, kCopyBufferSize));
            if (gzwrite(gz_.get(), data, step) != static_cast<int>(step)) {
                return fail(ErrorKind::PackError, "gzip write failed: " + gz_.last_error());
            }
            data += step;
            size -= step;
        }
        return succeed();
    }

    Outcome<void> pad(std::uint64_t size) {
        static const Block zeros{};
        return write(zeros.data(), padding_for(size));
    }

    Outcome<void> write_long_record(char type, const std::string& value) {
        const std::string payload = value + '\0';
        auto header = make_header(kLongLinkName, type, payload.size(), 0644, 0, {});
        if (auto res = write(header.data(), header.size()); res.is_error()) {
            return res;
        }
        if (auto res = write(payload.data(), payload.size()); res.is_error()) {
            return res;
        }
        return pad(payload.size());
    }

    Outcome<void> write_entry(const TreeEntry& entry) {
        std::string name = entry.relative;
        char type = kTypeRegular;
        std::uint64_t size = 0;
        switch (entry.type) {
            case TreeEntry::Type::Directory:
                name += '/';
                type = kTypeDirectory;
                break;
            case TreeEntry::Type::Symlink:
                type = kTypeSymlink;
                break;
            case TreeEntry::Type::Regular:
                size = entry.size;
                break;
        }

        if (name.size() > kNameSize) {
            if (auto res = write_long_record(kTypeLongName, name); res.is_error()) {
                return res;
            }
        }
        if (entry.link_target.size() > kLinkSize) {
            if (auto res = write_long_record(kTypeLongLink, entry.link_target); res.is_error()) {
                return res;
            }
        }

        const auto mode = static_cast<unsigned int>(entry.perms) & 07777u;
        auto header = make_header(name, type, size, mode, entry.modified_time, entry.link_target);
        if (auto res = write(header.data(), header.size()); res.is_error()) {
            return res;
        }

        if (entry.type != TreeEntry::Type::Regular) {
            return succeed();
        }
        return write_file_body(entry);
    }

    Outcome<void> finish() {
        static const Block zeros{};
        for (int i = 0; i < 2; ++i) {
            if (auto res = write(zeros.data(), zeros.size()); res.is_error()) {
                return res;
            }
        }
        return succeed();
    }

private:
    Outcome<void> write_file_body(const TreeEntry& entry) {
        std::ifstream input(entry.absolute, std::ios::binary);
        if (!input) {
            return fail(ErrorKind::PackError, "Cannot read " + entry.absolute.string());
        }

        std::vector<char> buffer(kCopyBufferSize);
        std::uint64_t remaining = entry.size;
        while (remaining > 0) {
            const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buffer.size()));
            input.read(buffer.data(), want);
            const auto got = input.gcount();
            if (got != want) {
                return fail(ErrorKind::PackError, "File shrank while packing: " + entry.absolute.string());
            }
            if (auto res = write(buffer.data(), static_cast<std::size_t>(got)); res.is_error()) {
                return res;
            }
            remaining -= static_cast<std::uint64_t>(got);
        }
        return pad(entry.size);
    }

    GzHandle& gz_;
};

// ──────────────────────────────────────────────────────────
// Reading
// ──────────────────────────────────────────────────────────

bool is_zero_block(const Block& block) {
    return std::all_of(block.begin(), block.end(), [](char c) { return c == '\0'; });
}

std::string field_string(const Block& block, std::size_t offset, std::size_t size) {
    const char* begin = block.data() + offset;
    const char* end = static_cast<const char*>(std::memchr(begin, '\0', size));
    return std::string(begin, end != nullptr ? end : begin + size);
}

std::optional<std::uint64_t> field_number(const Block& block, std::size_t offset, std::size_t size) {
    const auto lead = static_cast<unsigned char>(block[offset]);
    if (lead & 0x80) {
        std::uint64_t value = lead & 0x7f;
        for (std::size_t i = 1; i < size; ++i) {
            value = (value << 8) | static_cast<unsigned char>(block[offset + i]);
        }
        return value;
    }

    std::uint64_t value = 0;
    bool seen_digit = false;
    for (std::size_t i = 0; i < size; ++i) {
        const char c = block[offset + i];
        if (c == ' ' && !seen_digit) {
            continue;
        }
        if (c == '\0' || c == ' ') {
            break;
        }
        if (c < '0' || c > '7') {
            return std::nullopt;
        }
        value = (value << 3) | static_cast<std::uint64_t>(c - '0');
        seen_digit = true;
    }
    return value;
}

bool checksum_matches(const Block& block) {
    const auto stored = field_number(block, kChecksumOffset, kChecksumSize);
    if (!stored) {
        return false;
    }
    if (*stored == header_checksum(block)) {
        return true;
    }
    // Some historic writers summed signed chars
    long signed_sum = 0;
    for (std::size_t i = 0; i < kBlockSize; ++i) {
        const bool in_checksum = i >= kChecksumOffset && i < kChecksumOffset + kChecksumSize;
        signed_sum += in_checksum ? ' ' : static_cast<signed char>(block[i]);
    }
    return signed_sum >= 0 && static_cast<std::uint64_t>(signed_sum) == *stored;
}

std::string normalize_name(std::string name) {
    while (name.rfind("./", 0) == 0) {
        name.erase(0, 2);
    }
    while (!name.empty() && name.back() == '/') {
        name.pop_back();
    }
    return name;
}

class TarReader {
public:
    TarReader(GzHandle& gz, fs::path dest) : gz_(gz), dest_(std::move(dest)) {}

    Outcome<void> run() {
        while (true) {
            Block header{};
            auto got = read_block(header);
            if (got.is_error()) {
                return got.forward_error<void>();
            }
            if (!got.value()) {
                spdlog::warn("tar archive ends without end-of-archive marker");
                break;
            }
            if (is_zero_block(header)) {
                break;
            }
            if (!checksum_matches(header)) {
                return fail(ErrorKind::UnpackError, "Corrupt tar header (checksum mismatch)");
            }
            if (auto res = handle_entry(header); res.is_error()) {
                return res;
            }
        }

        // Reading to the end lets zlib verify the gzip CRC and length trailer
        std::vector<char> sink(kCopyBufferSize);
        int rc = 0;
        while ((rc = gzread(gz_.get(), sink.data(), static_cast<unsigned int>(sink.size()))) > 0) {
        }
        if (rc < 0) {
            return fail(ErrorKind::UnpackError, "Corrupt gzip stream: " + gz_.last_error());
        }

        apply_directory_metadata();
        return succeed();
    }

private:
    struct DirectoryMeta {
        fs::path path;
        fs::perms perms;
        std::time_t mtime;
    };

    Outcome<bool> read_block(Block& block) {
        const int rc = gzread(gz_.get(), block.data(), static_cast<unsigned int>(block.size()));
        if (rc < 0) {
            return fail<bool>(ErrorKind::UnpackError, "Corrupt gzip stream: " + gz_.last_error());
        }
        if (rc == 0) {
            return succeed(false);
        }
        if (static_cast<std::size_t>(rc) != block.size()) {
            return fail<bool>(ErrorKind::UnpackError, "Truncated tar archive");
        }
        return succeed(true);
    }

    Outcome<std::string> read_payload(std::uint64_t size) {
        if (size > (1u << 20)) {
            return fail<std::string>(ErrorKind::UnpackError, "Oversized long-name record");
        }
        std::string payload(static_cast<std::size_t>(size), '\0');
        if (auto res = read_exact(payload.data(), payload.size()); res.is_error()) {
            return res.forward_error<std::string>();
        }
        if (auto res = skip(padding_for(size)); res.is_error()) {
            return res.forward_error<std::string>();
        }
        const auto nul = payload.find('\0');
        if (nul != std::string::npos) {
            payload.resize(nul);
        }
        return succeed(std::move(payload));
    }

    Outcome<void> read_exact(char* data, std::size_t size) {
        while (size > 0) {
            const auto step = static_cast<unsigned int>(std::min(size, kCopyBufferSize));
            const int rc = gzread(gz_.get(), data, step);
            if (rc < 0) {
                return fail(ErrorKind::UnpackError, "Corrupt gzip stream: " + gz_.last_error());
            }
            if (rc == 0) {
                return fail(ErrorKind::UnpackError, "Truncated tar archive");
            }
            data += rc;
            size -= static_cast<std::size_t>(rc);
        }
        return succeed();
    }

    Outcome<void> skip(std::uint64_t size) {
        std::vector<char> scratch(kCopyBufferSize);
        while (size > 0) {
            const auto step = static_cast<std::size_t>(std::min<std::uint64_t>(size, scratch.size()));
            if (auto res = read_exact(scratch.data(), step); res.is_error()) {
                return res;
            }
            size -= step;
        }
        return succeed();
    }

    Outcome<void> handle_entry(const Block& header) {
        const char type = header[kTypeOffset];
        const auto size_field = field_number(header, kSizeOffset, kSizeSize);
        if (!size_field) {
            return fail(ErrorKind::UnpackError, "Corrupt tar header (size field)");
        }
        const std::uint64_t size = *size_field;

        if (type == kTypeLongName || type == kTypeLongLink) {
            auto payload = read_payload(size);
            if (payload.is_error()) {
                return payload.forward_error<void>();
            }
            (type == kTypeLongName ? long_name_ : long_link_) = payload.take_value();
            return succeed();
        }

        std::string name;
        if (long_name_) {
            name = std::move(*long_name_);
            long_name_.reset();
        } else {
            name = field_string(header, kNameOffset, kNameSize);
            const std::string magic = field_string(header, kMagicOffset, 6);
            const std::string prefix = field_string(header, kPrefixOffset, kPrefixSize);
            if (magic == "ustar" && !prefix.empty()) {
                name = prefix + "/" + name;
            }
        }
        std::string link;
        if (long_link_) {
            link = std::move(*long_link_);
            long_link_.reset();
        } else {
            link = field_string(header, kLinkOffset, kLinkSize);
        }

        name = normalize_name(std::move(name));
        if (name.empty() || name == ".") {
            return skip(size + padding_for(size));
        }

        auto target = resolve_extract_target(dest_, name);
        if (target.is_error()) {
            return target.forward_error<void>();
        }
        const fs::path path = target.value();

        const auto mode = static_cast<fs::perms>(field_number(header, kModeOffset, kModeSize).value_or(0644) & 07777);
        const auto mtime = static_cast<std::time_t>(field_number(header, kMtimeOffset, kMtimeSize).value_or(0));

        std::error_code ec;
        switch (type) {
            case kTypeDirectory:
                clear_target(path);
                fs::create_directories(path, ec);
                if (ec) {
                    return fail(ErrorKind::UnpackError, "Cannot create directory " + path.string());
                }
                directories_.push_back({path, mode, mtime});
                return skip(size + padding_for(size));

            case kTypeSymlink:
                fs::create_directories(path.parent_path(), ec);
                clear_target(path);
                fs::create_symlink(link, path, ec);
                if (ec) {
                    return fail(ErrorKind::UnpackError, "Cannot create symlink " + path.string() + ": " + ec.message());
                }
                return skip(size + padding_for(size));

            case kTypeHardLink: {
                auto source = resolve_extract_target(dest_, normalize_name(link));
                if (source.is_error()) {
                    return source.forward_error<void>();
                }
                fs::create_directories(path.parent_path(), ec);
                clear_target(path);
                fs::create_hard_link(source.value(), path, ec);
                if (ec) {
                    return fail(ErrorKind::UnpackError, "Cannot create hard link " + path.string());
                }
                return skip(size + padding_for(size));
            }

            case kTypeRegular:
            case kTypeRegularOld:
            case kTypeContiguous:
                return extract_file(path, size, mode, mtime);

            default:
                spdlog::warn("Skipping unsupported tar entry type '{}' for {}", type, name);
                return skip(size + padding_for(size));
        }
    }

    Outcome<void> extract_file(const fs::path& path, std::uint64_t size, fs::perms mode, std::time_t mtime) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        // A previous entry may have left a symlink or a hard link here
        clear_target(path);

        {
            std::ofstream output(path, std::ios::binary | std::ios::trunc);
            if (!output) {
                return fail(ErrorKind::UnpackError, "Cannot create " + path.string());
            }
            std::vector<char> buffer(kCopyBufferSize);
            std::uint64_t remaining = size;
            while (remaining > 0) {
                const auto step = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
                if (auto res = read_exact(buffer.data(), step); res.is_error()) {
                    return res;
                }
                output.write(buffer.data(), static_cast<std::streamsize>(step));
                if (!output) {
                    return fail(ErrorKind::UnpackError, "Write failed for " + path.string());
                }
                remaining -= step;
            }
        }

        if (auto res = skip(padding_for(size)); res.is_error()) {
            return res;
        }

        fs::permissions(path, mode, fs::perm_options::replace, ec);
        if (ec) {
            spdlog::warn("Cannot set permissions on {}: {}", path.string(), ec.message());
        }
        fs::last_write_time(path, from_time_t(mtime), ec);
        return succeed();
    }

    void apply_directory_metadata() {
        // Deepest first so a read-only parent does not block its children
        std::sort(directories_.begin(), directories_.end(), [](const DirectoryMeta& a, const DirectoryMeta& b) {
            return a.path.native().size() > b.path.native().size();
        });
        std::error_code ec;
        for (const auto& dir : directories_) {
            fs::permissions(dir.path, dir.perms, fs::perm_options::replace, ec);
            if (ec) {
                spdlog::warn("Cannot set permissions on {}: {}", dir.path.string(), ec.message());
            }
            fs::last_write_time(dir.path, from_time_t(dir.mtime), ec);
        }
    }

    GzHandle& gz_;
    fs::path dest_;
    std::optional<std::string> long_name_;
    std::optional<std::string> long_link_;
    std::vector<DirectoryMeta> directories_;
};

} // namespace

Outcome<void> write_tar_gz(const std::vector<TreeEntry>& entries, const fs::path& output) {
    GzHandle gz(output, "wb6");
    if (!gz) {
        return fail(ErrorKind::PackError, "Cannot create " + output.string());
    }

    TarWriter writer(gz);
    for (const auto& entry : entries) {
        if (auto res = writer.write_entry(entry); res.is_error()) {
            return res;
        }
    }
    if (auto res = writer.finish(); res.is_error()) {
        return res;
    }
    if (gz.close() != Z_OK) {
        return fail(ErrorKind::PackError, "Cannot finalize " + output.string());
    }
    return succeed();
}

Outcome<void> read_tar_gz(const fs::path& archive, const fs::path& dest) {
    GzHandle gz(archive, "rb");
    if (!gz) {
        return fail(ErrorKind::UnpackError, "Cannot open " + archive.string());
    }

    TarReader reader(gz, dest);
    if (auto res = reader.run(); res.is_error()) {
        return res;
    }
    if (gz.close() != Z_OK) {
        return fail(ErrorKind::UnpackError, "Corrupt gzip trailer in " + archive.string());
    }
    return succeed();
}

} // namespace dsync::archive::detail
