#include "formats.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <ctime>
#include <fstream>
#include <limits>
#include <system_error>
#include <utility>

#include <sys/stat.h>

namespace dsync::archive::detail {
namespace fs = std::filesystem;
namespace {

constexpr std::uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr std::uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr std::uint32_t kEndOfCentralDirSignature = 0x06054b50;

constexpr std::size_t kLocalHeaderSize = 30;
constexpr std::size_t kCentralHeaderSize = 46;
constexpr std::size_t kEndOfCentralDirSize = 22;
constexpr std::size_t kMaxCommentSize = 0xffff;

constexpr std::uint16_t kVersionNeeded = 20;
constexpr std::uint16_t kVersionMadeByUnix = (3 << 8) | 20;
constexpr std::uint16_t kFlagEncrypted = 0x0001;
constexpr std::uint16_t kFlagUtf8 = 0x0800;
constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflate = 8;

constexpr std::uint64_t kMax32 = std::numeric_limits<std::uint32_t>::max();
constexpr std::size_t kChunkSize = 64 * 1024;

void put16(std::string& out, std::uint16_t value) {
    out.push_back(static_cast<char>(value & 0xff));
    out.push_back(static_cast<char>((value >> 8) & 0xff));
}

void put32(std::string& out, std::uint32_t value) {
    put16(out, static_cast<std::uint16_t>(value & 0xffff));
    put16(out, static_cast<std::uint16_t>(value >> 16));
}

std::uint16_t get16(const unsigned char* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t get32(const unsigned char* p) {
    return static_cast<std::uint32_t>(get16(p)) | (static_cast<std::uint32_t>(get16(p + 2)) << 16);
}

struct DosDateTime {
    std::uint16_t time = 0;
    std::uint16_t date = (1 << 5) | 1; // 1980-01-01
};

DosDateTime to_dos(std::time_t value) {
    std::tm local{};
    if (localtime_r(&value, &local) == nullptr || local.tm_year < 80) {
        return {};
    }
    DosDateTime dos;
    dos.time = static_cast<std::uint16_t>((local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
    dos.date = static_cast<std::uint16_t>(((local.tm_year - 80) << 9) | ((local.tm_mon + 1) << 5) | local.tm_mday);
    return dos;
}

std::time_t from_dos(std::uint16_t time, std::uint16_t date) {
    std::tm local{};
    local.tm_year = ((date >> 9) & 0x7f) + 80;
    local.tm_mon = ((date >> 5) & 0x0f) - 1;
    local.tm_mday = date & 0x1f;
    local.tm_hour = (time >> 11) & 0x1f;
    local.tm_min = (time >> 5) & 0x3f;
    local.tm_sec = (time & 0x1f) * 2;
    local.tm_isdst = -1;
    return std::mktime(&local);
}

class DeflateStream {
public:
    DeflateStream() { ok_ = deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) == Z_OK; }
    ~DeflateStream() { if (ok_) deflateEnd(&stream_); }
    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;

    bool ok() const noexcept { return ok_; }
    z_stream& get() noexcept { return stream_; }

private:
    z_stream stream_{};
    bool ok_ = false;
};

class InflateStream {
public:
    InflateStream() { ok_ = inflateInit2(&stream_, -MAX_WBITS) == Z_OK; }
    ~InflateStream() { if (ok_) inflateEnd(&stream_); }
    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    bool ok() const noexcept { return ok_; }
    z_stream& get() noexcept { return stream_; }

private:
    z_stream stream_{};
    bool ok_ = false;
};

// ──────────────────────────────────────────────────────────
// Writing
// ──────────────────────────────────────────────────────────

struct CentralRecord {
    std::string name;
    std::uint16_t method = kMethodStored;
    DosDateTime stamp;
    std::uint32_t crc = 0;
    std::uint32_t compressed_size = 0;
    std::uint32_t uncompressed_size = 0;
    std::uint32_t external_attributes = 0;
    std::uint32_t local_offset = 0;
};

std::string local_header(const CentralRecord& record) {
    std::string out;
    put32(out, kLocalHeaderSignature);
    put16(out, kVersionNeeded);
    put16(out, kFlagUtf8);
    put16(out, record.method);
    put16(out, record.stamp.time);
    put16(out, record.stamp.date);
    put32(out, record.crc);
    put32(out, record.compressed_size);
    put32(out, record.uncompressed_size);
    put16(out, static_cast<std::uint16_t>(record.name.size()));
    put16(out, 0);
    out += record.name;
    return out;
}

std::string central_header(const CentralRecord& record) {
    std::string out;
    put32(out, kCentralHeaderSignature);
    put16(out, kVersionMadeByUnix);
    put16(out, kVersionNeeded);
    put16(out, kFlagUtf8);
    put16(out, record.method);
    put16(out, record.stamp.time);
    put16(out, record.stamp.date);
    put32(out, record.crc);
    put32(out, record.compressed_size);
    put32(out, record.uncompressed_size);
    put16(out, static_cast<std::uint16_t>(record.name.size()));
    put16(out, 0); // extra
    put16(out, 0); // comment
    put16(out, 0); // disk
    put16(out, 0); // internal attributes
    put32(out, record.external_attributes);
    put32(out, record.local_offset);
    out += record.name;
    return out;
}

class ZipWriter {
public:
    explicit ZipWriter(std::ofstream& out) : out_(out) {}

    Outcome<void> add(const TreeEntry& entry) {
        if (entry.type == TreeEntry::Type::Directory) {
            return add_directory(entry);
        }

        fs::path source = entry.absolute;
        std::uint64_t size = entry.size;
        if (entry.type == TreeEntry::Type::Symlink) {
            std::error_code ec;
            const auto target = fs::status(entry.absolute, ec);
            if (ec || !fs::is_regular_file(target)) {
                spdlog::warn("zip: skipping symlink {} (target is not a regular file)", entry.relative);
                return succeed();
            }
            size = fs::file_size(entry.absolute, ec);
            if (ec) {
                return fail(ErrorKind::PackError, "Cannot stat " + entry.absolute.string());
            }
        }
        return add_file(entry, source, size);
    }

    Outcome<void> finish() {
        if (records_.size() >= 0xffff) {
            return fail(ErrorKind::PackError, "Too many entries for zip without Zip64");
        }
        const auto directory_offset = position();
        std::string directory;
        for (const auto& record : records_) {
            directory += central_header(record);
        }
        if (directory_offset + directory.size() > kMax32) {
            return fail(ErrorKind::PackError, "Archive exceeds 4 GiB; zip output has no Zip64 support");
        }

        std::string end;
        put32(end, kEndOfCentralDirSignature);
        put16(end, 0);
        put16(end, 0);
        put16(end, static_cast<std::uint16_t>(records_.size()));
        put16(end, static_cast<std::uint16_t>(records_.size()));
        put32(end, static_cast<std::uint32_t>(directory.size()));
        put32(end, static_cast<std::uint32_t>(directory_offset));
        put16(end, 0);

        out_.write(directory.data(), static_cast<std::streamsize>(directory.size()));
        out_.write(end.data(), static_cast<std::streamsize>(end.size()));
        if (!out_) {
            return fail(ErrorKind::PackError, "Write failed for zip central directory");
        }
        return succeed();
    }

private:
    std::uint64_t position() { return static_cast<std::uint64_t>(out_.tellp()); }

    Outcome<std::uint32_t> begin_record(CentralRecord& record) {
        const auto offset = position();
        if (offset > kMax32) {
            return fail<std::uint32_t>(ErrorKind::PackError,
                                       "Archive exceeds 4 GiB; zip output has no Zip64 support");
        }
        record.local_offset = static_cast<std::uint32_t>(offset);
        const std::string header = local_header(record);
        out_.write(header.data(), static_cast<std::streamsize>(header.size()));
        if (!out_) {
            return fail<std::uint32_t>(ErrorKind::PackError, "Write failed for " + record.name);
        }
        return succeed(record.local_offset);
    }

    Outcome<void> add_directory(const TreeEntry& entry) {
        CentralRecord record;
        record.name = entry.relative + "/";
        record.stamp = to_dos(entry.modified_time);
        const auto mode = S_IFDIR | (static_cast<std::uint32_t>(entry.perms) & 07777u);
        record.external_attributes = (mode << 16) | 0x10; // MS-DOS directory bit
        if (auto res = begin_record(record); res.is_error()) {
            return res.forward_error<void>();
        }
        records_.push_back(std::move(record));
        return succeed();
    }

    Outcome<void> add_file(const TreeEntry& entry, const fs::path& source, std::uint64_t size) {
        if (size > kMax32) {
            return fail(ErrorKind::PackError, "File exceeds 4 GiB; zip output has no Zip64 support: " + entry.relative);
        }

        std::ifstream input(source, std::ios::binary);
        if (!input) {
            return fail(ErrorKind::PackError, "Cannot read " + source.string());
        }

        CentralRecord record;
        record.name = entry.relative;
        record.method = kMethodDeflate;
        record.stamp = to_dos(entry.modified_time);
        const auto mode = S_IFREG | (static_cast<std::uint32_t>(entry.perms) & 07777u);
        record.external_attributes = mode << 16;
        if (auto res = begin_record(record); res.is_error()) {
            return res.forward_error<void>();
        }
        const auto data_start = position();

        DeflateStream deflate;
        if (!deflate.ok()) {
            return fail(ErrorKind::PackError, "Cannot initialise deflate");
        }
        z_stream& zs = deflate.get();

        std::vector<char> in_buffer(kChunkSize);
        std::vector<char> out_buffer(kChunkSize);
        uLong crc = crc32(0L, Z_NULL, 0);
        std::uint64_t consumed = 0;
        int flush = Z_NO_FLUSH;
        do {
            input.read(in_buffer.data(), static_cast<std::streamsize>(in_buffer.size()));
            const auto got = static_cast<std::size_t>(input.gcount());
            if (input.bad()) {
                return fail(ErrorKind::PackError, "Read failed for " + source.string());
            }
            consumed += got;
            crc = crc32(crc, reinterpret_cast<const Bytef*>(in_buffer.data()), static_cast<uInt>(got));
            flush = input.eof() ? Z_FINISH : Z_NO_FLUSH;

            zs.next_in = reinterpret_cast<Bytef*>(in_buffer.data());
            zs.avail_in = static_cast<uInt>(got);
            do {
                zs.next_out = reinterpret_cast<Bytef*>(out_buffer.data());
                zs.avail_out = static_cast<uInt>(out_buffer.size());
                if (::deflate(&zs, flush) == Z_STREAM_ERROR) {
                    return fail(ErrorKind::PackError, "deflate failed for " + source.string());
                }
                const auto produced = out_buffer.size() - zs.avail_out;
                out_.write(out_buffer.data(), static_cast<std::streamsize>(produced));
                if (!out_) {
                    return fail(ErrorKind::PackError, "Write failed for " + record.name);
                }
            } while (zs.avail_out == 0);
        } while (flush != Z_FINISH);

        if (consumed != size) {
            return fail(ErrorKind::PackError, "File changed while packing: " + source.string());
        }

        const auto data_end = position();
        if (data_end - data_start > kMax32) {
            return fail(ErrorKind::PackError, "Compressed entry exceeds 4 GiB: " + entry.relative);
        }
        record.crc = static_cast<std::uint32_t>(crc);
        record.compressed_size = static_cast<std::uint32_t>(data_end - data_start);
        record.uncompressed_size = static_cast<std::uint32_t>(size);

        // Sizes are only known after streaming; patch the local header in place
        std::string patch;
        put32(patch, record.crc);
        put32(patch, record.compressed_size);
        put32(patch, record.uncompressed_size);
        out_.seekp(static_cast<std::streamoff>(record.local_offset + 14));
        out_.write(patch.data(), static_cast<std::streamsize>(patch.size()));
        out_.seekp(static_cast<std::streamoff>(data_end));
        if (!out_) {
            return fail(ErrorKind::PackError, "Write failed for " + record.name);
        }

        records_.push_back(std::move(record));
        return succeed();
    }

    std::ofstream& out_;
    std::vector<CentralRecord> records_;
};

// ──────────────────────────────────────────────────────────
// Reading
// ──────────────────────────────────────────────────────────

struct CentralEntry {
    std::string name;
    std::uint16_t version_made_by = 0;
    std::uint16_t flags = 0;
    std::uint16_t method = 0;
    std::uint16_t time = 0;
    std::uint16_t date = 0;
    std::uint32_t crc = 0;
    std::uint64_t compressed_size = 0;
    std::uint64_t uncompressed_size = 0;
    std::uint32_t external_attributes = 0;
    std::uint64_t local_offset = 0;

    std::uint32_t unix_mode() const {
        return (version_made_by >> 8) == 3 ? external_attributes >> 16 : 0;
    }
};

class ZipReader {
public:
    ZipReader(std::ifstream& in, std::uint64_t file_size, fs::path dest)
        : in_(in), file_size_(file_size), dest_(std::move(dest)) {}

    Outcome<void> run() {
        auto entries = read_central_directory();
        if (entries.is_error()) {
            return entries.forward_error<void>();
        }
        for (const auto& entry : entries.value()) {
            if (auto res = extract(entry); res.is_error()) {
                return res;
            }
        }
        return succeed();
    }

private:
    Outcome<void> read_at(std::uint64_t offset, char* data, std::size_t size) {
        if (offset + size > file_size_) {
            return fail(ErrorKind::UnpackError, "Truncated zip archive");
        }
        in_.clear();
        in_.seekg(static_cast<std::streamoff>(offset));
        in_.read(data, static_cast<std::streamsize>(size));
        if (static_cast<std::size_t>(in_.gcount()) != size) {
            return fail(ErrorKind::UnpackError, "Truncated zip archive");
        }
        return succeed();
    }

    Outcome<std::vector<CentralEntry>> read_central_directory() {
        using Entries = std::vector<CentralEntry>;
        if (file_size_ < kEndOfCentralDirSize) {
            return fail<Entries>(ErrorKind::UnpackError, "Not a zip archive (too small)");
        }

        const auto tail_size = static_cast<std::size_t>(
            std::min<std::uint64_t>(file_size_, kEndOfCentralDirSize + kMaxCommentSize));
        std::string tail(tail_size, '\0');
        if (auto res = read_at(file_size_ - tail_size, tail.data(), tail.size()); res.is_error()) {
            return res.forward_error<Entries>();
        }

        const auto* bytes = reinterpret_cast<const unsigned char*>(tail.data());
        std::size_t eocd = std::string::npos;
        for (std::size_t i = tail_size - kEndOfCentralDirSize + 1; i-- > 0;) {
            if (get32(bytes + i) == kEndOfCentralDirSignature) {
                eocd = i;
                break;
            }
        }
        if (eocd == std::string::npos) {
            return fail<Entries>(ErrorKind::UnpackError, "Not a zip archive (no end of central directory)");
        }

        const std::uint16_t count = get16(bytes + eocd + 10);
        const std::uint32_t directory_size = get32(bytes + eocd + 12);
        const std::uint32_t directory_offset = get32(bytes + eocd + 16);
        if (count == 0xffff || directory_offset == kMax32) {
            return fail<Entries>(ErrorKind::UnpackError, "Zip64 archives are not supported");
        }

        std::string directory(directory_size, '\0');
        if (auto res = read_at(directory_offset, directory.data(), directory.size()); res.is_error()) {
            return res.forward_error<Entries>();
        }

        Entries entries;
        entries.reserve(count);
        const auto* p = reinterpret_cast<const unsigned char*>(directory.data());
        std::size_t pos = 0;
        for (std::uint16_t i = 0; i < count; ++i) {
            if (pos + kCentralHeaderSize > directory.size() || get32(p + pos) != kCentralHeaderSignature) {
                return fail<Entries>(ErrorKind::UnpackError, "Corrupt zip central directory");
            }
            CentralEntry entry;
            entry.version_made_by = get16(p + pos + 4);
            entry.flags = get16(p + pos + 8);
            entry.method = get16(p + pos + 10);
            entry.time = get16(p + pos + 12);
            entry.date = get16(p + pos + 14);
            entry.crc = get32(p + pos + 16);
            entry.compressed_size = get32(p + pos + 20);
            entry.uncompressed_size = get32(p + pos + 24);
            const std::uint16_t name_length = get16(p + pos + 28);
            const std::uint16_t extra_length = get16(p + pos + 30);
            const std::uint16_t comment_length = get16(p + pos + 32);
            entry.external_attributes = get32(p + pos + 38);
            entry.local_offset = get32(p + pos + 42);

            const std::size_t record_size = kCentralHeaderSize + name_length + extra_length + comment_length;
            if (pos + record_size > directory.size()) {
                return fail<Entries>(ErrorKind::UnpackError, "Corrupt zip central directory");
            }
            entry.name.assign(directory.data() + pos + kCentralHeaderSize, name_length);
            pos += record_size;
            entries.push_back(std::move(entry));
        }
        return succeed(std::move(entries));
    }

    Outcome<std::uint64_t> locate_data(const CentralEntry& entry) {
        char header[kLocalHeaderSize];
        if (auto res = read_at(entry.local_offset, header, sizeof(header)); res.is_error()) {
            return res.forward_error<std::uint64_t>();
        }
        const auto* p = reinterpret_cast<const unsigned char*>(header);
        if (get32(p) != kLocalHeaderSignature) {
            return fail<std::uint64_t>(ErrorKind::UnpackError, "Corrupt zip local header for " + entry.name);
        }
        const std::uint64_t start = entry.local_offset + kLocalHeaderSize + get16(p + 26) + get16(p + 28);
        if (start + entry.compressed_size > file_size_) {
            return fail<std::uint64_t>(ErrorKind::UnpackError, "Truncated zip entry " + entry.name);
        }
        return succeed(start);
    }

    // Decodes one entry, handing each decompressed chunk to `sink`
    template<typename Sink>
    Outcome<void> decode(const CentralEntry& entry, Sink&& sink) {
        if (entry.flags & kFlagEncrypted) {
            return fail(ErrorKind::UnpackError, "Encrypted zip entries are not supported: " + entry.name);
        }
        if (entry.method != kMethodStored && entry.method != kMethodDeflate) {
            return fail(ErrorKind::UnpackError, "Unsupported zip compression method for " + entry.name);
        }
        auto start = locate_data(entry);
        if (start.is_error()) {
            return start.forward_error<void>();
        }

        in_.clear();
        in_.seekg(static_cast<std::streamoff>(start.value()));

        std::vector<char> in_buffer(kChunkSize);
        std::vector<char> out_buffer(kChunkSize);
        uLong crc = crc32(0L, Z_NULL, 0);
        std::uint64_t produced_total = 0;
        std::uint64_t remaining = entry.compressed_size;

        auto emit = [&](const char* data, std::size_t size) -> Outcome<void> {
            crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
            produced_total += size;
            if (produced_total > entry.uncompressed_size) {
                return fail(ErrorKind::UnpackError, "Zip entry larger than declared: " + entry.name);
            }
            return sink(data, size);
        };

        if (entry.method == kMethodStored) {
            while (remaining > 0) {
                const auto step = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, in_buffer.size()));
                in_.read(in_buffer.data(), static_cast<std::streamsize>(step));
                if (static_cast<std::size_t>(in_.gcount()) != step) {
                    return fail(ErrorKind::UnpackError, "Truncated zip entry " + entry.name);
                }
                if (auto res = emit(in_buffer.data(), step); res.is_error()) {
                    return res;
                }
                remaining -= step;
            }
        } else {
            InflateStream inflate;
            if (!inflate.ok()) {
                return fail(ErrorKind::UnpackError, "Cannot initialise inflate");
            }
            z_stream& zs = inflate.get();
            int rc = Z_OK;
            while (rc != Z_STREAM_END) {
                if (zs.avail_in == 0) {
                    if (remaining == 0) {
                        return fail(ErrorKind::UnpackError, "Truncated deflate stream in " + entry.name);
                    }
                    const auto step = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, in_buffer.size()));
                    in_.read(in_buffer.data(), static_cast<std::streamsize>(step));
                    if (static_cast<std::size_t>(in_.gcount()) != step) {
                        return fail(ErrorKind::UnpackError, "Truncated zip entry " + entry.name);
                    }
                    remaining -= step;
                    zs.next_in = reinterpret_cast<Bytef*>(in_buffer.data());
                    zs.avail_in = static_cast<uInt>(step);
                }
                zs.next_out = reinterpret_cast<Bytef*>(out_buffer.data());
                zs.avail_out = static_cast<uInt>(out_buffer.size());
                rc = ::inflate(&zs, Z_NO_FLUSH);
                if (rc != Z_OK && rc != Z_STREAM_END) {
                    return fail(ErrorKind::UnpackError, "Corrupt deflate data in " + entry.name);
                }
                const auto produced = out_buffer.size() - zs.avail_out;
                if (produced > 0) {
                    if (auto res = emit(out_buffer.data(), produced); res.is_error()) {
                        return res;
                    }
                }
            }
        }

        if (produced_total != entry.uncompressed_size) {
            return fail(ErrorKind::UnpackError, "Size mismatch for zip entry " + entry.name);
        }
        if (static_cast<std::uint32_t>(crc) != entry.crc) {
            return fail(ErrorKind::UnpackError, "CRC mismatch for zip entry " + entry.name);
        }
        return succeed();
    }

    Outcome<void> extract(const CentralEntry& entry) {
        std::string name = entry.name;
        std::replace(name.begin(), name.end(), '\\', '/');
        const bool is_directory = !name.empty() && name.back() == '/';
        while (!name.empty() && name.back() == '/') {
            name.pop_back();
        }
        if (name.empty()) {
            return succeed();
        }

        auto target = resolve_extract_target(dest_, name);
        if (target.is_error()) {
            return target.forward_error<void>();
        }
        const fs::path path = target.value();
        const std::uint32_t mode = entry.unix_mode();
        const auto perms = static_cast<fs::perms>(mode & 07777);
        std::error_code ec;

        if (is_directory || S_ISDIR(mode)) {
            clear_target(path);
            fs::create_directories(path, ec);
            if (ec) {
                return fail(ErrorKind::UnpackError, "Cannot create directory " + path.string());
            }
            if (mode != 0) {
                fs::permissions(path, perms | fs::perms::owner_all, fs::perm_options::replace, ec);
            }
            return succeed();
        }

        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return fail(ErrorKind::UnpackError, "Cannot create directory " + path.parent_path().string());
        }

        if (S_ISLNK(mode)) {
            // Info-ZIP stores the link target as the entry content
            std::string link_target;
            auto res = decode(entry, [&](const char* data, std::size_t size) {
                link_target.append(data, size);
                return succeed();
            });
            if (res.is_error()) {
                return res;
            }
            clear_target(path);
            fs::create_symlink(link_target, path, ec);
            if (ec) {
                return fail(ErrorKind::UnpackError, "Cannot create symlink " + path.string());
            }
            return succeed();
        }

        clear_target(path);
        {
            std::ofstream output(path, std::ios::binary | std::ios::trunc);
            if (!output) {
                return fail(ErrorKind::UnpackError, "Cannot create " + path.string());
            }
            auto res = decode(entry, [&](const char* data, std::size_t size) -> Outcome<void> {
                output.write(data, static_cast<std::streamsize>(size));
                if (!output) {
                    return fail(ErrorKind::UnpackError, "Write failed for " + path.string());
                }
                return succeed();
            });
            if (res.is_error()) {
                return res;
            }
        }

        if (mode != 0) {
            fs::permissions(path, perms, fs::perm_options::replace, ec);
            if (ec) {
                spdlog::warn("Cannot set permissions on {}: {}", path.string(), ec.message());
            }
        }
        fs::last_write_time(path, from_time_t(from_dos(entry.time, entry.date)), ec);
        return succeed();
    }

    std::ifstream& in_;
    std::uint64_t file_size_;
    fs::path dest_;
};

} // namespace

Outcome<void> write_zip(const std::vector<TreeEntry>& entries, const fs::path& output) {
    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        return fail(ErrorKind::PackError, "Cannot create " + output.string());
    }

    ZipWriter writer(out);
    for (const auto& entry : entries) {
        if (auto res = writer.add(entry); res.is_error()) {
            return res;
        }
    }
    if (auto res = writer.finish(); res.is_error()) {
        return res;
    }
    out.close();
    if (!out) {
        return fail(ErrorKind::PackError, "Cannot finalize " + output.string());
    }
    return succeed();
}

Outcome<void> read_zip(const fs::path& archive, const fs::path& dest) {
    std::error_code ec;
    const auto size = fs::file_size(archive, ec);
    if (ec) {
        return fail(ErrorKind::UnpackError, "Cannot stat " + archive.string());
    }
    std::ifstream in(archive, std::ios::binary);
    if (!in) {
        return fail(ErrorKind::UnpackError, "Cannot open " + archive.string());
    }
    ZipReader reader(in, size, dest);
    return reader.run();
}

} // namespace dsync::archive::detail
