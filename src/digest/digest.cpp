#include "dsync/digest/digest.hpp"
#include "dsync/core/shell.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <vector>

namespace dsync::digest {
namespace fs = std::filesystem;

namespace {

struct EvpContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

std::string to_hex(const unsigned char* data, unsigned int size) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (unsigned int i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string lowered(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_hex_digest(std::string_view token) {
    return token.size() == kHexLength &&
           std::all_of(token.begin(), token.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

class Sha256 {
public:
    Outcome<void> init() {
        ctx_.reset(EVP_MD_CTX_new());
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            return fail(ErrorKind::DigestError, "Cannot initialise SHA-256");
        }
        return succeed();
    }

    Outcome<void> update(const void* data, std::size_t size) {
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            return fail(ErrorKind::DigestError, "SHA-256 update failed");
        }
        return succeed();
    }

    Outcome<DigestValue> finish() {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), md, &length) != 1) {
            return fail<DigestValue>(ErrorKind::DigestError, "SHA-256 finalisation failed");
        }
        return succeed(DigestValue(to_hex(md, length)));
    }

private:
    EvpContext ctx_;
};

} // namespace

DigestValue::DigestValue(std::string hex) : hex_(lowered(std::move(hex))) {}

Outcome<DigestValue> compute(const fs::path& path, std::size_t chunk_size) {
    if (chunk_size == 0) {
        chunk_size = kDefaultChunkSize;
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return fail<DigestValue>(ErrorKind::DigestError, "Cannot open " + path.string() + " for hashing");
    }

    Sha256 sha;
    if (auto res = sha.init(); res.is_error()) {
        return res.forward_error<DigestValue>();
    }

    std::vector<char> buffer(chunk_size);
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto count = static_cast<std::size_t>(input.gcount());
        if (count == 0) {
            break;
        }
        if (auto res = sha.update(buffer.data(), count); res.is_error()) {
            return res.forward_error<DigestValue>();
        }
    }
    if (input.bad()) {
        return fail<DigestValue>(ErrorKind::DigestError, "Read failed while hashing " + path.string());
    }
    return sha.finish();
}

Outcome<DigestValue> digest_of(std::string_view data) {
    Sha256 sha;
    if (auto res = sha.init(); res.is_error()) {
        return res.forward_error<DigestValue>();
    }
    if (auto res = sha.update(data.data(), data.size()); res.is_error()) {
        return res.forward_error<DigestValue>();
    }
    return sha.finish();
}

bool compare(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(a[i])) ^
                                           std::tolower(static_cast<unsigned char>(b[i])));
    }
    return diff == 0;
}

bool compare(const DigestValue& a, const DigestValue& b) noexcept {
    return compare(std::string_view(a.hex()), std::string_view(b.hex()));
}

std::string remote_command(const std::string& remote_path) {
    const std::string quoted = shell_quote(remote_path);
    return "sha256sum -- " + quoted + " 2>/dev/null"
           " || shasum -a 256 -- " + quoted + " 2>/dev/null"
           " || openssl dgst -sha256 -r " + quoted;
}

Outcome<DigestValue> parse_remote_output(std::string_view output) {
    const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    const auto begin = std::find_if_not(output.begin(), output.end(), is_space);
    const auto end = std::find_if(begin, output.end(), is_space);
    std::string_view token(output.data() + (begin - output.begin()), static_cast<std::size_t>(end - begin));

    // sha256sum prefixes the line with '\' when the file name needed escaping
    if (!token.empty() && (token.front() == '\\' || token.front() == '*')) {
        token.remove_prefix(1);
    }
    // "hex *name" from binary mode when hex and name are glued
    if (const auto star = token.find('*'); star != std::string_view::npos) {
        token = token.substr(0, star);
    }

    if (!is_hex_digest(token)) {
        const std::string shown(output.substr(0, std::min<std::size_t>(output.size(), 80)));
        return fail<DigestValue>(ErrorKind::DigestError, "Unrecognised remote digest output: '" + shown + "'");
    }
    return succeed(DigestValue(std::string(token)));
}

} // namespace dsync::digest
