#include "collwatch/fingerprint.h"
#include "collwatch/error.h"

#include <openssl/evp.h>

#include <chrono>
#include <format>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace collwatch::fingerprint {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string hex_encode(const unsigned char* data, unsigned int len) {
    std::ostringstream ss;
    for (unsigned int i = 0; i < len; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    return ss.str();
}

// Streams r into the digest and returns the number of bytes consumed.
std::string digest_stream(std::istream& r, uint64_t& consumed) {
    MdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("fingerprint: cannot initialise SHA-256");

    std::vector<char> buf(block_size);
    consumed = 0;
    while (r) {
        r.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = r.gcount();
        if (n <= 0) break;
        if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1)
            throw std::runtime_error("fingerprint: SHA-256 update failed");
        consumed += static_cast<uint64_t>(n);
    }
    if (r.bad())
        throw IoError(std::format("read failed after {} bytes", consumed));

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1)
        throw std::runtime_error("fingerprint: SHA-256 finalise failed");
    return hex_encode(md, md_len);
}

} // namespace

std::string sha256_hex(std::istream& r) {
    uint64_t consumed = 0;
    return digest_stream(r, consumed);
}

ProbeResult probe(const fs::path& path) {
    std::error_code ec;
    auto ftime = fs::last_write_time(path, ec);
    if (ec)
        throw IoError(std::format("stat {}: {}", path.string(), ec.message()));
    auto size = fs::file_size(path, ec);
    if (ec)
        throw IoError(std::format("stat {}: {}", path.string(), ec.message()));

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        throw IoError(std::format("cannot open {}", path.string()));

    ProbeResult result;
    result.path = path.string();
    auto sctp = std::chrono::clock_cast<std::chrono::system_clock>(ftime);
    result.modified = std::chrono::duration_cast<std::chrono::seconds>(
        sctp.time_since_epoch()).count();

    uint64_t consumed = 0;
    try {
        result.checksum = digest_stream(f, consumed);
    } catch (const IoError& e) {
        throw IoError(std::format("reading {}: {}", path.string(), e.what()));
    }
    // A short or long read means the file was rewritten underneath us.
    if (consumed != size)
        throw IoError(std::format("{} changed size while reading ({} of {} bytes)",
                                  path.string(), consumed, size));
    return result;
}

} // namespace collwatch::fingerprint
