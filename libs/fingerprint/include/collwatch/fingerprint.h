#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>

namespace collwatch::fingerprint {

// Block size used when streaming a file through the digest.
inline constexpr size_t block_size = 64 * 1024;

// ProbeResult is the fingerprint of one locale data file.
struct ProbeResult {
    std::string path;     // file that was read
    int64_t modified = 0; // modification time, seconds since the Unix epoch
    std::string checksum; // lower-case hex SHA-256 of the full contents

    bool operator==(const ProbeResult&) const = default;
};

// sha256_hex digests everything remaining in r, block by block.
// Throws IoError if the stream goes bad before end of input.
std::string sha256_hex(std::istream& r);

// probe reads the modification time of path and digests its contents.
// Throws IoError if the file cannot be opened or read completely.
ProbeResult probe(const std::filesystem::path& path);

} // namespace collwatch::fingerprint
