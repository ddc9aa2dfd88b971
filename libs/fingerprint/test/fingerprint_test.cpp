#include "collwatch/fingerprint.h"
#include "collwatch/error.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

using namespace collwatch::fingerprint;

namespace {

namespace fs = std::filesystem;

// One directory per process and test, so parallel test runs never share files.
fs::path unique_test_root() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    const auto unique = fs::temp_directory_path() / "collwatch-fingerprint-tests" /
                        (std::to_string(::getpid()) + "-" + info->test_suite_name() + "." + info->name());
    fs::remove_all(unique);
    fs::create_directories(unique);
    return unique;
}

fs::path write_file(const fs::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path;
}

} // namespace

// --- sha256_hex ---

TEST(Fingerprint, EmptyInputDigest) {
    std::istringstream s("");
    EXPECT_EQ(sha256_hex(s),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Fingerprint, KnownVectorAbc) {
    std::istringstream s("abc");
    EXPECT_EQ(sha256_hex(s),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Fingerprint, MultiBlockInputMatchesSingleShot) {
    // Spans several blocks and ends mid-block.
    std::string data(block_size * 3 + 17, '\0');
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<char>(i * 31 + 7);

    std::istringstream whole(data);
    auto digest = sha256_hex(whole);
    EXPECT_EQ(digest.size(), 64u);

    std::istringstream again(data);
    EXPECT_EQ(sha256_hex(again), digest);

    data.back() ^= 1;
    std::istringstream changed(data);
    EXPECT_NE(sha256_hex(changed), digest);
}

TEST(Fingerprint, DigestIsLowerCaseHex) {
    std::istringstream s("LC_COLLATE");
    auto digest = sha256_hex(s);
    for (char c : digest)
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
}

// --- probe ---

TEST(FingerprintProbe, CapturesPathTimeAndChecksum) {
    auto root = unique_test_root();
    auto file = write_file(root / "LC_COLLATE", "abc");

    auto mtime = std::chrono::clock_cast<std::chrono::file_clock>(
        std::chrono::sys_seconds{std::chrono::seconds{1700000000}});
    fs::last_write_time(file, mtime);

    auto r = probe(file);
    EXPECT_EQ(r.path, file.string());
    EXPECT_EQ(r.modified, 1700000000);
    EXPECT_EQ(r.checksum,
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    fs::remove_all(root);
}

TEST(FingerprintProbe, ContentChangeChangesChecksumOnly) {
    auto root = unique_test_root();
    auto file = write_file(root / "LC_COLLATE", "ordering v1");
    auto before = probe(file);

    write_file(file, "ordering v2");
    auto after = probe(file);
    EXPECT_EQ(before.path, after.path);
    EXPECT_NE(before.checksum, after.checksum);
    fs::remove_all(root);
}

TEST(FingerprintProbe, MissingFileThrowsIoError) {
    auto root = unique_test_root();
    EXPECT_THROW(probe(root / "LC_COLLATE"), collwatch::IoError);
    fs::remove_all(root);
}

TEST(FingerprintProbe, DirectoryIsNotReadable) {
    auto root = unique_test_root();
    EXPECT_THROW(probe(root), collwatch::IoError);
    fs::remove_all(root);
}
