#include "collwatch/localefile.h"
#include "collwatch/error.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace collwatch::localefile;

namespace {

namespace fs = std::filesystem;

class LocaleTree : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() / "collwatch-localefile-tests" /
                (std::to_string(::getpid()) + "-" + info->test_suite_name() + "." + info->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path add_locale(const std::string& dir_name, const std::string& content = "collate") {
        auto dir = root_ / dir_name;
        fs::create_directories(dir);
        auto file = dir / collate_file_name;
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

    fs::path root_;
};

} // namespace

// --- mangled_name ---

TEST(LocaleFileMangle, LowercasesAndStripsCodeset) {
    EXPECT_EQ(mangled_name("fr_FR.UTF-8"), "fr_FR.utf8");
    EXPECT_EQ(mangled_name("en_US.ISO8859-1"), "en_US.iso88591");
}

TEST(LocaleFileMangle, AlreadyMangledIsStable) {
    EXPECT_EQ(mangled_name("fr_FR.utf8"), "fr_FR.utf8");
}

TEST(LocaleFileMangle, KeepsModifier) {
    EXPECT_EQ(mangled_name("de_DE.ISO-8859-15@euro"), "de_DE.iso885915@euro");
}

TEST(LocaleFileMangle, BaseNameIsUntouched) {
    EXPECT_EQ(mangled_name("sr_RS.UTF-8"), "sr_RS.utf8");
    EXPECT_EQ(mangled_name("EN_us.Utf_8"), "EN_us.utf8");
}

TEST(LocaleFileMangle, NoCodesetReturnsNullopt) {
    EXPECT_FALSE(mangled_name("fr_FR").has_value());
    EXPECT_FALSE(mangled_name("POSIX").has_value());
}

// --- resolve ---

TEST_F(LocaleTree, ResolvesDirectName) {
    auto expected = add_locale("fr_FR.UTF-8");
    EXPECT_EQ(resolve(root_, "fr_FR.UTF-8"), expected);
}

TEST_F(LocaleTree, FallsBackToMangledName) {
    auto expected = add_locale("fr_FR.utf8");
    EXPECT_EQ(resolve(root_, "fr_FR.UTF-8"), expected);
}

TEST_F(LocaleTree, DirectNameWinsOverMangled) {
    auto direct = add_locale("fr_FR.UTF-8", "direct");
    add_locale("fr_FR.utf8", "mangled");
    EXPECT_EQ(resolve(root_, "fr_FR.UTF-8"), direct);
}

TEST_F(LocaleTree, SameIdentifierResolvesUnderEitherConvention) {
    // Two trees with equivalent content, one per naming convention.
    auto bsd_style = add_locale("bsd/de_DE.UTF-8");
    auto glibc_style = add_locale("glibc/de_DE.utf8");

    EXPECT_EQ(resolve(root_ / "bsd", "de_DE.UTF-8"), bsd_style);
    EXPECT_EQ(resolve(root_ / "glibc", "de_DE.UTF-8"), glibc_style);
}

TEST_F(LocaleTree, MissingLocaleThrowsNamingTheLocale) {
    add_locale("en_US.utf8");
    try {
        resolve(root_, "fr_FR.UTF-8");
        FAIL() << "expected ResolutionError";
    } catch (const collwatch::ResolutionError& e) {
        EXPECT_NE(std::string(e.what()).find("fr_FR.UTF-8"), std::string::npos);
    }
}

TEST_F(LocaleTree, DirectoryWithoutCollateFileIsNotAMatch) {
    fs::create_directories(root_ / "fr_FR.utf8");
    EXPECT_THROW(resolve(root_, "fr_FR.utf8"), collwatch::ResolutionError);
}

TEST_F(LocaleTree, NoCodesetMeansSingleAttempt) {
    EXPECT_THROW(resolve(root_, "fr_FR"), collwatch::ResolutionError);
    auto expected = add_locale("fr_FR");
    EXPECT_EQ(resolve(root_, "fr_FR"), expected);
}

TEST_F(LocaleTree, EmptyIdentifierThrows) {
    EXPECT_THROW(resolve(root_, ""), collwatch::ResolutionError);
}

// --- search roots ---

TEST(LocaleFileSearchRoots, DefaultListStartsWithGlibcLocation) {
    auto roots = default_search_roots();
    ASSERT_FALSE(roots.empty());
    EXPECT_EQ(roots.front(), fs::path("/usr/lib/locale"));
}

TEST_F(LocaleTree, FindSearchRootPicksFirstExisting) {
    fs::create_directories(root_ / "second");
    fs::create_directories(root_ / "third");
    auto found = find_search_root({root_ / "first", root_ / "second", root_ / "third"});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, root_ / "second");
}

TEST_F(LocaleTree, FindSearchRootIgnoresPlainFiles) {
    std::ofstream(root_ / "not_a_dir") << "x";
    EXPECT_FALSE(find_search_root({root_ / "not_a_dir", root_ / "missing"}).has_value());
}
