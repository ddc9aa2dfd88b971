#include "../tools/collwatch/options.h"
#include "../tools/collwatch/report.h"

#include "collwatch/error.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

namespace fs = std::filesystem;
using collwatch::UsageError;

// One directory per process and test, so parallel test runs never share files.
fs::path unique_test_root() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    const auto unique = fs::temp_directory_path() / "collwatch-options-tests" /
                        (std::to_string(::getpid()) + "-" + info->test_suite_name() + "." + info->name());
    fs::remove_all(unique);
    fs::create_directories(unique);
    return unique;
}

void write_text_file(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    ASSERT_TRUE(out.is_open());
    out << text;
}

}  // namespace

TEST(CollwatchOptionsTests, DefaultsToDryRunWithStandardTable) {
    auto opts = parse_options({"dbname=app"});
    EXPECT_EQ(opts.conninfo, "dbname=app");
    EXPECT_FALSE(opts.execute);
    EXPECT_FALSE(opts.assume_good);
    EXPECT_TRUE(opts.locale_path.empty());
    EXPECT_EQ(opts.table, "lc_collate_checksums");
    EXPECT_EQ(opts.schema, "public");
}

TEST(CollwatchOptionsTests, ParsesAllFlags) {
    auto opts = parse_options({"--now", "--assume-good", "--locale-path", "/opt/locale",
                               "--table", "sums", "--schema", "ops", "--report", "r.json",
                               "-v", "postgresql://localhost/app"});
    EXPECT_TRUE(opts.execute);
    EXPECT_TRUE(opts.assume_good);
    EXPECT_EQ(opts.locale_path, "/opt/locale");
    EXPECT_EQ(opts.table, "sums");
    EXPECT_EQ(opts.schema, "ops");
    EXPECT_EQ(opts.report_path, "r.json");
    EXPECT_EQ(opts.verbosity, 1);
    EXPECT_EQ(opts.conninfo, "postgresql://localhost/app");
}

TEST(CollwatchOptionsTests, MissingConnectionStringIsUsageError) {
    EXPECT_THROW(parse_options({}), UsageError);
    EXPECT_THROW(parse_options({"--now"}), UsageError);
}

TEST(CollwatchOptionsTests, HelpDoesNotNeedConnectionString) {
    EXPECT_TRUE(parse_options({"--help"}).help);
}

TEST(CollwatchOptionsTests, FlagWithoutValueIsUsageError) {
    EXPECT_THROW(parse_options({"dbname=app", "--table"}), UsageError);
}

TEST(CollwatchOptionsTests, UnknownFlagIsUsageError) {
    EXPECT_THROW(parse_options({"dbname=app", "--force"}), UsageError);
}

TEST(CollwatchOptionsTests, TestRootIsPrivateToProcessAndTest) {
    const auto root = unique_test_root();
    const auto name = root.filename().string();
    EXPECT_EQ(name, std::to_string(::getpid()) + "-CollwatchOptionsTests.TestRootIsPrivateToProcessAndTest");
    EXPECT_TRUE(fs::is_directory(root));
    EXPECT_TRUE(fs::is_empty(root));
    fs::remove_all(root);
}

TEST(CollwatchOptionsTests, ConfigFileFillsDefaultsAndFlagsWin) {
    const auto root = unique_test_root();
    const auto config = root / "collwatch.json";
    write_text_file(config, R"({"locale_path": "/cfg/locale", "table": "cfg_table",
                               "schema": "cfg_schema", "assume_good": true})");

    auto opts = parse_options({"--config", config.string(), "--table", "flag_table", "dbname=app"});
    EXPECT_EQ(opts.locale_path, "/cfg/locale");
    EXPECT_EQ(opts.table, "flag_table");
    EXPECT_EQ(opts.schema, "cfg_schema");
    EXPECT_TRUE(opts.assume_good);
    fs::remove_all(root);
}

TEST(CollwatchOptionsTests, MalformedConfigIsUsageError) {
    const auto root = unique_test_root();
    const auto config = root / "broken.json";
    write_text_file(config, "{ not json");

    EXPECT_THROW(parse_options({"--config", config.string(), "dbname=app"}), UsageError);
    EXPECT_THROW(parse_options({"--config", (root / "missing.json").string(), "dbname=app"}), UsageError);
    fs::remove_all(root);
}

TEST(CollwatchReportTests, DescribesEveryLocale) {
    namespace plan = collwatch::plan;
    plan::Plan p;
    plan::LocaleDecision d;
    d.locale = "fr_FR.utf8";
    d.references = {{200, "fr_FR", "fr_FR.utf8"}};
    d.probe = {"/usr/lib/locale/fr_FR.utf8/LC_COLLATE", 1700000000, "5aee"};
    d.previous = plan::BaselineRecord{"fr_FR.utf8", d.probe.path, 1600000000, "0ld"};
    d.status = plan::LocaleStatus::Changed;
    d.remediate = true;
    d.write_baseline = true;
    p.locales.push_back(d);
    p.reindexed.push_back({"public", "a_idx"});
    p.statements.push_back(plan::reindex({"public", "a_idx"}));

    auto doc = build_report(p, "/usr/lib/locale", false);
    EXPECT_EQ(doc["mode"], "print");
    ASSERT_EQ(doc["locales"].size(), 1u);
    EXPECT_EQ(doc["locales"][0]["status"], "changed");
    EXPECT_EQ(doc["locales"][0]["previous"]["checksum"], "0ld");
    EXPECT_EQ(doc["reindex"][0]["name"], "a_idx");
    EXPECT_EQ(doc["statementCount"], 1);
}
