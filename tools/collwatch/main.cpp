#include "collwatch/error.h"
#include "collwatch/fingerprint.h"
#include "collwatch/localefile.h"
#include "collwatch/pgcatalog.h"
#include "collwatch/plan.h"
#include "collwatch/sqlgen.h"

#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <vector>

#include "../common/cli_logger.h"
#include "options.h"
#include "report.h"

namespace fs = std::filesystem;
using namespace collwatch;

static bool pick_locale_root(const Options& opts, fs::path& root) {
    if (!opts.locale_path.empty()) {
        std::error_code ec;
        if (!fs::is_directory(opts.locale_path, ec)) {
            LOGE("locale path is not a directory:", opts.locale_path);
            return false;
        }
        root = opts.locale_path;
        return true;
    }

    auto candidates = localefile::default_search_roots();
    auto found = localefile::find_search_root(candidates);
    if (!found) {
        std::string tried;
        for (const auto& c : candidates) tried += (tried.empty() ? "" : ", ") + c.string();
        LOGE("no locale directory found (tried " + tried + "); use --locale-path");
        return false;
    }
    root = *found;
    return true;
}

static void log_decisions(const plan::Plan& p) {
    for (const auto& d : p.locales) {
        LOGI(d.locale + ":", plan::locale_status_name(d.status),
             d.remediate ? "(rebuild)" : "", d.probe.path);
        LOGD(d.locale, "checksum", d.probe.checksum, "modified", d.probe.modified);
    }
    for (const auto& n : p.notices) LOGW(n);
}

static int run(const Options& opts, const fs::path& root) {
    auto conn = pgcatalog::Connection::open(opts.conninfo);
    LOGI("Connected to", conn.database(), "(server", std::to_string(conn.server_version()) + ")");

    pgcatalog::PgCatalog catalog(conn);
    plan::PlanOptions plan_opts{
        .assume_good_on_first_seen = opts.assume_good,
        .baseline_table = {opts.schema, opts.table},
    };

    auto probe = [&root](const std::string& locale) {
        auto path = localefile::resolve(root, locale);
        LOGD("probing", locale, "at", path.string());
        return fingerprint::probe(path);
    };

    auto p = plan::build_plan(catalog, probe, plan_opts);
    log_decisions(p);

    if (!opts.report_path.empty()) {
        write_report(opts.report_path, build_report(p, root.string(), opts.execute));
        LOGI("Report:", opts.report_path);
    }

    if (!opts.execute) {
        sqlgen::write_script(std::cout, p);
        return 0;
    }

    auto executed = pgcatalog::execute_plan(conn, p,
        [](const plan::Statement& stmt, size_t index, size_t total) {
            LOGI(std::format("[{}/{}]", index + 1, total), sqlgen::render(stmt));
        });
    if (executed == 0) {
        cli::log_plain("Nothing to do: all referenced collations match their recorded checksums");
    } else {
        cli::log_plain(std::format("Executed {} statements, rebuilt {} indexes",
                                   executed, p.reindexed.size()));
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    Options opts;
    try {
        opts = parse_options(args);
    } catch (const UsageError& e) {
        LOGE(e.what());
        std::cerr << usage_text();
        return 1;
    }

    if (opts.help) {
        std::cout << usage_text();
        return 0;
    }

    cli::set_verbosity(opts.verbosity);

    fs::path root;
    if (!pick_locale_root(opts, root)) return 1;
    LOGI("Locale data:", root.string());

    try {
        return run(opts, root);
    } catch (const ResolutionError& e) {
        LOGE("resolving locale:", e.what());
    } catch (const IoError& e) {
        LOGE("probing locale:", e.what());
    } catch (const DatabaseError& e) {
        LOGE("database:", e.what());
    } catch (const std::exception& e) {
        LOGE(e.what());
    }
    return 1;
}
