#include "options.h"

#include "collwatch/error.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <optional>

using json = nlohmann::json;
using collwatch::UsageError;

ConfigFile load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw UsageError("reading config " + path);

    ConfigFile cfg;
    try {
        json j = json::parse(f);
        if (!j.is_object()) throw UsageError("config " + path + ": expected a JSON object");
        if (j.contains("locale_path")) cfg.locale_path = j["locale_path"].get<std::string>();
        if (j.contains("table")) cfg.table = j["table"].get<std::string>();
        if (j.contains("schema")) cfg.schema = j["schema"].get<std::string>();
        if (j.contains("assume_good")) {
            cfg.assume_good = j["assume_good"].get<bool>();
            cfg.has_assume_good = true;
        }
    } catch (const json::exception& e) {
        throw UsageError("config " + path + ": " + e.what());
    }
    return cfg;
}

Options parse_options(const std::vector<std::string>& args) {
    Options opts;
    std::optional<std::string> locale_flag;
    std::optional<std::string> table_flag;
    std::optional<std::string> schema_flag;
    bool assume_good_flag = false;
    std::vector<std::string> positional;

    auto value_of = [&](size_t& i) -> std::string {
        if (i + 1 >= args.size()) throw UsageError(args[i] + " requires a value");
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        if (a == "--now") opts.execute = true;
        else if (a == "--assume-good") assume_good_flag = true;
        else if (a == "--locale-path") locale_flag = value_of(i);
        else if (a == "--table") table_flag = value_of(i);
        else if (a == "--schema") schema_flag = value_of(i);
        else if (a == "--config") opts.config_path = value_of(i);
        else if (a == "--report") opts.report_path = value_of(i);
        else if (a == "-v" || a == "--verbose") opts.verbosity = std::min(opts.verbosity + 1, 2);
        else if (a == "-vv" || a == "--debug") opts.verbosity = 2;
        else if (a == "--help" || a == "-h") opts.help = true;
        else if (a.size() > 1 && a[0] == '-') throw UsageError("unknown flag " + a);
        else positional.push_back(a);
    }

    if (opts.help) return opts;

    if (positional.empty()) throw UsageError("missing connection string");
    if (positional.size() > 1) throw UsageError("unexpected argument " + positional[1]);
    opts.conninfo = positional[0];

    if (!opts.config_path.empty()) {
        ConfigFile cfg = load_config(opts.config_path);
        if (!cfg.locale_path.empty()) opts.locale_path = cfg.locale_path;
        if (!cfg.table.empty()) opts.table = cfg.table;
        if (!cfg.schema.empty()) opts.schema = cfg.schema;
        if (cfg.has_assume_good) opts.assume_good = cfg.assume_good;
    }

    if (locale_flag) opts.locale_path = *locale_flag;
    if (table_flag) opts.table = *table_flag;
    if (schema_flag) opts.schema = *schema_flag;
    if (assume_good_flag) opts.assume_good = true;

    if (opts.table.empty()) throw UsageError("--table must not be empty");
    if (opts.schema.empty()) throw UsageError("--schema must not be empty");
    return opts;
}

std::string usage_text() {
    return "Usage: collwatch [flags] <connection string>\n\n"
           "Detects changed C library collation data behind index collations and prints\n"
           "the SQL that rebuilds affected indexes and records the new checksums.\n\n"
           "Flags:\n"
           "  --now               Execute the statements (one transaction) instead of printing them\n"
           "  --assume-good       Record first-seen locales without rebuilding their indexes\n"
           "  --locale-path <dir> Locale directory (default: first of /usr/lib/locale,\n"
           "                      /usr/lib64/locale, /usr/share/locale, /usr/local/share/locale)\n"
           "  --table <name>      Checksum table (default lc_collate_checksums)\n"
           "  --schema <name>     Schema of the checksum table (default public)\n"
           "  --config <path>     JSON file with locale_path, table, schema, assume_good\n"
           "  --report <path>     Write a JSON report of every locale decision\n"
           "  -v, --verbose       Log decisions to stderr\n"
           "  -vv, --debug        Log catalog and probe details\n"
           "  -h, --help          Show this help\n";
}
