#pragma once

#include <string>
#include <vector>

// Options is the resolved command line, after merging the config file.
struct Options {
    std::string conninfo;
    bool execute = false;
    bool assume_good = false;
    std::string locale_path; // empty: probe the default search roots
    std::string table = "lc_collate_checksums";
    std::string schema = "public";
    std::string config_path;
    std::string report_path;
    int verbosity = 0;
    bool help = false;
};

// ConfigFile holds the optional keys of a --config JSON file.
struct ConfigFile {
    std::string locale_path;
    std::string table;
    std::string schema;
    bool assume_good = false;
    bool has_assume_good = false;
};

// load_config reads a JSON config file. Throws UsageError if it cannot be
// read or parsed.
ConfigFile load_config(const std::string& path);

// parse_options parses argv[1..]. Flags override values from --config.
// Throws UsageError on unknown flags, missing flag values, or a missing
// connection string (unless --help was given).
Options parse_options(const std::vector<std::string>& args);

// usage_text is the --help output.
std::string usage_text();
