#include "report.h"

#include <fstream>
#include <iomanip>
#include <stdexcept>

using json = nlohmann::ordered_json;
namespace plan = collwatch::plan;

static json qualified(const plan::QualifiedName& n) {
    return {{"schema", n.schema}, {"name", n.name}};
}

json build_report(const plan::Plan& p, const std::string& locale_root, bool execute) {
    json locales = json::array();
    for (const auto& d : p.locales) {
        json refs = json::array();
        for (const auto& r : d.references)
            refs.push_back({{"oid", r.oid}, {"name", r.name}, {"lcCollate", r.lc_collate}});

        json entry = {
            {"locale", d.locale},
            {"status", plan::locale_status_name(d.status)},
            {"remediate", d.remediate},
            {"writeBaseline", d.write_baseline},
            {"references", refs},
            {"path", d.probe.path},
            {"modified", d.probe.modified},
            {"checksum", d.probe.checksum},
        };
        if (d.previous) {
            entry["previous"] = {
                {"path", d.previous->path},
                {"modified", d.previous->modified},
                {"checksum", d.previous->checksum},
            };
        } else {
            entry["previous"] = nullptr;
        }
        locales.push_back(std::move(entry));
    }

    json reindexed = json::array();
    for (const auto& idx : p.reindexed) reindexed.push_back(qualified(idx));

    return {
        {"schemaVersion", 1},
        {"mode", execute ? "execute" : "print"},
        {"localeRoot", locale_root},
        {"createsBaselineTable", p.creates_baseline_table},
        {"locales", locales},
        {"reindex", reindexed},
        {"notices", p.notices},
        {"statementCount", p.statements.size()},
    };
}

void write_report(const std::string& path, const json& doc) {
    std::ofstream f(path);
    if (!f) throw std::runtime_error("failed to create " + path);
    f << std::setw(2) << doc << '\n';
    if (!f) throw std::runtime_error("failed to write " + path);
}
