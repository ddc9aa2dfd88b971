#include "collwatch/plan.h"

#include <algorithm>
#include <array>
#include <format>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace collwatch::plan {

namespace {

// Byte-order locales; the C library ships no LC_COLLATE file for them.
constexpr std::array<std::string_view, 2> pseudo_locales = {"C", "POSIX"};

struct ProbedLocale {
    std::string locale;
    std::vector<CollationReference> references;
    ProbeResult probe;
};

std::string short_checksum(const std::string& checksum) {
    return checksum.substr(0, 12);
}

std::string describe_references(const std::vector<CollationReference>& refs) {
    std::string out;
    for (const auto& r : refs) {
        if (!out.empty()) out += ", ";
        out += r.name;
    }
    return out;
}

// Index names may contain dots, so the key keeps schema and name apart.
std::string index_key(const QualifiedName& index) {
    std::string key = index.schema;
    key.push_back('\0');
    key += index.name;
    return key;
}

} // namespace

bool is_pseudo_locale(const std::string& locale) {
    return std::find(pseudo_locales.begin(), pseudo_locales.end(), locale) != pseudo_locales.end();
}

const char* statement_kind_name(StatementKind kind) {
    switch (kind) {
        case StatementKind::Comment: return "comment";
        case StatementKind::CreateBaselineTable: return "create_table";
        case StatementKind::Reindex: return "reindex";
        case StatementKind::InsertBaseline: return "insert";
        case StatementKind::UpdateBaseline: return "update";
    }
    return "comment";
}

const char* locale_status_name(LocaleStatus status) {
    switch (status) {
        case LocaleStatus::Unseen: return "unseen";
        case LocaleStatus::Changed: return "changed";
        case LocaleStatus::Unchanged: return "unchanged";
    }
    return "unseen";
}

Statement comment(std::string text) {
    Statement s;
    s.kind = StatementKind::Comment;
    s.text = std::move(text);
    return s;
}

Statement create_baseline_table(const QualifiedName& table) {
    Statement s;
    s.kind = StatementKind::CreateBaselineTable;
    s.target = table;
    return s;
}

Statement reindex(const QualifiedName& index) {
    Statement s;
    s.kind = StatementKind::Reindex;
    s.target = index;
    return s;
}

Statement insert_baseline(const QualifiedName& table, const BaselineRecord& row) {
    Statement s;
    s.kind = StatementKind::InsertBaseline;
    s.target = table;
    s.row = row;
    return s;
}

Statement update_baseline(const QualifiedName& table, const BaselineRecord& row) {
    Statement s;
    s.kind = StatementKind::UpdateBaseline;
    s.target = table;
    s.row = row;
    return s;
}

size_t Plan::count(StatementKind kind) const {
    return static_cast<size_t>(std::count_if(statements.begin(), statements.end(),
                                             [kind](const Statement& s) { return s.kind == kind; }));
}

Plan build_plan(Catalog& catalog, const ProbeFunc& probe, const PlanOptions& opts) {
    if (!probe) throw std::invalid_argument("build_plan: no probe function");

    // Map every referenced collation to its effective locale. Two references
    // that land on the same locale share one entry.
    std::optional<std::string> default_locale;
    std::vector<ProbedLocale> entries;
    std::unordered_map<std::string, size_t> entry_by_locale;

    for (const auto& ref : catalog.referenced_collations()) {
        std::string locale;
        if (ref.is_default()) {
            if (!default_locale) default_locale = catalog.default_collation();
            locale = *default_locale;
        } else {
            locale = ref.lc_collate;
        }
        if (locale.empty() || is_pseudo_locale(locale)) continue;

        auto [it, inserted] = entry_by_locale.try_emplace(locale, entries.size());
        if (inserted) entries.push_back({locale, {}, {}});
        auto& refs = entries[it->second].references;
        if (std::find(refs.begin(), refs.end(), ref) == refs.end()) refs.push_back(ref);
    }

    // Probe all files before deciding anything.
    for (auto& e : entries) e.probe = probe(e.locale);

    const QualifiedName& table = opts.baseline_table;
    const bool table_exists = catalog.baseline_table_exists(table);
    std::unordered_map<std::string, BaselineRecord> baseline;
    if (table_exists) {
        for (auto& row : catalog.baseline(table)) {
            std::string key = row.lc_collate;
            baseline.emplace(std::move(key), std::move(row));
        }
    }

    Plan plan;
    std::vector<Statement> remediation;
    std::unordered_set<std::string> emitted;

    for (auto& e : entries) {
        LocaleDecision d;
        d.locale = e.locale;
        d.references = std::move(e.references);
        d.probe = std::move(e.probe);

        auto prev = baseline.find(d.locale);
        if (prev == baseline.end()) {
            d.status = LocaleStatus::Unseen;
            d.write_baseline = true;
            if (opts.assume_good_on_first_seen) {
                auto notice = std::format("{}: no recorded checksum, assuming dependent indexes are consistent",
                                          d.locale);
                remediation.push_back(comment(notice));
                plan.notices.push_back(std::move(notice));
            } else {
                d.remediate = true;
                remediation.push_back(comment(std::format(
                    "{} (collation {}): no recorded checksum, rebuilding dependent indexes",
                    d.locale, describe_references(d.references))));
            }
        } else {
            d.previous = prev->second;
            if (prev->second.checksum != d.probe.checksum) {
                d.status = LocaleStatus::Changed;
                d.remediate = true;
                d.write_baseline = true;
                remediation.push_back(comment(std::format(
                    "{} (collation {}): checksum changed from {} to {}, rebuilding dependent indexes",
                    d.locale, describe_references(d.references),
                    short_checksum(prev->second.checksum), short_checksum(d.probe.checksum))));
            } else {
                d.status = LocaleStatus::Unchanged;
                d.write_baseline = prev->second.path != d.probe.path ||
                                   prev->second.modified != d.probe.modified;
                if (d.write_baseline)
                    plan.notices.push_back(std::format(
                        "{}: checksum unchanged, updating recorded path and modification time", d.locale));
            }
        }

        if (d.remediate) {
            for (const auto& ref : d.references) {
                for (auto& index : catalog.dependent_indexes(ref)) {
                    if (!emitted.insert(index_key(index)).second) continue;
                    remediation.push_back(reindex(index));
                    plan.reindexed.push_back(std::move(index));
                }
            }
        }

        plan.locales.push_back(std::move(d));
    }

    std::vector<Statement> writes;
    for (const auto& d : plan.locales) {
        if (!d.write_baseline) continue;
        BaselineRecord row{d.locale, d.probe.path, d.probe.modified, d.probe.checksum};
        writes.push_back(d.previous ? update_baseline(table, row) : insert_baseline(table, row));
    }

    if (!table_exists) {
        plan.creates_baseline_table = true;
        plan.statements.push_back(create_baseline_table(table));
    }
    plan.statements.insert(plan.statements.end(),
                           std::make_move_iterator(remediation.begin()),
                           std::make_move_iterator(remediation.end()));
    if (!writes.empty()) {
        plan.statements.push_back(comment(std::format("recording collation checksums in {}", table.display())));
        plan.statements.insert(plan.statements.end(),
                               std::make_move_iterator(writes.begin()),
                               std::make_move_iterator(writes.end()));
    }
    return plan;
}

} // namespace collwatch::plan
