#pragma once

#include "collwatch/fingerprint.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace collwatch::plan {

using fingerprint::ProbeResult;

inline constexpr const char* default_table = "lc_collate_checksums";
inline constexpr const char* default_schema = "public";

// Name of the pg_collation entry that stands for the database default.
inline constexpr const char* default_collation_name = "default";

// QualifiedName is a schema-qualified relation name (index or table).
struct QualifiedName {
    std::string schema;
    std::string name;

    // display joins the parts with '.' without quoting, for logs and comments.
    std::string display() const { return schema + "." + name; }

    bool operator==(const QualifiedName&) const = default;
};

// CollationReference is one collation used by at least one index column.
struct CollationReference {
    uint32_t oid = 0;
    std::string name;       // pg_collation.collname
    std::string lc_collate; // pg_collation.collcollate, empty for the default collation

    // is_default reports whether this is the "use database default" sentinel.
    bool is_default() const { return name == default_collation_name || lc_collate.empty(); }

    bool operator==(const CollationReference&) const = default;
};

// BaselineRecord is one row of the checksum table.
struct BaselineRecord {
    std::string lc_collate;
    std::string path;
    int64_t modified = 0;
    std::string checksum;

    bool operator==(const BaselineRecord&) const = default;
};

// is_pseudo_locale reports whether a locale has no on-disk collation data.
bool is_pseudo_locale(const std::string& locale);

// Catalog is the view of the database the planner needs. The PostgreSQL
// implementation lives in collwatch/pgcatalog.h.
class Catalog {
public:
    virtual ~Catalog() = default;

    // Distinct collations referenced by any index column.
    virtual std::vector<CollationReference> referenced_collations() = 0;

    // lc_collate of the current database. Empty if the default collation is
    // not backed by C library locale data.
    virtual std::string default_collation() = 0;

    // Indexes with at least one column using the given collation.
    virtual std::vector<QualifiedName> dependent_indexes(const CollationReference& ref) = 0;

    virtual bool baseline_table_exists(const QualifiedName& table) = 0;

    // All rows of the baseline table. Only called if the table exists.
    virtual std::vector<BaselineRecord> baseline(const QualifiedName& table) = 0;
};

// ProbeFunc resolves a locale to its data file and fingerprints it.
// Expected to throw ResolutionError or IoError on failure.
using ProbeFunc = std::function<ProbeResult(const std::string& locale)>;

enum class StatementKind {
    Comment,
    CreateBaselineTable,
    Reindex,
    InsertBaseline,
    UpdateBaseline,
};

const char* statement_kind_name(StatementKind kind);

// Statement is one entry of a plan. Which fields are meaningful depends on kind:
//   Comment                         text
//   CreateBaselineTable             target = baseline table
//   Reindex                         target = index
//   InsertBaseline, UpdateBaseline  target = baseline table, row
struct Statement {
    StatementKind kind = StatementKind::Comment;
    std::string text;
    QualifiedName target;
    BaselineRecord row;

    bool operator==(const Statement&) const = default;
};

Statement comment(std::string text);
Statement create_baseline_table(const QualifiedName& table);
Statement reindex(const QualifiedName& index);
Statement insert_baseline(const QualifiedName& table, const BaselineRecord& row);
Statement update_baseline(const QualifiedName& table, const BaselineRecord& row);

enum class LocaleStatus { Unseen, Changed, Unchanged };

const char* locale_status_name(LocaleStatus status);

// LocaleDecision records how one effective locale was classified.
struct LocaleDecision {
    std::string locale;
    std::vector<CollationReference> references;
    ProbeResult probe;
    std::optional<BaselineRecord> previous;
    LocaleStatus status = LocaleStatus::Unseen;
    bool remediate = false;      // dependent indexes are rebuilt
    bool write_baseline = false; // an INSERT or UPDATE is planned
};

// Plan is the ordered statement list for one run plus what led to it.
//
// Statements come in this order: the optional CREATE TABLE, one comment and
// REINDEX group per locale that needs remediation, then one comment and the
// baseline INSERT/UPDATE batch. A baseline row is therefore never written
// ahead of the rebuild it vouches for.
//
// Checksums are taken when the plan is built. A locale file rewritten after
// that and before the REINDEX statements run is not noticed by this run; the
// next run sees it differ from the recorded checksum and rebuilds again.
struct Plan {
    std::vector<Statement> statements;
    std::vector<LocaleDecision> locales;
    std::vector<std::string> notices;
    std::vector<QualifiedName> reindexed;
    bool creates_baseline_table = false;

    // has_work reports whether executing the plan would change anything.
    bool has_work() const { return !statements.empty(); }
    size_t count(StatementKind kind) const;
};

struct PlanOptions {
    bool assume_good_on_first_seen = false;
    QualifiedName baseline_table{default_schema, default_table};
};

// build_plan probes every locale referenced by an index, compares it with
// the baseline and returns the statements needed to rebuild what changed and
// record the new checksums. Any probe failure propagates and no plan is
// returned.
Plan build_plan(Catalog& catalog, const ProbeFunc& probe, const PlanOptions& opts = {});

} // namespace collwatch::plan
