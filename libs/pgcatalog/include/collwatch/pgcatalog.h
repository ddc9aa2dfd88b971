#pragma once

#include "collwatch/plan.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace collwatch::pgcatalog {

// ExecuteProgressFunc is called before each statement runs with its
// position among the executable (non-comment) statements.
using ExecuteProgressFunc = std::function<void(const plan::Statement&, size_t index, size_t total)>;

// SqlCommand is one statement as sent to the server: its text and the
// values bound to $1..$n.
struct SqlCommand {
    std::string sql;
    std::vector<std::string> params;

    bool operator==(const SqlCommand&) const = default;
};

using CommandFunc = std::function<void(const SqlCommand&)>;

// Catalog query listing the plain indexes that use collation $1.
extern const char* const dependent_indexes_sql;

// to_command converts a planned statement into the command executed for it.
// Baseline values become bound parameters. Comments map to an empty command.
SqlCommand to_command(const plan::Statement& stmt);

// run_in_transaction sends BEGIN, each non-comment statement of p and COMMIT
// through send. If send throws DatabaseError, ROLLBACK is sent and the
// original error is rethrown. A plan without executable statements sends
// nothing. Returns the number of statements executed.
size_t run_in_transaction(const plan::Plan& p, const CommandFunc& send,
                          const ExecuteProgressFunc& progress = nullptr);

class Connection;

// execute_plan runs p on conn through run_in_transaction.
size_t execute_plan(Connection& conn, const plan::Plan& p,
                    const ExecuteProgressFunc& progress = nullptr);

// Connection wraps a libpq connection to the database being checked.
class Connection {
public:
    ~Connection();
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    // Open connects using a libpq connection string or URI.
    // Throws DatabaseError if the server cannot be reached.
    static Connection open(const std::string& conninfo);

    // ServerVersion returns the server version number, e.g. 160002.
    int server_version() const;

    // Database returns the name of the connected database.
    std::string database() const;

private:
    Connection();
    struct Impl;
    std::unique_ptr<Impl> impl_;

    friend class PgCatalog;
    friend size_t execute_plan(Connection& conn, const plan::Plan& p,
                               const ExecuteProgressFunc& progress);
};

// PgCatalog answers the planner's questions from the system catalogs.
// Only collations provided by the C library are reported; ICU and builtin
// collations have no LC_COLLATE file.
class PgCatalog : public plan::Catalog {
public:
    explicit PgCatalog(Connection& conn) : conn_(conn) {}

    std::vector<plan::CollationReference> referenced_collations() override;
    std::string default_collation() override;
    std::vector<plan::QualifiedName> dependent_indexes(const plan::CollationReference& ref) override;
    bool baseline_table_exists(const plan::QualifiedName& table) override;
    std::vector<plan::BaselineRecord> baseline(const plan::QualifiedName& table) override;

private:
    Connection& conn_;
};

} // namespace collwatch::pgcatalog
