#include "collwatch/pgcatalog.h"
#include "collwatch/error.h"
#include "collwatch/sqlgen.h"

#include <libpq-fe.h>

#include <format>
#include <stdexcept>

namespace collwatch::pgcatalog {

// ---------------------------------------------------------------------------
// libpq helpers
// ---------------------------------------------------------------------------

namespace {

class PgResult {
public:
    explicit PgResult(PGresult* res) : res_(res) {}
    ~PgResult() { if (res_) PQclear(res_); }
    PgResult(const PgResult&) = delete;
    PgResult& operator=(const PgResult&) = delete;
    PgResult(PgResult&& o) noexcept : res_(o.res_) { o.res_ = nullptr; }
    PgResult& operator=(PgResult&& o) noexcept {
        if (this != &o) { if (res_) PQclear(res_); res_ = o.res_; o.res_ = nullptr; }
        return *this;
    }

    PGresult* get() const { return res_; }

    ExecStatusType status() const { return res_ ? PQresultStatus(res_) : PGRES_FATAL_ERROR; }

    int rows() const { return PQntuples(res_); }

    std::string text(int row, int col) const {
        if (PQgetisnull(res_, row, col)) return {};
        return PQgetvalue(res_, row, col);
    }

    int64_t int64(int row, int col) const {
        std::string v = text(row, col);
        try {
            return std::stoll(v);
        } catch (const std::exception&) {
            throw DatabaseError(std::format("expected an integer, got \"{}\"", v));
        }
    }

private:
    PGresult* res_ = nullptr;
};

std::string error_message(PGconn* conn, const PgResult& res) {
    const char* msg = res.get() ? PQresultErrorMessage(res.get()) : nullptr;
    if (!msg || !*msg) msg = PQerrorMessage(conn);
    std::string out = msg ? msg : "unknown error";
    while (!out.empty() && (out.back() == '\n' || out.back() == ' ')) out.pop_back();
    return out;
}

void check(PGconn* conn, const PgResult& res, ExecStatusType expected, const std::string& what) {
    if (res.status() != expected)
        throw DatabaseError(std::format("{}: {}", what, error_message(conn, res)));
}

PgResult query(PGconn* conn, const char* sql, const std::vector<std::string>& params,
               const std::string& what) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) values.push_back(p.c_str());
    PgResult res(PQexecParams(conn, sql, static_cast<int>(values.size()), nullptr,
                              values.empty() ? nullptr : values.data(), nullptr, nullptr, 0));
    check(conn, res, PGRES_TUPLES_OK, what);
    return res;
}

void command(PGconn* conn, const std::string& sql, const std::vector<std::string>& params,
             const std::string& what) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) values.push_back(p.c_str());
    PgResult res(PQexecParams(conn, sql.c_str(), static_cast<int>(values.size()), nullptr,
                              values.empty() ? nullptr : values.data(), nullptr, nullptr, 0));
    check(conn, res, PGRES_COMMAND_OK, what);
}

// ---------------------------------------------------------------------------
// Catalog queries
// ---------------------------------------------------------------------------

constexpr const char* referenced_collations_sql = R"SQL(
SELECT DISTINCT c.oid, c.collname, coalesce(c.collcollate, '')
FROM pg_catalog.pg_index i
CROSS JOIN LATERAL unnest(i.indcollation::oid[]) AS ic(colloid)
JOIN pg_catalog.pg_collation c ON c.oid = ic.colloid
JOIN pg_catalog.pg_class ci ON ci.oid = i.indexrelid
WHERE c.collprovider IN ('c', 'd')
  AND ci.relkind = 'i'
  AND NOT pg_catalog.pg_is_other_temp_schema(ci.relnamespace)
ORDER BY 2, 1
)SQL";

constexpr const char* default_collation_sql = R"SQL(
SELECT datcollate FROM pg_catalog.pg_database WHERE datname = current_database()
)SQL";

// PostgreSQL 15 added per-database locale providers.
constexpr const char* default_collation_provider_sql = R"SQL(
SELECT datcollate, datlocprovider FROM pg_catalog.pg_database WHERE datname = current_database()
)SQL";

constexpr const char* table_exists_sql = "SELECT to_regclass($1) IS NOT NULL";

constexpr int provider_version = 150000;

} // namespace

// Partitioned parents (relkind 'I') are skipped: their leaf partitions are
// listed individually. Other sessions' temporary indexes cannot be reindexed.
const char* const dependent_indexes_sql = R"SQL(
SELECT DISTINCT n.nspname, ci.relname
FROM pg_catalog.pg_index i
JOIN pg_catalog.pg_class ci ON ci.oid = i.indexrelid
JOIN pg_catalog.pg_namespace n ON n.oid = ci.relnamespace
WHERE $1::oid = ANY (i.indcollation::oid[])
  AND ci.relkind = 'i'
  AND NOT pg_catalog.pg_is_other_temp_schema(n.oid)
ORDER BY 1, 2
)SQL";

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------

struct Connection::Impl {
    PGconn* conn = nullptr;
    ~Impl() { if (conn) PQfinish(conn); }
};

Connection::Connection() : impl_(std::make_unique<Impl>()) {}
Connection::~Connection() = default;
Connection::Connection(Connection&& other) noexcept = default;
Connection& Connection::operator=(Connection&& other) noexcept = default;

Connection Connection::open(const std::string& conninfo) {
    Connection c;
    c.impl_->conn = PQconnectdb(conninfo.c_str());
    if (!c.impl_->conn)
        throw DatabaseError("connect: out of memory");
    if (PQstatus(c.impl_->conn) != CONNECTION_OK) {
        std::string msg = PQerrorMessage(c.impl_->conn);
        while (!msg.empty() && msg.back() == '\n') msg.pop_back();
        throw DatabaseError(std::format("connect: {}", msg));
    }
    return c;
}

int Connection::server_version() const {
    return PQserverVersion(impl_->conn);
}

std::string Connection::database() const {
    const char* db = PQdb(impl_->conn);
    return db ? db : "";
}

// ---------------------------------------------------------------------------
// PgCatalog
// ---------------------------------------------------------------------------

std::vector<plan::CollationReference> PgCatalog::referenced_collations() {
    PGconn* conn = conn_.impl_->conn;
    auto res = query(conn, referenced_collations_sql, {}, "listing index collations");

    std::vector<plan::CollationReference> refs;
    refs.reserve(static_cast<size_t>(res.rows()));
    for (int r = 0; r < res.rows(); ++r) {
        plan::CollationReference ref;
        ref.oid = static_cast<uint32_t>(res.int64(r, 0));
        ref.name = res.text(r, 1);
        ref.lc_collate = res.text(r, 2);
        refs.push_back(std::move(ref));
    }
    return refs;
}

std::string PgCatalog::default_collation() {
    PGconn* conn = conn_.impl_->conn;
    if (conn_.server_version() >= provider_version) {
        auto res = query(conn, default_collation_provider_sql, {}, "reading database collation");
        if (res.rows() != 1) throw DatabaseError("current database not found in pg_database");
        if (res.text(0, 1) != "c") return {};
        return res.text(0, 0);
    }
    auto res = query(conn, default_collation_sql, {}, "reading database collation");
    if (res.rows() != 1) throw DatabaseError("current database not found in pg_database");
    return res.text(0, 0);
}

std::vector<plan::QualifiedName> PgCatalog::dependent_indexes(const plan::CollationReference& ref) {
    PGconn* conn = conn_.impl_->conn;
    auto res = query(conn, dependent_indexes_sql, {std::to_string(ref.oid)},
                     std::format("listing indexes using collation {}", ref.name));

    std::vector<plan::QualifiedName> out;
    out.reserve(static_cast<size_t>(res.rows()));
    for (int r = 0; r < res.rows(); ++r)
        out.push_back({res.text(r, 0), res.text(r, 1)});
    return out;
}

bool PgCatalog::baseline_table_exists(const plan::QualifiedName& table) {
    PGconn* conn = conn_.impl_->conn;
    auto res = query(conn, table_exists_sql, {sqlgen::quote_qualified(table)},
                     std::format("looking up {}", table.display()));
    return res.rows() == 1 && res.text(0, 0) == "t";
}

std::vector<plan::BaselineRecord> PgCatalog::baseline(const plan::QualifiedName& table) {
    PGconn* conn = conn_.impl_->conn;
    std::string sql = std::format(
        "SELECT lc_collate, path, extract(epoch FROM modified)::bigint, checksum FROM {}",
        sqlgen::quote_qualified(table));
    auto res = query(conn, sql.c_str(), {}, std::format("reading {}", table.display()));

    std::vector<plan::BaselineRecord> rows;
    rows.reserve(static_cast<size_t>(res.rows()));
    for (int r = 0; r < res.rows(); ++r) {
        plan::BaselineRecord row;
        row.lc_collate = res.text(r, 0);
        row.path = res.text(r, 1);
        row.modified = res.int64(r, 2);
        row.checksum = res.text(r, 3);
        rows.push_back(std::move(row));
    }
    return rows;
}

// ---------------------------------------------------------------------------
// Execution
// ---------------------------------------------------------------------------

SqlCommand to_command(const plan::Statement& stmt) {
    using plan::StatementKind;
    const auto table = sqlgen::quote_qualified(stmt.target);
    switch (stmt.kind) {
        case StatementKind::Comment:
            return {};
        case StatementKind::CreateBaselineTable:
        case StatementKind::Reindex:
            return {sqlgen::render(stmt), {}};
        case StatementKind::InsertBaseline:
            return {std::format("INSERT INTO {} (lc_collate, path, modified, checksum) "
                                "VALUES ($1, $2, to_timestamp($3::bigint), $4)", table),
                    {stmt.row.lc_collate, stmt.row.path, std::to_string(stmt.row.modified),
                     stmt.row.checksum}};
        case StatementKind::UpdateBaseline:
            return {std::format("UPDATE {} SET path = $2, modified = to_timestamp($3::bigint), "
                                "checksum = $4 WHERE lc_collate = $1", table),
                    {stmt.row.lc_collate, stmt.row.path, std::to_string(stmt.row.modified),
                     stmt.row.checksum}};
    }
    throw std::logic_error("unknown statement kind");
}

size_t run_in_transaction(const plan::Plan& p, const CommandFunc& send,
                          const ExecuteProgressFunc& progress) {
    size_t total = 0;
    for (const auto& stmt : p.statements)
        if (stmt.kind != plan::StatementKind::Comment) ++total;
    if (total == 0) return 0;

    send({"BEGIN", {}});
    size_t done = 0;
    try {
        for (const auto& stmt : p.statements) {
            if (stmt.kind == plan::StatementKind::Comment) continue;
            if (progress) progress(stmt, done, total);
            send(to_command(stmt));
            ++done;
        }
        send({"COMMIT", {}});
    } catch (const DatabaseError&) {
        try {
            send({"ROLLBACK", {}});
        } catch (const DatabaseError&) {
            // The connection is gone; the server discards the transaction itself.
        }
        throw;
    }
    return done;
}

size_t execute_plan(Connection& conn, const plan::Plan& p, const ExecuteProgressFunc& progress) {
    PGconn* pg = conn.impl_->conn;
    return run_in_transaction(p, [pg](const SqlCommand& cmd) {
        command(pg, cmd.sql, cmd.params, cmd.sql);
    }, progress);
}

} // namespace collwatch::pgcatalog
