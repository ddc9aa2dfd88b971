#include "collwatch/sqlgen.h"

#include <format>

namespace collwatch::sqlgen {

using plan::StatementKind;

// Comment text comes from catalog and file names; keep it on one line.
static std::string single_line(const std::string& text) {
    std::string out = text;
    for (char& c : out) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return out;
}

std::string quote_ident(const std::string& ident) {
    std::string out;
    out.reserve(ident.size() + 2);
    out.push_back('"');
    for (char c : ident) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string quote_qualified(const plan::QualifiedName& name) {
    return quote_ident(name.schema) + "." + quote_ident(name.name);
}

std::string quote_literal(const std::string& value) {
    bool has_backslash = value.find('\\') != std::string::npos;
    std::string out;
    out.reserve(value.size() + 3);
    if (has_backslash) out.push_back('E');
    out.push_back('\'');
    for (char c : value) {
        if (c == '\'' || c == '\\') out.push_back(c);
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string timestamp_literal(int64_t epoch_seconds) {
    return std::format("to_timestamp({})", epoch_seconds);
}

std::string baseline_table_ddl(const plan::QualifiedName& table) {
    return std::format("CREATE TABLE {} (lc_collate text PRIMARY KEY, path text NOT NULL, "
                       "modified timestamptz NOT NULL, checksum text NOT NULL);",
                       quote_qualified(table));
}

std::string render(const plan::Statement& stmt) {
    switch (stmt.kind) {
        case StatementKind::Comment:
            return "-- " + single_line(stmt.text);
        case StatementKind::CreateBaselineTable:
            return baseline_table_ddl(stmt.target);
        case StatementKind::Reindex:
            return std::format("REINDEX INDEX {};", quote_qualified(stmt.target));
        case StatementKind::InsertBaseline:
            return std::format("INSERT INTO {} (lc_collate, path, modified, checksum) VALUES ({}, {}, {}, {});",
                               quote_qualified(stmt.target),
                               quote_literal(stmt.row.lc_collate),
                               quote_literal(stmt.row.path),
                               timestamp_literal(stmt.row.modified),
                               quote_literal(stmt.row.checksum));
        case StatementKind::UpdateBaseline:
            return std::format("UPDATE {} SET path = {}, modified = {}, checksum = {} WHERE lc_collate = {};",
                               quote_qualified(stmt.target),
                               quote_literal(stmt.row.path),
                               timestamp_literal(stmt.row.modified),
                               quote_literal(stmt.row.checksum),
                               quote_literal(stmt.row.lc_collate));
    }
    return {};
}

void write_script(std::ostream& out, const plan::Plan& p) {
    out << stop_on_error_pragma << '\n';
    if (!p.has_work()) {
        out << "-- all referenced collations match their recorded checksums\n";
        return;
    }
    for (const auto& stmt : p.statements)
        out << render(stmt) << '\n';
}

} // namespace collwatch::sqlgen
