#pragma once

#include "collwatch/plan.h"

#include <cstdint>
#include <ostream>
#include <string>

namespace collwatch::sqlgen {

// First line of every script: makes psql stop at the first failing statement.
inline constexpr const char* stop_on_error_pragma = "\\set ON_ERROR_STOP on";

// quote_ident always double-quotes, doubling embedded quotes.
std::string quote_ident(const std::string& ident);

// quote_qualified renders "schema"."name".
std::string quote_qualified(const plan::QualifiedName& name);

// quote_literal single-quotes a string literal. Strings containing a
// backslash use the E'' form with the backslash doubled.
std::string quote_literal(const std::string& value);

// timestamp_literal converts epoch seconds to a timestamptz expression.
std::string timestamp_literal(int64_t epoch_seconds);

// baseline_table_ddl is the CREATE TABLE statement for the checksum table.
std::string baseline_table_ddl(const plan::QualifiedName& table);

// render returns one statement as SQL text, terminated with ';'.
// Comments render as a single "-- " line.
std::string render(const plan::Statement& stmt);

// write_script writes the pragma followed by every statement, one per line.
void write_script(std::ostream& out, const plan::Plan& p);

} // namespace collwatch::sqlgen
