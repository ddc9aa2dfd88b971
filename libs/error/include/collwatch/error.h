#pragma once

#include <stdexcept>
#include <string>

namespace collwatch {

// UsageError reports bad or missing command-line input. Raised before any
// database contact.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

// ResolutionError reports a locale whose LC_COLLATE file cannot be found
// under either naming convention.
class ResolutionError : public std::runtime_error {
public:
    explicit ResolutionError(const std::string& msg) : std::runtime_error(msg) {}
};

// IoError reports a locale file that could not be opened or read.
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& msg) : std::runtime_error(msg) {}
};

// DatabaseError reports a failed connection, query or statement.
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace collwatch
