#pragma once

#include <algorithm>
#include <iostream>
#include <utility>

namespace collwatch::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "INFO";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

// Everything goes to stderr; stdout carries the SQL script.
template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    auto& stream = std::cerr;
    stream << '[' << level_name(min_level) << "] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(Args&&... args) {
    auto& stream = std::cerr;
    stream << "[WARN] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void error(Args&&... args) {
    auto& stream = std::cerr;
    stream << "[ERROR] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args> void log_plain(Args&&... args) {
    auto& stream = std::cerr;
    if constexpr (sizeof...(Args) > 0) { ((stream << std::forward<Args>(args) << ' '), ...); }
    stream << '\n';
}

} // namespace collwatch::log

namespace collwatch::cli {
    using namespace collwatch::log;
}

#define LOGI(...) ::collwatch::log::info(__VA_ARGS__)
#define LOGW(...) ::collwatch::log::warn(__VA_ARGS__)
#define LOGE(...) ::collwatch::log::error(__VA_ARGS__)
#define LOGD(...) ::collwatch::log::debug(__VA_ARGS__)
