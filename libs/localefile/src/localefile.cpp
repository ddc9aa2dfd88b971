#include "collwatch/localefile.h"
#include "collwatch/error.h"

#include <cctype>
#include <format>

namespace fs = std::filesystem;

namespace collwatch::localefile {

static bool is_regular_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

std::optional<std::string> mangled_name(const std::string& locale_id) {
    auto dot = locale_id.find('.');
    if (dot == std::string::npos) return std::nullopt;

    std::string base = locale_id.substr(0, dot);
    std::string codeset = locale_id.substr(dot + 1);
    std::string modifier;
    auto at = codeset.find('@');
    if (at != std::string::npos) {
        modifier = codeset.substr(at);
        codeset.erase(at);
    }

    std::string mangled;
    mangled.reserve(codeset.size());
    for (char ch : codeset) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) mangled.push_back(static_cast<char>(std::tolower(c)));
    }
    return base + "." + mangled + modifier;
}

fs::path resolve(const fs::path& search_root, const std::string& locale_id) {
    if (locale_id.empty())
        throw ResolutionError("empty locale identifier");

    fs::path direct = search_root / locale_id / collate_file_name;
    if (is_regular_file(direct)) return direct;

    if (auto alt = mangled_name(locale_id); alt && *alt != locale_id) {
        fs::path mangled = search_root / *alt / collate_file_name;
        if (is_regular_file(mangled)) return mangled;
    }

    throw ResolutionError(std::format("no {} file for locale \"{}\" under {}",
                                      collate_file_name, locale_id, search_root.string()));
}

std::vector<fs::path> default_search_roots() {
    return {
        "/usr/lib/locale",
        "/usr/lib64/locale",
        "/usr/share/locale",
        "/usr/local/share/locale",
    };
}

std::optional<fs::path> find_search_root(const std::vector<fs::path>& candidates) {
    for (const auto& c : candidates) {
        std::error_code ec;
        if (fs::is_directory(c, ec)) return c;
    }
    return std::nullopt;
}

} // namespace collwatch::localefile
