#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace collwatch::localefile {

// Name of the collation data file inside a locale directory.
inline constexpr const char* collate_file_name = "LC_COLLATE";

// mangled_name returns the C library spelling of a locale identifier:
// the codeset after '.' is lower-cased and stripped of everything that is
// not a letter or digit, an '@modifier' is kept as is.
// Example: "fr_FR.UTF-8" -> "fr_FR.utf8", "de_DE.ISO-8859-15@euro" -> "de_DE.iso885915@euro"
// Returns nullopt if the identifier has no codeset part.
std::optional<std::string> mangled_name(const std::string& locale_id);

// resolve finds the LC_COLLATE file for locale_id under search_root.
// Tries search_root/locale_id/LC_COLLATE first, then the mangled variant.
// Throws ResolutionError naming the locale if neither exists.
std::filesystem::path resolve(const std::filesystem::path& search_root,
                              const std::string& locale_id);

// default_search_roots returns the conventional locale directories in the
// order they are tried.
std::vector<std::filesystem::path> default_search_roots();

// find_search_root returns the first candidate that is an existing directory.
std::optional<std::filesystem::path> find_search_root(
    const std::vector<std::filesystem::path>& candidates);

} // namespace collwatch::localefile
