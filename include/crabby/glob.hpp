#pragma once

#include <crabby/result.hpp>
#include <string>
#include <vector>
#include <filesystem>

namespace crabby {

// Match a glob pattern against a relative path (both normalized to forward
// slashes). Supports: * (any chars except /), ? (single char except /),
// ** (zero or more path segments), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& path);

// Check if pattern is a negation pattern (prefixed with '!').
// If so, stores the inner pattern (without '!') in `inner` and returns true.
bool glob_is_negation(const std::string& pattern, std::string& inner);

// Expand a pattern to the directories below root_dir it matches, as sorted
// paths relative to root_dir. node_modules and hidden directories are never
// descended into.
Result<std::vector<std::string>> glob_expand_dirs(
    const std::string& pattern,
    const std::filesystem::path& root_dir);

// Apply ordered include/exclude patterns to a list of paths.
// The last matching pattern decides; '!' patterns exclude.
std::vector<std::string> glob_filter(
    const std::vector<std::string>& patterns,
    const std::vector<std::string>& paths);

} // namespace crabby
