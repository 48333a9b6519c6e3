#include <crabby/glob.hpp>
#include <algorithm>

namespace crabby {

namespace fs = std::filesystem;

// ---- Helpers ----

static std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    // "./packages/*" and "packages/*/" name the same thing
    while (out.size() >= 2 && out[0] == '.' && out[1] == '/') out.erase(0, 2);
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    size_t start = 0;
    while (true) {
        size_t slash = s.find('/', start);
        if (slash == std::string::npos) {
            segs.push_back(s.substr(start));
            return segs;
        }
        segs.push_back(s.substr(start, slash - start));
        start = slash + 1;
    }
}

// Matches one character class starting at pat[pi] == '['. Advances pi past
// the closing ']'.
static bool match_class(const std::string& pat, size_t& pi, char c) {
    ++pi;
    bool negate = pi < pat.size() && (pat[pi] == '!' || pat[pi] == '^');
    if (negate) ++pi;
    bool matched = false;
    while (pi < pat.size() && pat[pi] != ']') {
        char lo = pat[pi];
        if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
            if (c >= lo && c <= pat[pi + 2]) matched = true;
            pi += 3;
        } else {
            if (c == lo) matched = true;
            ++pi;
        }
    }
    if (pi < pat.size()) ++pi;
    return matched != negate;
}

// Single segment match with star backtracking.
static bool match_segment(const std::string& pat, const std::string& str) {
    size_t pi = 0, si = 0;
    size_t star_pi = std::string::npos, star_si = 0;

    while (si < str.size()) {
        if (pi < pat.size() && pat[pi] == '*') {
            star_pi = ++pi;
            star_si = si;
            continue;
        }
        if (pi < pat.size()) {
            size_t next = pi;
            bool ok;
            if (pat[pi] == '?') {
                ok = true;
                next = pi + 1;
            } else if (pat[pi] == '[') {
                ok = match_class(pat, next, str[si]);
            } else {
                ok = pat[pi] == str[si];
                next = pi + 1;
            }
            if (ok) {
                pi = next;
                ++si;
                continue;
            }
        }
        if (star_pi == std::string::npos) return false;
        pi = star_pi;
        si = ++star_si;
    }

    while (pi < pat.size() && pat[pi] == '*') ++pi;
    return pi == pat.size();
}

static bool match_segments(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si) {
    for (; pi < pat.size(); ++pi, ++si) {
        if (pat[pi] == "**") {
            while (pi < pat.size() && pat[pi] == "**") ++pi;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= path.size(); ++k) {
                if (match_segments(pat, pi, path, k)) return true;
            }
            return false;
        }
        if (si >= path.size() || !match_segment(pat[pi], path[si])) return false;
    }
    return si == path.size();
}

// ---- Public API ----

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_segments(split_segments(normalize_path(pattern)), 0,
                          split_segments(normalize_path(path)), 0);
}

bool glob_is_negation(const std::string& pattern, std::string& inner) {
    if (!pattern.empty() && pattern[0] == '!') {
        inner = pattern.substr(1);
        return true;
    }
    return false;
}

Result<std::vector<std::string>> glob_expand_dirs(
    const std::string& pattern,
    const fs::path& root_dir)
{
    std::error_code ec;
    if (!fs::is_directory(root_dir, ec)) {
        return CrabbyError(CrabbyError::IO,
            "glob: root directory does not exist: " + root_dir.string());
    }

    auto norm = normalize_path(pattern);
    auto segs = split_segments(norm);
    bool recursive = std::find(segs.begin(), segs.end(), "**") != segs.end();
    int max_depth = static_cast<int>(segs.size());

    std::vector<std::string> results;
    fs::recursive_directory_iterator it(root_dir, ec), end;
    if (ec) {
        return CrabbyError(CrabbyError::IO,
            "glob: cannot read " + root_dir.string() + ": " + ec.message());
    }

    for (; it != end; it.increment(ec)) {
        if (ec) {
            return CrabbyError(CrabbyError::IO,
                "glob: error iterating directory: " + ec.message());
        }
        if (!it->is_directory(ec)) continue;

        auto filename = it->path().filename().string();
        if (filename == "node_modules" || (!filename.empty() && filename[0] == '.')) {
            it.disable_recursion_pending();
            continue;
        }

        auto rel = normalize_path(fs::relative(it->path(), root_dir, ec).generic_string());
        if (ec) continue;
        if (glob_match(norm, rel)) {
            results.push_back(rel);
        }
        if (!recursive && it.depth() + 1 >= max_depth) {
            it.disable_recursion_pending();
        }
    }

    std::sort(results.begin(), results.end());
    return Result<std::vector<std::string>>::ok(std::move(results));
}

std::vector<std::string> glob_filter(
    const std::vector<std::string>& patterns,
    const std::vector<std::string>& paths)
{
    std::vector<std::string> result;
    for (const auto& path : paths) {
        bool included = false;
        for (const auto& pat : patterns) {
            std::string inner;
            if (glob_is_negation(pat, inner)) {
                if (glob_match(inner, path)) included = false;
            } else if (glob_match(pat, path)) {
                included = true;
            }
        }
        if (included) result.push_back(path);
    }
    return result;
}

} // namespace crabby
