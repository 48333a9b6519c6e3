#include <crabby/version.hpp>
#include <algorithm>
#include <cctype>
#include <limits>

namespace crabby {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Numeric component: digits only, no leading zeros, fits in int.
static std::optional<int> parse_numeric(const std::string& s) {
    if (!all_digits(s)) return std::nullopt;
    if (s.size() > 1 && s[0] == '0') return std::nullopt;
    long long value = 0;
    for (char c : s) {
        value = value * 10 + (c - '0');
        if (value > std::numeric_limits<int>::max()) return std::nullopt;
    }
    return static_cast<int>(value);
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

static std::string join(const std::vector<std::string>& parts, char sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

static bool valid_identifier(const std::string& id, bool numeric_rules) {
    if (id.empty()) return false;
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
    }
    if (numeric_rules && all_digits(id) && id.size() > 1 && id[0] == '0') return false;
    return true;
}

static std::string strip_prefix(std::string s) {
    while (!s.empty() && (s[0] == 'v' || s[0] == 'V' || s[0] == '=')) {
        s.erase(0, 1);
    }
    return trim(s);
}

// Splits "core-pre+build" into its three parts. Prerelease may contain '-'.
static void split_suffixes(const std::string& s, std::string& core,
                           std::string& pre, std::string& build) {
    std::string rest = s;
    size_t plus = rest.find('+');
    if (plus != std::string::npos) {
        build = rest.substr(plus + 1);
        rest = rest.substr(0, plus);
    }
    size_t dash = rest.find('-');
    if (dash != std::string::npos) {
        pre = rest.substr(dash + 1);
        core = rest.substr(0, dash);
    } else {
        core = rest;
    }
}

static int compare_identifiers(const std::string& a, const std::string& b) {
    bool an = all_digits(a);
    bool bn = all_digits(b);
    if (an && bn) {
        if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
        return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
    }
    // Numeric identifiers have lower precedence than alphanumeric ones
    if (an) return -1;
    if (bn) return 1;
    int c = a.compare(b);
    return c < 0 ? -1 : (c == 0 ? 0 : 1);
}

static int compare_versions(const Version& a, const Version& b) {
    if (a.major != b.major) return a.major < b.major ? -1 : 1;
    if (a.minor != b.minor) return a.minor < b.minor ? -1 : 1;
    if (a.patch != b.patch) return a.patch < b.patch ? -1 : 1;

    // A release sorts above any of its prereleases
    if (a.prerelease.empty() && b.prerelease.empty()) return 0;
    if (a.prerelease.empty()) return 1;
    if (b.prerelease.empty()) return -1;

    size_t n = std::min(a.prerelease.size(), b.prerelease.size());
    for (size_t i = 0; i < n; ++i) {
        int c = compare_identifiers(a.prerelease[i], b.prerelease[i]);
        if (c != 0) return c;
    }
    if (a.prerelease.size() == b.prerelease.size()) return 0;
    return a.prerelease.size() < b.prerelease.size() ? -1 : 1;
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& input) {
    std::string s = strip_prefix(trim(input));
    if (s.empty()) {
        return CrabbyError{CrabbyError::Version, "empty version string"};
    }

    std::string core, pre, build;
    split_suffixes(s, core, pre, build);

    auto parts = split(core, '.');
    if (parts.size() != 3) {
        return CrabbyError{CrabbyError::Version,
            "invalid version '" + input + "'",
            "expected format: major.minor.patch[-prerelease][+build]"};
    }

    Version v;
    int* fields[] = {&v.major, &v.minor, &v.patch};
    for (size_t i = 0; i < 3; ++i) {
        auto n = parse_numeric(parts[i]);
        if (!n) {
            return CrabbyError{CrabbyError::Version,
                "invalid numeric component '" + parts[i] + "' in version '" + input + "'"};
        }
        *fields[i] = *n;
    }

    if (s.find('-') != std::string::npos && s.find('-') < s.find('+')) {
        if (pre.empty()) {
            return CrabbyError{CrabbyError::Version,
                "empty prerelease after '-' in '" + input + "'"};
        }
        for (auto& id : split(pre, '.')) {
            if (!valid_identifier(id, true)) {
                return CrabbyError{CrabbyError::Version,
                    "invalid prerelease identifier '" + id + "' in '" + input + "'"};
            }
            v.prerelease.push_back(id);
        }
    }

    if (!build.empty()) {
        for (auto& id : split(build, '.')) {
            if (!valid_identifier(id, false)) {
                return CrabbyError{CrabbyError::Version,
                    "invalid build identifier '" + id + "' in '" + input + "'"};
            }
            v.build.push_back(id);
        }
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    if (!prerelease.empty()) {
        s += "-" + join(prerelease, '.');
    }
    if (!build.empty()) {
        s += "+" + join(build, '.');
    }
    return s;
}

bool Version::operator==(const Version& o) const { return compare_versions(*this, o) == 0; }
bool Version::operator!=(const Version& o) const { return !(*this == o); }
bool Version::operator<(const Version& o) const { return compare_versions(*this, o) < 0; }
bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

static bool is_wildcard(const std::string& s) {
    return s == "x" || s == "X" || s == "*";
}

Result<PartialVersion> PartialVersion::parse(const std::string& input) {
    std::string s = strip_prefix(trim(input));
    PartialVersion pv;
    if (s.empty() || is_wildcard(s)) {
        return Result<PartialVersion>::ok(pv);
    }

    std::string core, pre, build;
    split_suffixes(s, core, pre, build);

    auto parts = split(core, '.');
    if (parts.size() > 3) {
        return CrabbyError{CrabbyError::Version,
            "invalid partial version '" + input + "'"};
    }

    int* fields[] = {&pv.major, &pv.minor, &pv.patch};
    bool wildcard_seen = false;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (is_wildcard(parts[i])) {
            wildcard_seen = true;
            continue;
        }
        if (wildcard_seen) {
            return CrabbyError{CrabbyError::Version,
                "numeric component after wildcard in '" + input + "'"};
        }
        auto n = parse_numeric(parts[i]);
        if (!n) {
            return CrabbyError{CrabbyError::Version,
                "invalid component '" + parts[i] + "' in '" + input + "'"};
        }
        *fields[i] = *n;
    }

    if (!pre.empty()) {
        if (!pv.is_complete()) {
            return CrabbyError{CrabbyError::Version,
                "prerelease on incomplete version '" + input + "'"};
        }
        for (auto& id : split(pre, '.')) {
            if (!valid_identifier(id, true)) {
                return CrabbyError{CrabbyError::Version,
                    "invalid prerelease identifier '" + id + "' in '" + input + "'"};
            }
            pv.prerelease.push_back(id);
        }
    }

    return Result<PartialVersion>::ok(std::move(pv));
}

std::string PartialVersion::to_string() const {
    if (major < 0) return "*";
    std::string s = std::to_string(major);
    s += "." + (minor >= 0 ? std::to_string(minor) : std::string("x"));
    s += "." + (patch >= 0 ? std::to_string(patch) : std::string("x"));
    if (!prerelease.empty()) {
        s += "-" + join(prerelease, '.');
    }
    return s;
}

Version PartialVersion::floor() const {
    Version v;
    v.major = std::max(major, 0);
    v.minor = std::max(minor, 0);
    v.patch = std::max(patch, 0);
    v.prerelease = prerelease;
    return v;
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

bool VersionConstraint::matches(const Version& v) const {
    int c = compare_versions(v, version);
    switch (op) {
    case ConstraintOp::Exact:     return c == 0;
    case ConstraintOp::GreaterEq: return c >= 0;
    case ConstraintOp::Greater:   return c > 0;
    case ConstraintOp::LessEq:    return c <= 0;
    case ConstraintOp::Less:      return c < 0;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    std::string prefix;
    switch (op) {
    case ConstraintOp::Exact:     prefix = "="; break;
    case ConstraintOp::GreaterEq: prefix = ">="; break;
    case ConstraintOp::Greater:   prefix = ">"; break;
    case ConstraintOp::LessEq:    prefix = "<="; break;
    case ConstraintOp::Less:      prefix = "<"; break;
    }
    return prefix + version.to_string();
}

// ---------------------------------------------------------------------------
// ConstraintSet
// ---------------------------------------------------------------------------

bool ConstraintSet::matches(const Version& v) const {
    if (never) return false;
    for (auto& c : constraints) {
        if (!c.matches(v)) return false;
    }
    if (!v.is_prerelease()) return true;

    // Prereleases only match when a comparator opts into the same tuple
    for (auto& c : constraints) {
        if (c.version.is_prerelease() && c.version.same_tuple(v)) return true;
    }
    return false;
}

std::string ConstraintSet::to_string() const {
    if (never) return "<0.0.0-0";
    if (constraints.empty()) return "*";
    std::string s;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (i > 0) s += " ";
        s += constraints[i].to_string();
    }
    return s;
}

// ---------------------------------------------------------------------------
// Range desugaring
// ---------------------------------------------------------------------------

// Exclusive upper bound that also excludes prereleases of the bound itself.
static Version upper(int major, int minor, int patch) {
    Version v;
    v.major = major;
    v.minor = minor;
    v.patch = patch;
    v.prerelease = {"0"};
    return v;
}

static void add(ConstraintSet& set, ConstraintOp op, Version v) {
    set.constraints.push_back(VersionConstraint{op, std::move(v)});
}

// Upper bound for an x-range such as "1" or "1.2".
static Version xrange_upper(const PartialVersion& pv) {
    if (pv.minor < 0) return upper(pv.major + 1, 0, 0);
    return upper(pv.major, pv.minor + 1, 0);
}

static void desugar_caret(ConstraintSet& set, const PartialVersion& pv) {
    if (pv.is_any()) return;
    add(set, ConstraintOp::GreaterEq, pv.floor());
    if (pv.minor < 0) {
        add(set, ConstraintOp::Less, upper(pv.major + 1, 0, 0));
    } else if (pv.major > 0) {
        add(set, ConstraintOp::Less, upper(pv.major + 1, 0, 0));
    } else if (pv.patch < 0 || pv.minor > 0) {
        add(set, ConstraintOp::Less, upper(0, pv.minor + 1, 0));
    } else {
        add(set, ConstraintOp::Less, upper(0, 0, pv.patch + 1));
    }
}

static void desugar_tilde(ConstraintSet& set, const PartialVersion& pv) {
    if (pv.is_any()) return;
    add(set, ConstraintOp::GreaterEq, pv.floor());
    add(set, ConstraintOp::Less, xrange_upper(pv));
}

static void desugar_primitive(ConstraintSet& set, ConstraintOp op, const PartialVersion& pv) {
    switch (op) {
    case ConstraintOp::Exact:
        if (pv.is_any()) return;
        if (pv.is_complete()) {
            add(set, ConstraintOp::Exact, pv.floor());
        } else {
            add(set, ConstraintOp::GreaterEq, pv.floor());
            add(set, ConstraintOp::Less, xrange_upper(pv));
        }
        return;
    case ConstraintOp::GreaterEq:
        if (pv.is_any()) return;
        add(set, ConstraintOp::GreaterEq, pv.floor());
        return;
    case ConstraintOp::Greater:
        if (pv.is_any()) {
            set.never = true;
        } else if (pv.is_complete()) {
            add(set, ConstraintOp::Greater, pv.floor());
        } else {
            Version v = xrange_upper(pv);
            v.prerelease.clear();
            add(set, ConstraintOp::GreaterEq, v);
        }
        return;
    case ConstraintOp::Less:
        if (pv.is_any()) {
            set.never = true;
        } else if (pv.is_complete()) {
            add(set, ConstraintOp::Less, pv.floor());
        } else {
            add(set, ConstraintOp::Less, upper(pv.major, std::max(pv.minor, 0), 0));
        }
        return;
    case ConstraintOp::LessEq:
        if (pv.is_any()) return;
        if (pv.is_complete()) {
            add(set, ConstraintOp::LessEq, pv.floor());
        } else {
            add(set, ConstraintOp::Less, xrange_upper(pv));
        }
        return;
    }
}

static Status parse_hyphen(ConstraintSet& set, const std::string& lo, const std::string& hi) {
    auto from = PartialVersion::parse(lo);
    if (from.is_err()) return std::move(from).error();
    auto to = PartialVersion::parse(hi);
    if (to.is_err()) return std::move(to).error();

    if (!from.value().is_any()) {
        add(set, ConstraintOp::GreaterEq, from.value().floor());
    }
    const auto& t = to.value();
    if (!t.is_any()) {
        if (t.is_complete()) {
            add(set, ConstraintOp::LessEq, t.floor());
        } else {
            add(set, ConstraintOp::Less, xrange_upper(t));
        }
    }
    return ok_status();
}

static bool is_operator_only(const std::string& tok) {
    return tok == ">" || tok == ">=" || tok == "<" || tok == "<=" ||
           tok == "=" || tok == "^" || tok == "~" || tok == "~>";
}

static Status parse_comparator(ConstraintSet& set, const std::string& tok) {
    size_t pos = 0;
    enum { Prim, Caret, Tilde } kind = Prim;
    ConstraintOp op = ConstraintOp::Exact;

    if (tok.compare(0, 2, ">=") == 0) { op = ConstraintOp::GreaterEq; pos = 2; }
    else if (tok.compare(0, 2, "<=") == 0) { op = ConstraintOp::LessEq; pos = 2; }
    else if (tok.compare(0, 2, "~>") == 0) { kind = Tilde; pos = 2; }
    else if (tok[0] == '>') { op = ConstraintOp::Greater; pos = 1; }
    else if (tok[0] == '<') { op = ConstraintOp::Less; pos = 1; }
    else if (tok[0] == '^') { kind = Caret; pos = 1; }
    else if (tok[0] == '~') { kind = Tilde; pos = 1; }
    else if (tok[0] == '=') { pos = 1; }

    auto pv = PartialVersion::parse(tok.substr(pos));
    if (pv.is_err()) return std::move(pv).error();

    switch (kind) {
    case Caret: desugar_caret(set, pv.value()); break;
    case Tilde: desugar_tilde(set, pv.value()); break;
    case Prim:  desugar_primitive(set, op, pv.value()); break;
    }
    return ok_status();
}

static Result<ConstraintSet> parse_set(const std::string& text) {
    ConstraintSet set;
    std::string s = trim(text);
    if (s.empty()) return Result<ConstraintSet>::ok(set);

    size_t hyphen = s.find(" - ");
    if (hyphen != std::string::npos) {
        CRABBY_TRY(parse_hyphen(set, s.substr(0, hyphen), s.substr(hyphen + 3)));
        return Result<ConstraintSet>::ok(std::move(set));
    }

    std::vector<std::string> tokens;
    std::string current;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) tokens.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));

    for (size_t i = 0; i < tokens.size(); ++i) {
        std::string tok = tokens[i];
        // ">= 1.2.3" is written with a space after the operator
        if (is_operator_only(tok)) {
            if (i + 1 >= tokens.size()) {
                return CrabbyError{CrabbyError::Version,
                    "operator '" + tok + "' without version in '" + text + "'"};
            }
            tok += tokens[++i];
        }
        CRABBY_TRY(parse_comparator(set, tok));
    }
    return Result<ConstraintSet>::ok(std::move(set));
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

Result<VersionReq> VersionReq::parse(const std::string& s) {
    VersionReq req;
    req.raw = trim(s);

    if (req.raw.empty()) {
        req.alternatives.emplace_back();
        return Result<VersionReq>::ok(std::move(req));
    }

    size_t start = 0;
    while (true) {
        size_t bar = req.raw.find("||", start);
        std::string part = req.raw.substr(start,
            bar == std::string::npos ? std::string::npos : bar - start);
        auto set = parse_set(part);
        if (set.is_err()) {
            return std::move(set).context("invalid range '" + req.raw + "'").error();
        }
        req.alternatives.push_back(std::move(set).value());
        if (bar == std::string::npos) break;
        start = bar + 2;
    }

    return Result<VersionReq>::ok(std::move(req));
}

VersionReq VersionReq::any() {
    VersionReq req;
    req.raw = "*";
    req.alternatives.emplace_back();
    return req;
}

bool VersionReq::matches(const Version& v) const {
    return std::any_of(alternatives.begin(), alternatives.end(),
        [&](const ConstraintSet& set) { return set.matches(v); });
}

bool VersionReq::is_any() const {
    return std::any_of(alternatives.begin(), alternatives.end(),
        [](const ConstraintSet& set) { return !set.never && set.constraints.empty(); });
}

std::string VersionReq::normalized() const {
    std::string s;
    for (size_t i = 0; i < alternatives.size(); ++i) {
        if (i > 0) s += " || ";
        s += alternatives[i].to_string();
    }
    return s;
}

std::optional<Version> max_satisfying(const std::vector<Version>& versions,
                                      const std::vector<VersionReq>& reqs) {
    std::optional<Version> best;
    for (auto& v : versions) {
        bool ok = std::all_of(reqs.begin(), reqs.end(),
            [&](const VersionReq& r) { return r.matches(v); });
        if (ok && (!best || v > *best)) best = v;
    }
    return best;
}

} // namespace crabby
