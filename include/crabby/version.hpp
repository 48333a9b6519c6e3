#pragma once

#include <crabby/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace crabby {

// Semantic version: major.minor.patch[-prerelease][+build]
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::vector<std::string> prerelease;  // dot-separated identifiers, empty for release
    std::vector<std::string> build;       // ignored by ordering

    // Accepts an optional leading 'v' or '='.
    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool is_prerelease() const { return !prerelease.empty(); }
    bool same_tuple(const Version& o) const {
        return major == o.major && minor == o.minor && patch == o.patch;
    }

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Partial version for ranges: "1", "1.2", "1.2.x", "*"
struct PartialVersion {
    int major = -1;  // -1 means wildcard / unset
    int minor = -1;
    int patch = -1;
    std::vector<std::string> prerelease;

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;

    bool is_any() const { return major < 0; }
    bool is_complete() const { return patch >= 0; }

    // Missing components filled with zero.
    Version floor() const;
};

enum class ConstraintOp {
    Exact,       // =1.2.3
    GreaterEq,   // >=1.2.3
    Greater,     // >1.2.3
    LessEq,      // <=1.2.3
    Less,        // <1.2.3
};

// A single primitive comparator. Caret, tilde, x-ranges and hyphen ranges
// are desugared into these at parse time.
struct VersionConstraint {
    ConstraintOp op = ConstraintOp::Exact;
    Version version;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// Conjunction of comparators ("space separated"). Empty matches everything.
struct ConstraintSet {
    std::vector<VersionConstraint> constraints;
    bool never = false;  // e.g. "<0.0.0-0" or "<*"

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// npm range expression: disjunction of ConstraintSets joined by "||".
struct VersionReq {
    std::vector<ConstraintSet> alternatives;
    std::string raw;

    static Result<VersionReq> parse(const std::string& s);
    static VersionReq any();

    bool matches(const Version& v) const;
    bool is_any() const;

    // The expression as written.
    const std::string& to_string() const { return raw; }
    // The desugared comparator form, e.g. ">=1.2.3 <2.0.0-0".
    std::string normalized() const;
};

// Highest version matching every requirement, or nullopt.
std::optional<Version> max_satisfying(const std::vector<Version>& versions,
                                      const std::vector<VersionReq>& reqs);

} // namespace crabby
