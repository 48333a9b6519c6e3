#pragma once

#include <crabby/result.hpp>
#include <crabby/version.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace crabby {

enum class RangeKind {
    Semver,      // "^1.2.3", ">=1 <2 || 3.x", "*"
    Tag,         // "latest", "next"
    Workspace,   // "workspace:*"
};

const char* range_kind_name(RangeKind kind);

// One edge request: "name wants something matching range".
struct DependencySpec {
    std::string name;
    std::string range;          // as written
    RangeKind kind = RangeKind::Semver;
    VersionReq req;             // parsed range; for Workspace the part after "workspace:"
    bool is_dev = false;
    std::string requested_by;   // empty for the root manifest

    // Classifies and validates the range. Unsupported specifiers such as
    // "file:", "git+" or URLs are rejected with InvalidArg.
    static Result<DependencySpec> make(const std::string& name,
                                       const std::string& range,
                                       bool is_dev = false,
                                       const std::string& requested_by = "");

    // Tag ranges are satisfied by whatever the tag pointed at when it was
    // resolved, so they accept any version here.
    bool satisfied_by(const Version& v) const;

    std::string to_string() const { return name + "@" + range; }
};

struct BinEntry {
    std::string name;   // command name in .bin
    std::string path;   // relative to the package directory
};

// package.json of the project or of a workspace member.
struct Manifest {
    std::string name;
    std::string version;
    std::vector<DependencySpec> dependencies;
    std::vector<DependencySpec> dev_dependencies;
    std::vector<std::pair<std::string, std::string>> scripts;
    std::vector<std::string> workspaces;
    std::vector<BinEntry> bin;

    // Whole document; unknown fields survive save().
    nlohmann::ordered_json document;
    std::string origin;

    static Result<Manifest> parse(const std::string& text,
                                  const std::string& origin = "package.json");
    static Result<Manifest> load(const std::filesystem::path& path);

    std::string serialize() const;
    Status save(const std::filesystem::path& path) const;

    // Adds or replaces an entry. Moving between dependencies and
    // devDependencies happens when `dev` differs from the current section.
    Status add_dependency(const std::string& name, const std::string& range, bool dev);
    // False when the name was not declared.
    bool remove_dependency(const std::string& name);

    const DependencySpec* find_dependency(const std::string& name) const;

    // Regular dependencies in declaration order, then dev ones.
    std::vector<DependencySpec> specs(bool include_dev) const;

    std::optional<std::string> script(const std::string& event) const;

    bool is_workspace_root() const { return !workspaces.empty(); }

    // SHA-256 over the sorted dependency sections and workspace patterns.
    // Key order does not matter; any range change does.
    Result<std::string> dependency_hash() const;
};

// The fields the installer needs from an installed package's package.json.
// Parsing is lenient: dependency sections are not looked at.
struct PackageMeta {
    std::string name;
    std::string version;
    std::vector<BinEntry> bin;
    std::vector<std::pair<std::string, std::string>> scripts;

    static Result<PackageMeta> load(const std::filesystem::path& package_dir);

    std::optional<std::string> script(const std::string& event) const;
};

inline constexpr const char* kManifestName = "package.json";

} // namespace crabby
