#pragma once

#include <crabby/digest.hpp>
#include <crabby/manifest.hpp>
#include <crabby/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace crabby {

enum class PackageSource {
    Registry,
    Workspace,
};

const char* source_name(PackageSource source);
std::optional<PackageSource> parse_source(const std::string& s);

struct LockRequirement {
    std::string name;
    std::string version;

    // "name@version"; the split happens at the last '@' so scopes survive
    std::string to_string() const { return name + "@" + version; }
    static std::optional<LockRequirement> parse(const std::string& s);
};

struct LockEntry {
    std::string name;
    std::string version;
    std::string path;            // install path, "node_modules/a/node_modules/b"
    PackageSource source = PackageSource::Registry;
    std::string integrity;       // SRI string; empty for workspace members
    std::string resolved;        // tarball URL, or member dir for workspaces
    std::vector<LockRequirement> requirements;   // in declaration order

    // Install path of the scope this entry lives in: "" for the root
    // node_modules, "node_modules/a" for a package nested under a.
    std::string scope_path() const;
};

struct Lockfile {
    static constexpr int kFormatVersion = 1;

    int lockfile_version = kFormatVersion;
    std::string manifest_hash;
    HashAlgorithm integrity_algorithm = HashAlgorithm::Sha512;
    std::vector<LockEntry> packages;   // sorted by path

    static Result<Lockfile> parse(const std::string& toml_str,
                                  const std::string& origin = "crabby.lock");
    static Result<Lockfile> load(const std::filesystem::path& path);

    // Deterministic: the same entries always produce the same bytes.
    std::string serialize() const;
    // Atomic replace.
    Status save(const std::filesystem::path& path) const;

    const LockEntry* find(const std::string& path) const;
    const LockEntry* find_in_scope(const std::string& scope_path,
                                   const std::string& name) const;

    void sort();

    // True when the manifest's dependency sections hash to manifest_hash and
    // every root spec is answered by a root-level entry: a workspace entry,
    // or a registry entry whose version satisfies the range.
    bool is_consistent(const Manifest& manifest, bool include_dev) const;
};

inline constexpr const char* kLockfileName = "crabby.lock";

// "node_modules/<name>" below the given scope path
std::string install_path(const std::string& scope_path, const std::string& name);

} // namespace crabby
