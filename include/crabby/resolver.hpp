#pragma once

#include <crabby/digest.hpp>
#include <crabby/graph.hpp>
#include <crabby/lockfile.hpp>
#include <crabby/manifest.hpp>
#include <crabby/registry.hpp>
#include <crabby/result.hpp>
#include <crabby/workspace.hpp>

#include <optional>
#include <string>
#include <vector>

namespace crabby {

struct ResolveOptions {
    bool include_dev = true;
    // Re-resolve this package from the registry even when the lockfile
    // pins it; everything else stays locked.
    std::optional<std::string> update_package;
    HashAlgorithm integrity_algorithm = HashAlgorithm::Sha512;
    // Scope nesting beyond this is reported as a Cycle error
    int max_depth = 64;
};

struct Resolution {
    DependencyGraph graph;
    Lockfile lockfile;
    size_t registry_queries = 0;   // get_versions calls made
    size_t locked_reused = 0;      // placements answered by the lockfile
    bool lockfile_used = false;    // the input lockfile was consistent
};

// A root dependency with a newer release than the one it is locked at.
struct OutdatedPackage {
    std::string name;
    std::string range;               // as declared
    bool is_dev = false;
    std::optional<Version> current;  // locked version; nullopt when not locked
    std::optional<Version> wanted;   // newest version the range accepts
    Version latest;                  // "latest" dist-tag, else newest release
};

// Turns a manifest (plus optional lockfile and workspace) into a placed
// dependency graph. Breadth-first in declaration order: the first requester
// of a name decides the hoisted version, later incompatible requesters get a
// private copy nested under themselves. Deterministic for identical inputs.
class Resolver {
public:
    explicit Resolver(Registry& registry, const Workspace* workspace = nullptr);

    // UnsatisfiableRange when no published version matches a range or a
    // package does not exist, RegistryUnavailable when metadata cannot be
    // fetched. An inconsistent lockfile is ignored, not an error.
    Result<Resolution> resolve(const Manifest& manifest,
                               const std::optional<Lockfile>& lockfile = std::nullopt,
                               const ResolveOptions& options = {});

    // Root dependencies whose locked version is behind wanted or latest, in
    // declaration order. Workspace members and packages missing from the
    // registry are skipped; one metadata query per dependency.
    Result<std::vector<OutdatedPackage>> outdated(const Manifest& manifest,
                                                  const std::optional<Lockfile>& lockfile,
                                                  bool include_dev = true);

private:
    Registry& registry_;
    const Workspace* workspace_;
};

} // namespace crabby
