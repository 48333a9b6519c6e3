#pragma once

#include <crabby/config.hpp>
#include <crabby/installer.hpp>
#include <crabby/lockfile.hpp>
#include <crabby/manifest.hpp>
#include <crabby/registry.hpp>
#include <crabby/resolver.hpp>
#include <crabby/result.hpp>
#include <crabby/script.hpp>
#include <crabby/workspace.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace crabby {

struct InstallRequest {
    // Re-resolve one package, keeping the rest of the lockfile.
    std::optional<std::string> update_package;
    // Defaults to ShellScriptRunner
    ScriptRunner* scripts = nullptr;
};

struct InstallOutcome {
    Resolution resolution;
    InstallReport report;
    bool lockfile_written = false;
};

struct Project {
    Manifest manifest;
    std::filesystem::path root_dir;        // dir containing package.json
    std::filesystem::path manifest_path;   // full path to package.json
    std::optional<Lockfile> lockfile;      // crabby.lock, when present and readable

    // Walk up from start_dir to find package.json, then load
    static Result<Project> discover(const std::filesystem::path& start_dir);

    // Load from a specific directory (must contain package.json)
    static Result<Project> load(const std::filesystem::path& project_dir);

    std::filesystem::path lockfile_path() const { return root_dir / kLockfileName; }

    // Members of the workspace rooted here; empty for plain projects
    Result<Workspace> workspace() const;

    // Resolve, install and write crabby.lock. Resolution errors are returned
    // as errors. Install failures are reported in the outcome, and the
    // lockfile is only written when nothing fatal happened. An install
    // without dev dependencies keeps a lockfile it was replayed from.
    Result<InstallOutcome> install(Registry& registry, const Config& config,
                                   const InstallRequest& request = {});

    // Edit package.json and save it atomically.
    Status add(const std::string& name, const std::string& range, bool dev = false);
    // NotFound when the package is not a dependency.
    Status remove(const std::string& name);
};

// Walk up from start_dir to find the nearest package.json, return its path
Result<std::filesystem::path> find_manifest(const std::filesystem::path& start_dir);

bool has_manifest(const std::filesystem::path& dir);

} // namespace crabby
