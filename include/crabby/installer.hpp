#pragma once

#include <crabby/cache.hpp>
#include <crabby/config.hpp>
#include <crabby/error.hpp>
#include <crabby/fetcher.hpp>
#include <crabby/graph.hpp>
#include <crabby/registry.hpp>
#include <crabby/script.hpp>
#include <crabby/workspace.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace crabby {

struct InstallOptions {
    FetchOptions fetch;
    LinkMode link_mode = LinkMode::Hardlink;
    bool ignore_scripts = false;
    int script_timeout_seconds = 600;

    static InstallOptions from_config(const Config& config);
};

struct ScriptFailure {
    std::string package;     // "name@version", or the project name
    std::string event;
    int exit_code = -1;      // -1 when the script could not be started
    std::string output;
};

struct InstallReport {
    size_t installed = 0;        // packages materialized in node_modules
    size_t cache_hits = 0;
    size_t fetched = 0;
    size_t linked_workspaces = 0;
    size_t linked_bins = 0;
    size_t scripts_run = 0;
    std::vector<ScriptFailure> failed_scripts;

    std::optional<CrabbyError> fatal;
    std::string failed_package;

    // Integrity computed locally for packages the registry published
    // without one, keyed by install path.
    std::map<std::string, std::string> computed_integrity;

    bool ok() const { return !fatal.has_value(); }

    // 0 success, 1 fatal error, 2 installed but lifecycle scripts failed
    int exit_code() const;

    std::string summary() const;
};

// Materializes a resolved graph below a project root.
//
// Packages are fetched into the shared cache on a worker pool. On the
// calling thread each package is then copied (or hard-linked) from the
// cache to its install path, parents before nested children. Workspace
// members become directory links. Executables are linked into the .bin of
// the scope holding each package, and finally lifecycle scripts run in
// dependency order followed by the project's own scripts.
//
// A fetch or extract failure is fatal: remaining work is cancelled, the
// failing package leaves nothing behind and the report carries the error.
// Script failures are recorded and the install continues.
class Installer {
public:
    Installer(Registry& registry, PackageCache& cache, ScriptRunner& scripts,
              InstallOptions options = {}, const Workspace* workspace = nullptr);

    InstallReport install(const DependencyGraph& graph,
                          const std::filesystem::path& project_root);

private:
    Status materialize(const DependencyGraph& graph, PackageId id,
                       const std::filesystem::path& project_root,
                       const std::filesystem::path& cached);
    Status link_member(const ResolvedPackage& pkg,
                       const std::filesystem::path& project_root);
    size_t link_bins(const DependencyGraph& graph,
                     const std::filesystem::path& project_root);
    void remove_extraneous(const DependencyGraph& graph,
                           const std::filesystem::path& project_root);
    void run_scripts(const DependencyGraph& graph,
                     const std::filesystem::path& project_root,
                     InstallReport& report);
    std::vector<std::filesystem::path> bin_path(const DependencyGraph& graph, PackageId id,
                                                const std::filesystem::path& project_root) const;

    Registry& registry_;
    PackageCache& cache_;
    ScriptRunner& scripts_;
    InstallOptions options_;
    const Workspace* workspace_;
};

} // namespace crabby
