#include <crabby/project.hpp>
#include <crabby/cache.hpp>
#include <crabby/log.hpp>

namespace crabby {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

Result<fs::path> find_manifest(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return CrabbyError{CrabbyError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        fs::path candidate = dir / kManifestName;
        if (fs::exists(candidate, ec)) {
            return Result<fs::path>::ok(candidate);
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            return CrabbyError{CrabbyError::NotFound,
                "no package.json found in " + start_dir.string() + " or any parent directory"};
        }
        dir = parent;
    }
}

bool has_manifest(const fs::path& dir) {
    std::error_code ec;
    return fs::exists(dir / kManifestName, ec);
}

// ---------------------------------------------------------------------------
// Project
// ---------------------------------------------------------------------------

Result<Project> Project::load(const fs::path& project_dir) {
    std::error_code ec;
    fs::path abs_root = fs::canonical(project_dir, ec);
    if (ec) abs_root = fs::absolute(project_dir);

    Project proj;
    proj.root_dir = abs_root;
    proj.manifest_path = abs_root / kManifestName;

    auto manifest = Manifest::load(proj.manifest_path);
    if (manifest.is_err()) return std::move(manifest).error();
    proj.manifest = std::move(manifest).value();

    fs::path lock_path = proj.lockfile_path();
    if (fs::exists(lock_path, ec)) {
        auto lock = Lockfile::load(lock_path);
        if (lock.is_ok()) {
            proj.lockfile = std::move(lock).value();
        } else {
            // Unreadable lockfiles are replaced by the next successful install.
            log::warn("ignoring %s\n%s", lock_path.string().c_str(),
                      lock.error().format().c_str());
        }
    }

    return Result<Project>::ok(std::move(proj));
}

Result<Project> Project::discover(const fs::path& start_dir) {
    auto manifest_path = find_manifest(start_dir);
    if (manifest_path.is_err()) return std::move(manifest_path).error();

    return Project::load(manifest_path.value().parent_path());
}

Result<Workspace> Project::workspace() const {
    return Workspace::discover(root_dir, manifest);
}

Result<InstallOutcome> Project::install(Registry& registry, const Config& config,
                                        const InstallRequest& request) {
    auto ws = workspace();
    if (ws.is_err()) return std::move(ws).error();
    if (ws.value().member_count() > 0) {
        log::info("workspace with %zu members", ws.value().member_count());
    }

    ResolveOptions resolve_options;
    resolve_options.include_dev = config.dev_included();
    resolve_options.update_package = request.update_package;
    resolve_options.integrity_algorithm = config.algorithm();

    Resolver resolver(registry, &ws.value());
    auto resolved = resolver.resolve(manifest, lockfile, resolve_options);
    if (resolved.is_err()) return std::move(resolved).error();

    InstallOutcome outcome;
    outcome.resolution = std::move(resolved).value();

    PackageCache cache(config.cache_root(), config.algorithm());
    auto opened = cache.open();
    if (opened.is_err()) {
        // The index is bookkeeping; the cache still works without it.
        log::warn("%s", opened.error().message.c_str());
    }

    ShellScriptRunner shell;
    ScriptRunner& scripts = request.scripts ? *request.scripts : shell;

    Installer installer(registry, cache, scripts,
                        InstallOptions::from_config(config), &ws.value());
    outcome.report = installer.install(outcome.resolution.graph, root_dir);

    if (!outcome.report.ok()) {
        log::error("%s not written", kLockfileName);
        return Result<InstallOutcome>::ok(std::move(outcome));
    }

    // A production install replayed from the lockfile leaves it alone: the
    // resolution has no dev entries, and writing it would invalidate the
    // lockfile for the next full install.
    if (!resolve_options.include_dev && outcome.resolution.lockfile_used &&
        !request.update_package) {
        log::info("%s kept, dev dependencies were not installed", kLockfileName);
        return Result<InstallOutcome>::ok(std::move(outcome));
    }

    auto& lock = outcome.resolution.lockfile;
    for (auto& entry : lock.packages) {
        auto it = outcome.report.computed_integrity.find(entry.path);
        if (entry.integrity.empty() && it != outcome.report.computed_integrity.end()) {
            entry.integrity = it->second;
        }
    }

    auto saved = lock.save(lockfile_path());
    if (saved.is_err()) return std::move(saved).error();
    outcome.lockfile_written = true;
    lockfile = lock;

    return Result<InstallOutcome>::ok(std::move(outcome));
}

Status Project::add(const std::string& name, const std::string& range, bool dev) {
    CRABBY_TRY(manifest.add_dependency(name, range, dev));
    CRABBY_TRY(manifest.save(manifest_path));
    log::info("added %s@%s to %s", name.c_str(), range.c_str(),
              dev ? "devDependencies" : "dependencies");
    return ok_status();
}

Status Project::remove(const std::string& name) {
    if (!manifest.remove_dependency(name)) {
        return CrabbyError{CrabbyError::NotFound,
            "'" + name + "' is not a dependency of " + manifest.name};
    }
    CRABBY_TRY(manifest.save(manifest_path));
    log::info("removed %s", name.c_str());
    return ok_status();
}

} // namespace crabby
