#include <crabby/installer.hpp>
#include <crabby/fsutil.hpp>
#include <crabby/log.hpp>
#include <crabby/manifest.hpp>

#include <algorithm>
#include <set>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace crabby {

// ---------------------------------------------------------------------------
// Options and report
// ---------------------------------------------------------------------------

InstallOptions InstallOptions::from_config(const Config& config) {
    InstallOptions o;
    o.fetch.jobs = config.jobs();
    o.fetch.retries = config.retries();
    o.fetch.retry_delay_ms = config.retry_delay();
    o.fetch.retry_max_delay_ms = config.retry_max_delay();
    o.link_mode = config.links();
    o.ignore_scripts = config.scripts_ignored();
    o.script_timeout_seconds = config.script_timeout();
    return o;
}

int InstallReport::exit_code() const {
    if (fatal) return 1;
    if (!failed_scripts.empty()) return 2;
    return 0;
}

std::string InstallReport::summary() const {
    std::ostringstream ss;
    if (fatal) {
        ss << "install failed";
        if (!failed_package.empty()) ss << " at " << failed_package;
        ss << ": " << fatal->message;
        return ss.str();
    }
    ss << "installed " << installed << " package" << (installed == 1 ? "" : "s")
       << " (" << fetched << " fetched, " << cache_hits << " from cache)";
    if (linked_workspaces > 0) ss << ", " << linked_workspaces << " workspace links";
    if (linked_bins > 0) ss << ", " << linked_bins << " bins";
    if (!failed_scripts.empty()) {
        ss << "; " << failed_scripts.size() << " lifecycle script"
           << (failed_scripts.size() == 1 ? "" : "s") << " failed";
    }
    return ss.str();
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

fs::path scope_bin_dir(const fs::path& project_root, const Scope& scope) {
    fs::path dir = project_root;
    if (!scope.path.empty()) dir /= scope.path;
    return dir / "node_modules" / ".bin";
}

// A bin target must stay inside its package.
bool is_contained(const fs::path& relative) {
    if (relative.empty() || relative.is_absolute()) return false;
    auto norm = relative.lexically_normal();
    if (norm.empty()) return false;
    return *norm.begin() != "..";
}

Status make_executable(const fs::path& target) {
    std::error_code ec;
    fs::permissions(target,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        return CrabbyError{CrabbyError::FileSystem,
            "cannot mark " + target.string() + " executable: " + ec.message()};
    }
    return ok_status();
}

Status write_bin_link(const fs::path& bin_dir, const std::string& name,
                      const fs::path& relative_target) {
    std::error_code ec;
    fs::create_directories(bin_dir, ec);
    if (ec) {
        return CrabbyError{CrabbyError::FileSystem,
            "cannot create " + bin_dir.string() + ": " + ec.message()};
    }

    fs::path link = bin_dir / name;
    CRABBY_TRY(fsutil::remove_path(link));
#ifdef _WIN32
    std::string shim = "@\"%~dp0\\" + relative_target.string() + "\" %*\r\n";
    CRABBY_TRY(fsutil::write_file_atomic(bin_dir / (name + ".cmd"), shim));
#endif
    fs::create_symlink(relative_target, link, ec);
    if (ec) {
        return CrabbyError{CrabbyError::FileSystem,
            "cannot link " + link.string() + ": " + ec.message()};
    }
    return ok_status();
}

} // namespace

// ---------------------------------------------------------------------------
// Installer
// ---------------------------------------------------------------------------

Installer::Installer(Registry& registry, PackageCache& cache, ScriptRunner& scripts,
                     InstallOptions options, const Workspace* workspace)
    : registry_(registry), cache_(cache), scripts_(scripts),
      options_(options), workspace_(workspace) {}

InstallReport Installer::install(const DependencyGraph& graph, const fs::path& project_root) {
    InstallReport report;
    auto order = graph.install_order();
    log::info("installing %zu packages into %s", order.size(),
              (project_root / "node_modules").string().c_str());

    std::vector<PackageId> by_path = order;
    std::sort(by_path.begin(), by_path.end(), [&](PackageId a, PackageId b) {
        return graph.package(a).install_path < graph.package(b).install_path;
    });

    {
        Fetcher fetcher(registry_, cache_, options_.fetch);

        // Queue downloads in dependency order so leaves arrive first.
        std::map<PackageId, FetchFuture> pending;
        for (PackageId id : order) {
            const auto& pkg = graph.package(id);
            if (pkg.source != PackageSource::Registry) continue;
            CacheKey key{pkg.name, pkg.version.to_string(), pkg.integrity};
            pending.emplace(id, fetcher.request(key, pkg.tarball_url));
        }

        // Parents are placed before their nested node_modules are filled.
        for (PackageId id : by_path) {
            const auto& pkg = graph.package(id);

            Status placed = ok_status();
            if (pkg.source == PackageSource::Workspace) {
                placed = link_member(pkg, project_root);
                if (placed.is_ok()) ++report.linked_workspaces;
            } else {
                const auto& fetched = pending.at(id).get();
                if (fetched.is_err()) {
                    placed = fetched.error();
                } else {
                    const auto& got = fetched.value();
                    if (got.cache_hit) {
                        ++report.cache_hits;
                    } else {
                        ++report.fetched;
                    }
                    if (pkg.integrity.empty()) {
                        report.computed_integrity[pkg.install_path] = got.entry.key.integrity;
                    }
                    placed = materialize(graph, id, project_root, got.entry.path);
                    if (placed.is_ok()) ++report.installed;
                }
            }

            if (placed.is_err()) {
                fetcher.cancel();
                report.fatal = std::move(placed).error();
                report.failed_package = pkg.id();
                log::error("%s: %s", pkg.id().c_str(), report.fatal->message.c_str());
                break;
            }
        }
        // Fetcher joins its in-flight downloads here.
    }

    if (report.fatal) return report;

    remove_extraneous(graph, project_root);
    report.linked_bins = link_bins(graph, project_root);

    if (options_.ignore_scripts) {
        log::debug("lifecycle scripts skipped");
    } else {
        run_scripts(graph, project_root, report);
    }

    log::info("%s", report.summary().c_str());
    return report;
}

Status Installer::materialize(const DependencyGraph& graph, PackageId id,
                              const fs::path& project_root, const fs::path& cached) {
    const auto& pkg = graph.package(id);
    fs::path target = project_root / pkg.install_path;
    fs::path staging = fsutil::temp_sibling(target);

    log::debug("linking %s -> %s", pkg.id().c_str(), pkg.install_path.c_str());

    auto copied = fsutil::copy_tree(cached, staging,
                                    options_.link_mode == LinkMode::Hardlink);
    if (copied.is_err()) {
        auto removed = fsutil::remove_path(staging);
        if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
        return copied;
    }

    auto cleared = fsutil::remove_path(target);
    if (cleared.is_err()) {
        auto removed = fsutil::remove_path(staging);
        if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
        return cleared;
    }

    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        auto removed = fsutil::remove_path(staging);
        if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
        return CrabbyError{CrabbyError::FileSystem,
            "cannot move " + pkg.id() + " into " + target.string() + ": " + ec.message()};
    }
    return ok_status();
}

Status Installer::link_member(const ResolvedPackage& pkg, const fs::path& project_root) {
    fs::path link_path = project_root / pkg.install_path;
    log::debug("linking workspace member %s -> %s", pkg.name.c_str(),
               pkg.local_path.generic_string().c_str());

    if (workspace_) {
        if (const auto* member = workspace_->find(pkg.name)) {
            return workspace_->link(*member, link_path);
        }
    }

    fs::path target = project_root / pkg.local_path;
    fs::path relative = target.lexically_relative(link_path.parent_path());
    return fsutil::link_directory(relative.empty() ? target : relative, link_path);
}

size_t Installer::link_bins(const DependencyGraph& graph, const fs::path& project_root) {
    struct Candidate {
        PackageId pkg;
        std::string name;
        fs::path relative;   // from the .bin dir
        bool direct;
    };

    // Scope id -> bin name -> chosen candidate
    std::map<ScopeId, std::map<std::string, Candidate>> chosen;

    std::vector<PackageId> ids = graph.install_order();
    std::sort(ids.begin(), ids.end(), [&](PackageId a, PackageId b) {
        return graph.package(a).install_path < graph.package(b).install_path;
    });

    for (PackageId id : ids) {
        const auto& pkg = graph.package(id);
        fs::path dir = project_root / pkg.install_path;
        auto meta = PackageMeta::load(dir);
        if (meta.is_err()) {
            log::debug("%s: %s", pkg.id().c_str(), meta.error().message.c_str());
            continue;
        }
        if (meta.value().bin.empty()) continue;

        const auto& scope = graph.scope(pkg.scope);
        PackageId owner = scope.owner ? *scope.owner : graph.root();
        auto deps = graph.dependencies_of(owner);
        bool direct = std::find(deps.begin(), deps.end(), id) != deps.end();

        for (const auto& bin : meta.value().bin) {
            fs::path rel(bin.path);
            if (!is_contained(rel)) {
                log::warn("%s: bin %s points outside the package, skipped",
                          pkg.id().c_str(), bin.name.c_str());
                continue;
            }
            Candidate c{id, bin.name, fs::path("..") / pkg.name / rel.lexically_normal(), direct};

            auto& slot = chosen[pkg.scope];
            auto it = slot.find(bin.name);
            if (it == slot.end()) {
                slot.emplace(bin.name, std::move(c));
            } else if (direct && !it->second.direct) {
                log::debug("bin %s: %s replaces %s", bin.name.c_str(), pkg.id().c_str(),
                           graph.package(it->second.pkg).id().c_str());
                it->second = std::move(c);
            } else {
                log::debug("bin %s: keeping %s over %s", bin.name.c_str(),
                           graph.package(it->second.pkg).id().c_str(), pkg.id().c_str());
            }
        }
    }

    size_t linked = 0;
    for (const auto& [scope_id, bins] : chosen) {
        fs::path bin_dir = scope_bin_dir(project_root, graph.scope(scope_id));
        for (const auto& [name, c] : bins) {
            fs::path target = (bin_dir / c.relative).lexically_normal();
            if (!fs::exists(target)) {
                log::warn("%s: bin %s target %s does not exist",
                          graph.package(c.pkg).id().c_str(), name.c_str(),
                          c.relative.generic_string().c_str());
                continue;
            }
            auto exec = make_executable(target);
            if (exec.is_err()) log::warn("%s", exec.error().message.c_str());

            auto written = write_bin_link(bin_dir, name, c.relative);
            if (written.is_err()) {
                log::warn("%s", written.error().message.c_str());
                continue;
            }
            ++linked;
        }
    }
    return linked;
}

void Installer::remove_extraneous(const DependencyGraph& graph, const fs::path& project_root) {
    fs::path node_modules = project_root / "node_modules";
    std::error_code ec;
    if (!fs::is_directory(node_modules, ec)) return;

    const auto& bindings = graph.scope(kRootScope).bindings;
    auto stray = [&](const std::string& name) { return bindings.count(name) == 0; };

    std::vector<fs::path> doomed;
    std::vector<fs::path> scope_dirs;
    for (const auto& entry : fs::directory_iterator(node_modules, ec)) {
        std::string name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') continue;
        if (name[0] == '@') {
            scope_dirs.push_back(entry.path());
            std::error_code sub_ec;
            for (const auto& inner : fs::directory_iterator(entry.path(), sub_ec)) {
                std::string full = name + "/" + inner.path().filename().string();
                if (stray(full)) doomed.push_back(inner.path());
            }
            continue;
        }
        if (name.find(".crabby-tmp-") != std::string::npos || stray(name)) {
            doomed.push_back(entry.path());
        }
    }

    for (const auto& path : doomed) {
        log::debug("removing extraneous %s", path.string().c_str());
        auto removed = fsutil::remove_path(path);
        if (removed.is_err()) log::warn("%s", removed.error().message.c_str());
    }

    // "@scope" directories left without packages
    for (const auto& dir : scope_dirs) {
        std::error_code empty_ec;
        if (fs::is_empty(dir, empty_ec) && !empty_ec) {
            log::debug("removing empty scope %s", dir.string().c_str());
            fs::remove(dir, empty_ec);
            if (empty_ec) log::warn("cannot remove %s: %s", dir.string().c_str(),
                                    empty_ec.message().c_str());
        }
    }
}

std::vector<fs::path> Installer::bin_path(const DependencyGraph& graph, PackageId id,
                                          const fs::path& project_root) const {
    std::vector<fs::path> dirs;
    for (ScopeId s : graph.scope_chain(id)) {
        dirs.push_back(scope_bin_dir(project_root, graph.scope(s)));
    }
    return dirs;
}

void Installer::run_scripts(const DependencyGraph& graph, const fs::path& project_root,
                            InstallReport& report) {
    auto run_events = [&](const std::string& label, const PackageMeta& meta,
                          ScriptContext& context, const auto& events) {
        for (const char* event : events) {
            auto command = meta.script(event);
            if (!command) continue;

            ++report.scripts_run;
            auto outcome = scripts_.run(event, *command, context);
            if (outcome.is_err()) {
                log::warn("%s", outcome.error().message.c_str());
                report.failed_scripts.push_back(
                    ScriptFailure{label, event, -1, outcome.error().message});
                return;
            }
            if (outcome.value().exit_code != 0) {
                log::warn("%s %s exited with code %d", label.c_str(), event,
                          outcome.value().exit_code);
                report.failed_scripts.push_back(ScriptFailure{
                    label, event, outcome.value().exit_code, outcome.value().output});
                return;
            }
        }
    };

    for (PackageId id : graph.install_order()) {
        const auto& pkg = graph.package(id);
        fs::path dir = project_root / pkg.install_path;
        auto meta = PackageMeta::load(dir);
        if (meta.is_err() || meta.value().scripts.empty()) continue;

        ScriptContext context;
        context.package_name = pkg.name;
        context.package_version = pkg.version.to_string();
        context.package_dir = dir;
        context.bin_dirs = bin_path(graph, id, project_root);
        context.timeout_seconds = options_.script_timeout_seconds;
        run_events(pkg.id(), meta.value(), context, kPackageLifecycle);
    }

    auto root_meta = PackageMeta::load(project_root);
    if (root_meta.is_err()) {
        log::debug("%s", root_meta.error().message.c_str());
        return;
    }
    const auto& root = graph.package(graph.root());
    ScriptContext context;
    context.package_name = root.name;
    context.package_version = root.version.to_string();
    context.package_dir = project_root;
    context.bin_dirs = {scope_bin_dir(project_root, graph.scope(kRootScope))};
    context.timeout_seconds = options_.script_timeout_seconds;
    run_events(root.name, root_meta.value(), context, kRootLifecycle);
}

} // namespace crabby
