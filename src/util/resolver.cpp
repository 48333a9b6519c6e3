#include <crabby/resolver.hpp>
#include <crabby/log.hpp>

#include <deque>
#include <unordered_map>

namespace crabby {

namespace {

struct Pending {
    DependencySpec spec;
    PackageId parent;
};

// State owned by a single resolve() call.
struct ResolveContext {
    Registry& registry;
    const ResolveOptions& options;
    const Lockfile* lock = nullptr;

    DependencyGraph graph;
    std::deque<Pending> queue;
    std::unordered_map<std::string, PackageVersions> metadata;
    std::unordered_map<std::string, PackageId> members;

    size_t queries = 0;
    size_t locked_reused = 0;

    ResolveContext(Registry& r, const ResolveOptions& o) : registry(r), options(o) {}
};

Version version_or_zero(const std::string& text, const std::string& who) {
    auto v = Version::parse(text);
    if (v.is_ok()) return std::move(v).value();
    if (!text.empty()) {
        log::debug("%s: version '%s' is not semver, using 0.0.0", who.c_str(), text.c_str());
    }
    return Version{};
}

std::string normalize_integrity(const std::string& raw, const std::string& who) {
    if (raw.empty()) return raw;
    auto parsed = Integrity::parse(raw);
    if (parsed.is_err()) {
        log::warn("%s: ignoring unparsable integrity '%s'", who.c_str(), raw.c_str());
        return "";
    }
    return parsed.value().to_string();
}

std::string requester(const ResolveContext& ctx, PackageId parent) {
    const auto& p = ctx.graph.package(parent);
    return p.is_root ? std::string("the root manifest") : p.id();
}

Result<const PackageVersions*> fetch_metadata(ResolveContext& ctx, const std::string& name) {
    auto it = ctx.metadata.find(name);
    if (it != ctx.metadata.end()) {
        return Result<const PackageVersions*>::ok(&it->second);
    }

    ++ctx.queries;
    log::debug("querying registry for %s", name.c_str());
    auto r = ctx.registry.get_versions(name);
    if (r.is_err()) {
        auto& e = r.error();
        if (e.code == CrabbyError::NotFound) {
            return CrabbyError{CrabbyError::UnsatisfiableRange,
                "package '" + name + "' does not exist in the registry"};
        }
        if (e.code == CrabbyError::UnsatisfiableRange || e.code == CrabbyError::InvalidArg) {
            return std::move(r).error();
        }
        return CrabbyError{CrabbyError::RegistryUnavailable,
            "cannot fetch metadata for '" + name + "': " + e.message, e.hint};
    }
    auto inserted = ctx.metadata.emplace(name, std::move(r).value());
    return Result<const PackageVersions*>::ok(&inserted.first->second);
}

// The requirement a spec puts on concrete versions. A dist-tag pins the
// version it currently points at.
Result<VersionReq> effective_req(const DependencySpec& spec, const PackageVersions& meta) {
    if (spec.kind != RangeKind::Tag) {
        return Result<VersionReq>::ok(spec.req);
    }
    auto tag = meta.dist_tags.find(spec.range);
    if (tag == meta.dist_tags.end()) {
        return CrabbyError{CrabbyError::UnsatisfiableRange,
            "package '" + spec.name + "' has no dist-tag '" + spec.range + "'"};
    }
    auto req = VersionReq::parse("=" + tag->second);
    if (req.is_err()) {
        return CrabbyError{CrabbyError::UnsatisfiableRange,
            "dist-tag '" + spec.range + "' of '" + spec.name +
            "' points at invalid version '" + tag->second + "'"};
    }
    return req;
}

// True when no scope visible from parent binds name, i.e. the request would
// be hoisted into the root scope.
bool lands_in_root(const ResolveContext& ctx, PackageId parent, const std::string& name) {
    for (ScopeId s : ctx.graph.scope_chain(parent)) {
        if (ctx.graph.lookup(s, name)) return false;
    }
    return true;
}

std::string available_versions_hint(const PackageVersions& meta) {
    if (meta.versions.empty()) return "no versions are published";
    std::string hint = "available:";
    size_t shown = 0;
    for (auto it = meta.versions.rbegin(); it != meta.versions.rend() && shown < 5; ++it, ++shown) {
        hint += " " + it->version.to_string();
    }
    if (meta.versions.size() > shown) hint += " ...";
    return hint;
}

// Picks the version to place for spec. When placing into the root scope,
// the ranges of every pending request that would share that placement are
// honored as well if one version satisfies them all; otherwise as many as
// possible in request order, the current (earliest) request always first.
Result<const VersionRecord*> select_version(ResolveContext& ctx, const Pending& item,
                                            const PackageVersions& meta, bool into_root) {
    auto own = effective_req(item.spec, meta);
    if (own.is_err()) return std::move(own).error();

    auto versions = meta.all_versions();
    std::vector<VersionReq> reqs{own.value()};

    if (into_root) {
        std::vector<VersionReq> others;
        for (const auto& p : ctx.queue) {
            if (p.spec.name != item.spec.name || p.spec.kind == RangeKind::Workspace) continue;
            if (!lands_in_root(ctx, p.parent, p.spec.name)) continue;
            auto r = effective_req(p.spec, meta);
            if (r.is_ok()) others.push_back(std::move(r).value());
        }

        std::vector<VersionReq> all = reqs;
        all.insert(all.end(), others.begin(), others.end());
        if (!others.empty() && max_satisfying(versions, all)) {
            reqs = std::move(all);
        } else {
            for (auto& r : others) {
                reqs.push_back(r);
                if (!max_satisfying(versions, reqs)) reqs.pop_back();
            }
        }
    }

    auto best = max_satisfying(versions, reqs);
    if (!best) {
        return CrabbyError{CrabbyError::UnsatisfiableRange,
            "no version of '" + item.spec.name + "' satisfies '" + item.spec.range +
            "' (required by " + requester(ctx, item.parent) + ")",
            available_versions_hint(meta)};
    }
    return Result<const VersionRecord*>::ok(meta.find(*best));
}

void enqueue_dependencies(ResolveContext& ctx, PackageId id) {
    for (const auto& dep : ctx.graph.package(id).dependencies) {
        ctx.queue.push_back(Pending{dep, id});
    }
}

PackageId commit(ResolveContext& ctx, const Pending& item, ResolvedPackage pkg) {
    log::debug("placed %s at %s (for %s)", pkg.id().c_str(),
               install_path(ctx.graph.scope(pkg.scope).path, pkg.name).c_str(),
               item.spec.to_string().c_str());
    PackageId id = ctx.graph.add_package(std::move(pkg));
    ctx.graph.add_edge(item.parent, id, item.spec.range);
    enqueue_dependencies(ctx, id);
    return id;
}

// Reuses the lockfile entry at the candidate install path if it still
// satisfies the request. Its dependencies become exact-version requests so
// the subtree is answered from the lockfile too.
Result<bool> place_from_lock(ResolveContext& ctx, const Pending& item, ScopeId target) {
    if (!ctx.lock) return Result<bool>::ok(false);
    if (ctx.options.update_package && *ctx.options.update_package == item.spec.name) {
        return Result<bool>::ok(false);
    }

    const LockEntry* entry = ctx.lock->find_in_scope(ctx.graph.scope(target).path,
                                                     item.spec.name);
    if (!entry || entry->source != PackageSource::Registry || entry->name != item.spec.name) {
        return Result<bool>::ok(false);
    }
    auto v = Version::parse(entry->version);
    if (v.is_err() || !item.spec.satisfied_by(v.value())) {
        return Result<bool>::ok(false);
    }

    ResolvedPackage pkg;
    pkg.name = entry->name;
    pkg.version = std::move(v).value();
    pkg.integrity = entry->integrity;
    pkg.tarball_url = entry->resolved;
    pkg.source = PackageSource::Registry;
    pkg.scope = target;
    pkg.depth = ctx.graph.package(item.parent).depth + 1;
    for (const auto& req : entry->requirements) {
        auto spec = DependencySpec::make(req.name, req.version, false, pkg.name);
        if (spec.is_err()) spec = DependencySpec::make(req.name, "*", false, pkg.name);
        if (spec.is_err()) return std::move(spec).error();
        pkg.dependencies.push_back(std::move(spec).value());
    }

    ++ctx.locked_reused;
    commit(ctx, item, std::move(pkg));
    return Result<bool>::ok(true);
}

Status place(ResolveContext& ctx, const Pending& item) {
    const auto& spec = item.spec;

    // Workspace members win over everything else
    auto member = ctx.members.find(spec.name);
    if (member != ctx.members.end()) {
        ctx.graph.add_edge(item.parent, member->second, spec.range);
        return ok_status();
    }
    if (spec.kind == RangeKind::Workspace) {
        return CrabbyError{CrabbyError::UnsatisfiableRange,
            "'" + spec.to_string() + "' (required by " + requester(ctx, item.parent) +
            ") does not name a workspace member"};
    }

    // Nearest binding along the scope chain decides: reuse or nest
    ScopeId target = kRootScope;
    for (ScopeId s : ctx.graph.scope_chain(item.parent)) {
        auto bound = ctx.graph.lookup(s, spec.name);
        if (!bound) continue;

        const auto& existing = ctx.graph.package(*bound);
        if (spec.satisfied_by(existing.version)) {
            ctx.graph.add_edge(item.parent, *bound, spec.range);
            return ok_status();
        }
        if (ctx.graph.package(item.parent).is_root) {
            return CrabbyError{CrabbyError::UnsatisfiableRange,
                "root requirement '" + spec.to_string() + "' conflicts with " + existing.id()};
        }
        target = ctx.graph.private_scope(item.parent);
        if (ctx.graph.lookup(target, spec.name)) {
            return CrabbyError{CrabbyError::UnsatisfiableRange,
                "conflicting requirements for '" + spec.name + "' inside " +
                requester(ctx, item.parent)};
        }
        break;
    }

    int depth = ctx.graph.package(item.parent).depth + 1;
    if (depth > ctx.options.max_depth) {
        return CrabbyError{CrabbyError::Cycle,
            "dependency nesting for '" + spec.name + "' exceeds depth " +
            std::to_string(ctx.options.max_depth),
            "the packages involved form a cycle of mutually incompatible versions"};
    }

    auto locked = place_from_lock(ctx, item, target);
    if (locked.is_err()) return std::move(locked).error();
    if (locked.value()) return ok_status();

    auto meta = fetch_metadata(ctx, spec.name);
    if (meta.is_err()) return std::move(meta).error();

    auto record = select_version(ctx, item, *meta.value(), target == kRootScope);
    if (record.is_err()) return std::move(record).error();
    const VersionRecord* rec = record.value();

    ResolvedPackage pkg;
    pkg.name = spec.name;
    pkg.version = rec->version;
    pkg.integrity = normalize_integrity(rec->integrity, spec.name + "@" + rec->version.to_string());
    pkg.tarball_url = rec->tarball_url;
    pkg.source = PackageSource::Registry;
    pkg.scope = target;
    pkg.depth = depth;
    for (const auto& [dep_name, dep_range] : rec->dependencies) {
        auto dep = DependencySpec::make(dep_name, dep_range, false, pkg.name);
        if (dep.is_err()) {
            return CrabbyError{CrabbyError::UnsatisfiableRange,
                pkg.id() + " depends on '" + dep_name + "@" + dep_range + "': " +
                dep.error().message};
        }
        pkg.dependencies.push_back(std::move(dep).value());
    }

    commit(ctx, item, std::move(pkg));
    return ok_status();
}

} // namespace

// ---------------------------------------------------------------------------
// Resolver
// ---------------------------------------------------------------------------

Resolver::Resolver(Registry& registry, const Workspace* workspace)
    : registry_(registry), workspace_(workspace) {}

Result<Resolution> Resolver::resolve(const Manifest& manifest,
                                     const std::optional<Lockfile>& lockfile,
                                     const ResolveOptions& options) {
    ResolveContext ctx(registry_, options);

    bool lock_used = false;
    if (lockfile) {
        if (lockfile->is_consistent(manifest, options.include_dev)) {
            ctx.lock = &*lockfile;
            lock_used = true;
        } else {
            log::info("lockfile is out of date with %s, re-resolving",
                      manifest.origin.c_str());
        }
    }

    ResolvedPackage root;
    root.name = manifest.name;
    root.version = version_or_zero(manifest.version, manifest.name);
    root.source = PackageSource::Workspace;
    root.dependencies = manifest.specs(options.include_dev);
    PackageId root_id = ctx.graph.set_root(std::move(root));

    // Members are linked at the root whether or not anything asks for them
    std::vector<PackageId> member_ids;
    if (workspace_) {
        for (const auto& m : workspace_->members()) {
            ResolvedPackage pkg;
            pkg.name = m.name;
            pkg.version = version_or_zero(m.version, m.name);
            pkg.source = PackageSource::Workspace;
            pkg.local_path = m.rel_dir;
            pkg.scope = kRootScope;
            pkg.depth = 1;
            for (auto spec : m.manifest.specs(options.include_dev)) {
                spec.requested_by = m.name;
                pkg.dependencies.push_back(std::move(spec));
            }
            PackageId id = ctx.graph.add_package(std::move(pkg));
            ctx.graph.add_edge(root_id, id, "workspace:*");
            ctx.members[m.name] = id;
            member_ids.push_back(id);
        }
    }

    enqueue_dependencies(ctx, root_id);
    for (PackageId id : member_ids) enqueue_dependencies(ctx, id);

    while (!ctx.queue.empty()) {
        Pending item = std::move(ctx.queue.front());
        ctx.queue.pop_front();
        CRABBY_TRY(place(ctx, item));
    }

    auto hash = manifest.dependency_hash();
    if (hash.is_err()) return std::move(hash).error();

    Resolution res;
    res.lockfile = ctx.graph.to_lockfile(hash.value(), options.integrity_algorithm);
    res.graph = std::move(ctx.graph);
    res.registry_queries = ctx.queries;
    res.locked_reused = ctx.locked_reused;
    res.lockfile_used = lock_used;

    log::info("resolved %zu packages (%zu registry queries, %zu from lockfile)",
              res.graph.package_count() - 1, res.registry_queries, res.locked_reused);
    return Result<Resolution>::ok(std::move(res));
}

// ---------------------------------------------------------------------------
// Outdated check
// ---------------------------------------------------------------------------

static std::optional<Version> newest_release(const PackageVersions& meta) {
    auto tag = meta.dist_tags.find("latest");
    if (tag != meta.dist_tags.end()) {
        auto v = Version::parse(tag->second);
        if (v.is_ok() && meta.find(v.value())) return std::move(v).value();
    }
    for (auto it = meta.versions.rbegin(); it != meta.versions.rend(); ++it) {
        if (!it->version.is_prerelease()) return it->version;
    }
    return std::nullopt;
}

Result<std::vector<OutdatedPackage>> Resolver::outdated(const Manifest& manifest,
                                                        const std::optional<Lockfile>& lockfile,
                                                        bool include_dev) {
    std::vector<OutdatedPackage> out;
    for (const auto& spec : manifest.specs(include_dev)) {
        if (spec.kind == RangeKind::Workspace) continue;
        if (workspace_ && workspace_->contains(spec.name)) continue;

        auto meta = registry_.get_versions(spec.name);
        if (meta.is_err()) {
            if (meta.error().code == CrabbyError::NotFound) {
                log::warn("%s is not in the registry, skipping", spec.name.c_str());
                continue;
            }
            return CrabbyError{CrabbyError::RegistryUnavailable,
                "cannot fetch metadata for '" + spec.name + "': " + meta.error().message,
                meta.error().hint};
        }
        const auto& versions = meta.value();

        auto latest = newest_release(versions);
        if (!latest) {
            log::debug("%s has no releases", spec.name.c_str());
            continue;
        }

        OutdatedPackage row;
        row.name = spec.name;
        row.range = spec.range;
        row.is_dev = spec.is_dev;
        row.latest = *latest;

        auto req = effective_req(spec, versions);
        if (req.is_ok()) {
            row.wanted = max_satisfying(versions.all_versions(), {req.value()});
        }
        if (lockfile) {
            const LockEntry* entry = lockfile->find_in_scope("", spec.name);
            if (entry && entry->source == PackageSource::Registry) {
                auto v = Version::parse(entry->version);
                if (v.is_ok()) row.current = std::move(v).value();
            }
        }

        bool behind_wanted = row.wanted && (!row.current || *row.current < *row.wanted);
        bool behind_latest = !row.current || *row.current < row.latest;
        if (behind_wanted || behind_latest) out.push_back(std::move(row));
    }
    return Result<std::vector<OutdatedPackage>>::ok(std::move(out));
}

} // namespace crabby
