#include <crabby/graph.hpp>

namespace crabby {

DependencyGraph::DependencyGraph() {
    scopes_.push_back(Scope{});
}

PackageId DependencyGraph::set_root(ResolvedPackage root) {
    root.is_root = true;
    root.scope = kRootScope;
    root.depth = 0;
    root.install_path.clear();
    return graph_.add_node(std::move(root));
}

PackageId DependencyGraph::add_package(ResolvedPackage pkg) {
    auto& scope = scopes_[pkg.scope];
    pkg.install_path = install_path(scope.path, pkg.name);
    std::string name = pkg.name;
    std::string path = pkg.install_path;
    ScopeId scope_id = pkg.scope;

    PackageId id = graph_.add_node(std::move(pkg));
    scopes_[scope_id].bindings[name] = id;
    by_path_[path] = id;
    return id;
}

void DependencyGraph::add_edge(PackageId from, PackageId to, const std::string& range) {
    if (!graph_.has_edge(from, to)) {
        graph_.add_edge(from, to, range);
    }
}

ScopeId DependencyGraph::private_scope(PackageId owner) {
    auto it = private_scopes_.find(owner);
    if (it != private_scopes_.end()) return it->second;

    const auto& pkg = graph_.node(owner);
    Scope s;
    s.parent = pkg.scope;
    s.owner = owner;
    s.path = pkg.install_path;
    ScopeId id = scopes_.size();
    scopes_.push_back(std::move(s));
    private_scopes_[owner] = id;
    return id;
}

std::optional<ScopeId> DependencyGraph::find_private_scope(PackageId owner) const {
    auto it = private_scopes_.find(owner);
    if (it == private_scopes_.end()) return std::nullopt;
    return it->second;
}

std::optional<PackageId> DependencyGraph::lookup(ScopeId scope, const std::string& name) const {
    const auto& bindings = scopes_[scope].bindings;
    auto it = bindings.find(name);
    if (it == bindings.end()) return std::nullopt;
    return it->second;
}

std::vector<ScopeId> DependencyGraph::scope_chain(PackageId pkg) const {
    std::vector<ScopeId> chain;
    const auto& p = graph_.node(pkg);
    if (p.is_root) {
        chain.push_back(kRootScope);
        return chain;
    }
    if (auto own = find_private_scope(pkg)) chain.push_back(*own);
    std::optional<ScopeId> cur = p.scope;
    while (cur) {
        chain.push_back(*cur);
        cur = scopes_[*cur].parent;
    }
    return chain;
}

std::vector<PackageId> DependencyGraph::dependencies_of(PackageId id) const {
    std::vector<PackageId> out;
    for (const auto& e : graph_.successors(id)) out.push_back(e.to);
    return out;
}

std::vector<PackageId> DependencyGraph::install_order() const {
    if (graph_.node_count() == 0) return {};
    std::vector<PackageId> order;
    for (PackageId id : graph_.postorder(root())) {
        if (!graph_.node(id).is_root) order.push_back(id);
    }
    return order;
}

std::string DependencyGraph::tree_display() const {
    if (graph_.node_count() == 0) return "";
    return graph_.tree_display(root(), [](const ResolvedPackage& p) {
        std::string label = p.id();
        if (p.source == PackageSource::Workspace && !p.is_root) label += " (workspace)";
        if (p.depth > 0 && p.scope != kRootScope) label += " [nested]";
        return label;
    });
}

std::optional<PackageId> DependencyGraph::find_by_path(const std::string& path) const {
    auto it = by_path_.find(path);
    if (it == by_path_.end()) return std::nullopt;
    return it->second;
}

Lockfile DependencyGraph::to_lockfile(const std::string& manifest_hash, HashAlgorithm alg) const {
    Lockfile lf;
    lf.manifest_hash = manifest_hash;
    lf.integrity_algorithm = alg;

    for (PackageId id = 0; id < graph_.node_count(); ++id) {
        const auto& p = graph_.node(id);
        if (p.is_root) continue;

        LockEntry e;
        e.name = p.name;
        e.version = p.version.to_string();
        e.path = p.install_path;
        e.source = p.source;
        e.integrity = p.integrity;
        e.resolved = p.source == PackageSource::Workspace
            ? p.local_path.generic_string()
            : p.tarball_url;
        for (const auto& edge : graph_.successors(id)) {
            const auto& dep = graph_.node(edge.to);
            e.requirements.push_back(LockRequirement{dep.name, dep.version.to_string()});
        }
        lf.packages.push_back(std::move(e));
    }

    lf.sort();
    return lf;
}

} // namespace crabby
