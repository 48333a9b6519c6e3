#pragma once

#include <crabby/lockfile.hpp>
#include <crabby/manifest.hpp>
#include <crabby/result.hpp>
#include <crabby/version.hpp>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <queue>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace crabby {

// ---------------------------------------------------------------------------
// Graph<NodeData, EdgeData>: index-addressed arena with adjacency lists
// ---------------------------------------------------------------------------

template<typename NodeData, typename EdgeData = std::monostate>
class Graph {
public:
    using NodeId = size_t;

    struct Edge {
        NodeId from;
        NodeId to;
        EdgeData data;
    };

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        in_degree_.push_back(0);
        return id;
    }

    void add_edge(NodeId from, NodeId to, EdgeData data = {}) {
        adj_[from].push_back({from, to, std::move(data)});
        ++in_degree_[to];
    }

    bool has_edge(NodeId from, NodeId to) const {
        return std::any_of(adj_[from].begin(), adj_[from].end(),
            [&](const Edge& e) { return e.to == to; });
    }

    size_t node_count() const { return nodes_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    NodeData& node(NodeId id) { return nodes_[id]; }

    const std::vector<Edge>& successors(NodeId id) const { return adj_[id]; }

    // Kahn's algorithm. Cycle error if the graph is not a DAG.
    Result<std::vector<NodeId>> topological_sort() const {
        std::vector<size_t> in_deg = in_degree_;
        std::queue<NodeId> q;
        for (NodeId i = 0; i < nodes_.size(); ++i) {
            if (in_deg[i] == 0) q.push(i);
        }

        std::vector<NodeId> order;
        order.reserve(nodes_.size());
        while (!q.empty()) {
            NodeId u = q.front();
            q.pop();
            order.push_back(u);
            for (const auto& e : adj_[u]) {
                if (--in_deg[e.to] == 0) q.push(e.to);
            }
        }

        if (order.size() != nodes_.size()) {
            return CrabbyError{CrabbyError::Cycle, "graph contains a cycle"};
        }
        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

    bool has_cycle() const { return topological_sort().is_err(); }

    // Depth-first postorder from start: every node after the nodes it points
    // to, except where a cycle makes that impossible. Then the back edge is
    // ignored. Iterative so deep chains cannot exhaust the stack.
    std::vector<NodeId> postorder(NodeId start) const {
        std::vector<NodeId> order;
        std::vector<bool> seen(nodes_.size(), false);
        std::vector<std::pair<NodeId, size_t>> stack;  // node, next edge index

        stack.emplace_back(start, 0);
        seen[start] = true;
        while (!stack.empty()) {
            auto& [u, next] = stack.back();
            if (next < adj_[u].size()) {
                NodeId v = adj_[u][next++].to;
                if (!seen[v]) {
                    seen[v] = true;
                    stack.emplace_back(v, 0);
                }
                continue;
            }
            order.push_back(u);
            stack.pop_back();
        }
        return order;
    }

    std::string tree_display(NodeId root,
                             const std::function<std::string(const NodeData&)>& label) const {
        std::ostringstream out;
        std::unordered_set<NodeId> visited;
        tree_display_impl(root, "", true, visited, label, out);
        return out.str();
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<Edge>> adj_;
    std::vector<size_t> in_degree_;

    void tree_display_impl(NodeId u, const std::string& prefix, bool is_last,
                           std::unordered_set<NodeId>& visited,
                           const std::function<std::string(const NodeData&)>& label,
                           std::ostringstream& out) const {
        out << prefix;
        if (!prefix.empty()) out << (is_last ? "└── " : "├── ");
        out << label(nodes_[u]);

        if (!visited.insert(u).second) {
            out << " (*)\n";
            return;
        }
        out << "\n";

        const auto& edges = adj_[u];
        std::string child_prefix = prefix.empty() ? " " : prefix + (is_last ? "    " : "│   ");
        for (size_t i = 0; i < edges.size(); ++i) {
            tree_display_impl(edges[i].to, child_prefix, i + 1 == edges.size(),
                              visited, label, out);
        }
    }
};

// ---------------------------------------------------------------------------
// DependencyGraph
// ---------------------------------------------------------------------------

using PackageId = size_t;
using ScopeId = size_t;

inline constexpr ScopeId kRootScope = 0;

// A concrete package placed in the install tree. Identified by
// (name, version, install_path); never changed once added.
struct ResolvedPackage {
    std::string name;
    Version version;
    std::string integrity;
    PackageSource source = PackageSource::Registry;
    std::string tarball_url;
    std::filesystem::path local_path;        // workspace member directory
    std::vector<DependencySpec> dependencies;
    ScopeId scope = kRootScope;
    int depth = 0;
    std::string install_path;                // "node_modules/a/node_modules/b"
    bool is_root = false;                    // the project itself

    std::string id() const { return name + "@" + version.to_string(); }
};

// Name bindings visible at one level of node_modules.
struct Scope {
    std::optional<ScopeId> parent;       // nullopt for the root scope
    std::optional<PackageId> owner;      // package whose node_modules this is
    std::string path;                    // "" or the owner's install path
    std::map<std::string, PackageId> bindings;
};

class DependencyGraph {
public:
    DependencyGraph();

    // The project node; always id 0, never installed.
    PackageId set_root(ResolvedPackage root);
    PackageId root() const { return 0; }

    // Places pkg in pkg.scope and assigns its install path. The scope must
    // not already bind pkg.name.
    PackageId add_package(ResolvedPackage pkg);

    void add_edge(PackageId from, PackageId to, const std::string& range);

    // The nested scope living in owner's own node_modules, created on demand.
    ScopeId private_scope(PackageId owner);
    std::optional<ScopeId> find_private_scope(PackageId owner) const;

    std::optional<PackageId> lookup(ScopeId scope, const std::string& name) const;

    // Scopes a dependency of `pkg` is looked up in, nearest first: pkg's
    // private scope (if any), the scope holding pkg, then its ancestors.
    std::vector<ScopeId> scope_chain(PackageId pkg) const;

    const ResolvedPackage& package(PackageId id) const { return graph_.node(id); }
    const Scope& scope(ScopeId id) const { return scopes_[id]; }
    size_t package_count() const { return graph_.node_count(); }
    size_t scope_count() const { return scopes_.size(); }

    std::vector<PackageId> dependencies_of(PackageId id) const;

    // All installable packages, dependencies before dependents.
    std::vector<PackageId> install_order() const;

    bool has_cycle() const { return graph_.has_cycle(); }

    std::string tree_display() const;

    // One entry per placed package, sorted by install path.
    Lockfile to_lockfile(const std::string& manifest_hash, HashAlgorithm alg) const;

    std::optional<PackageId> find_by_path(const std::string& install_path) const;

private:
    Graph<ResolvedPackage, std::string> graph_;
    std::vector<Scope> scopes_;
    std::unordered_map<PackageId, ScopeId> private_scopes_;
    std::unordered_map<std::string, PackageId> by_path_;
};

} // namespace crabby
