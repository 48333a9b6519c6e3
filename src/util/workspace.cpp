#include <crabby/workspace.hpp>
#include <crabby/fsutil.hpp>
#include <crabby/glob.hpp>
#include <crabby/log.hpp>

#include <algorithm>
#include <set>

namespace crabby {

namespace fs = std::filesystem;

static fs::path canonical_or_absolute(const fs::path& p) {
    std::error_code ec;
    auto c = fs::canonical(p, ec);
    if (!ec) return c;
    return fs::absolute(p, ec);
}

Result<Workspace> Workspace::discover(const fs::path& root_dir, const Manifest& root_manifest) {
    Workspace ws;
    ws.root_dir_ = canonical_or_absolute(root_dir);
    if (!root_manifest.is_workspace_root()) {
        return Result<Workspace>::ok(std::move(ws));
    }

    // Candidates from every include pattern, then the ordered filter decides
    std::set<std::string> candidates;
    for (const auto& pattern : root_manifest.workspaces) {
        std::string inner;
        if (glob_is_negation(pattern, inner)) continue;
        auto dirs = glob_expand_dirs(pattern, ws.root_dir_);
        if (dirs.is_err()) return std::move(dirs).error();
        candidates.insert(dirs.value().begin(), dirs.value().end());
    }
    auto selected = glob_filter(root_manifest.workspaces,
                                std::vector<std::string>(candidates.begin(), candidates.end()));

    std::error_code ec;
    for (const auto& rel : selected) {
        fs::path dir = ws.root_dir_ / rel;
        fs::path manifest_path = dir / kManifestName;
        if (!fs::is_regular_file(manifest_path, ec)) continue;

        auto manifest = Manifest::load(manifest_path);
        if (manifest.is_err()) return std::move(manifest).error();

        WorkspaceMember member;
        member.name = manifest.value().name;
        member.version = manifest.value().version;
        member.dir = dir;
        member.rel_dir = rel;
        member.manifest = std::move(manifest).value();

        if (member.name == root_manifest.name) {
            return CrabbyError{CrabbyError::Duplicate,
                "workspace member '" + rel + "' has the same name as the root package '" +
                member.name + "'"};
        }
        if (const auto* existing = ws.find(member.name)) {
            return CrabbyError{CrabbyError::Duplicate,
                "duplicate workspace package name '" + member.name + "'",
                "declared in '" + existing->rel_dir + "' and '" + rel + "'"};
        }
        log::debug("workspace member %s -> %s", member.name.c_str(), rel.c_str());
        ws.members_.push_back(std::move(member));
    }

    std::sort(ws.members_.begin(), ws.members_.end(),
        [](const WorkspaceMember& a, const WorkspaceMember& b) { return a.name < b.name; });

    return Result<Workspace>::ok(std::move(ws));
}

const WorkspaceMember* Workspace::find(const std::string& name) const {
    for (const auto& m : members_) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

std::optional<fs::path> Workspace::resolve(const std::string& name) const {
    if (const auto* m = find(name)) return m->dir;
    return std::nullopt;
}

Status Workspace::link(const WorkspaceMember& member, const fs::path& link_path) const {
    std::error_code ec;
    fs::create_directories(link_path.parent_path(), ec);
    auto link_parent = canonical_or_absolute(link_path.parent_path());

    auto target = fs::relative(member.dir, link_parent, ec);
    if (ec || target.empty()) target = member.dir;
    return fsutil::link_directory(target, link_path);
}

} // namespace crabby
