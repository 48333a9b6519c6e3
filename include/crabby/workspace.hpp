#pragma once

#include <crabby/manifest.hpp>
#include <crabby/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace crabby {

struct WorkspaceMember {
    std::string name;
    std::string version;
    std::filesystem::path dir;       // absolute
    std::string rel_dir;             // relative to the workspace root, '/'-separated
    Manifest manifest;
};

// Local packages of a monorepo. Members bind by name ahead of the registry;
// their versions are not checked against the requesting range.
class Workspace {
public:
    // Expands root_manifest.workspaces below root_dir. Every matching
    // directory holding a package.json becomes a member; two members with the
    // same name are a Duplicate error.
    static Result<Workspace> discover(const std::filesystem::path& root_dir,
                                      const Manifest& root_manifest);

    const std::vector<WorkspaceMember>& members() const { return members_; }
    size_t member_count() const { return members_.size(); }

    const WorkspaceMember* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    // Directory of the member with this name
    std::optional<std::filesystem::path> resolve(const std::string& name) const;

    // Makes link_path a directory link to the member, replacing whatever was
    // there. Relative symlink so the tree can be moved.
    Status link(const WorkspaceMember& member, const std::filesystem::path& link_path) const;

    const std::filesystem::path& root_dir() const { return root_dir_; }

private:
    std::filesystem::path root_dir_;
    std::vector<WorkspaceMember> members_;
};

} // namespace crabby
