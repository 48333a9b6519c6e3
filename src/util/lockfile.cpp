#include <crabby/lockfile.hpp>
#include <crabby/fsutil.hpp>
#include <crabby/log.hpp>
#include <crabby/name.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <sstream>

namespace fs = std::filesystem;

namespace crabby {

const char* source_name(PackageSource source) {
    switch (source) {
        case PackageSource::Registry:  return "registry";
        case PackageSource::Workspace: return "workspace";
    }
    return "unknown";
}

std::optional<PackageSource> parse_source(const std::string& s) {
    if (s == "registry") return PackageSource::Registry;
    if (s == "workspace") return PackageSource::Workspace;
    return std::nullopt;
}

std::optional<LockRequirement> LockRequirement::parse(const std::string& s) {
    size_t at = s.rfind('@');
    if (at == std::string::npos || at == 0 || at + 1 == s.size()) return std::nullopt;
    return LockRequirement{s.substr(0, at), s.substr(at + 1)};
}

std::string install_path(const std::string& scope_path, const std::string& name) {
    if (scope_path.empty()) return "node_modules/" + name;
    return scope_path + "/node_modules/" + name;
}

std::string LockEntry::scope_path() const {
    static const std::string marker = "/node_modules/";
    size_t pos = path.rfind(marker);
    if (pos == std::string::npos) return "";
    // "node_modules/@s/a/node_modules/@t/b" -> "node_modules/@s/a"
    return path.substr(0, pos);
}

// A lock path is a chain of node_modules/<valid name> segments.
static bool valid_install_path(const std::string& path, const std::string& name) {
    static const std::string prefix = "node_modules/";
    size_t pos = 0;
    std::string last;
    while (pos < path.size()) {
        if (path.compare(pos, prefix.size(), prefix) != 0) return false;
        pos += prefix.size();
        size_t end = path.find("/node_modules/", pos);
        std::string segment = path.substr(pos, end == std::string::npos ? std::string::npos
                                                                       : end - pos);
        if (!is_valid_package_name(segment)) return false;
        last = segment;
        if (end == std::string::npos) break;
        pos = end + 1;
    }
    return last == name;
}

static CrabbyError lock_error(const std::string& origin, const std::string& msg) {
    return CrabbyError{CrabbyError::Parse, msg, "delete the lockfile to re-resolve",
                       origin, 0};
}

// ---------------------------------------------------------------------------
// Lockfile::parse
// ---------------------------------------------------------------------------

Result<Lockfile> Lockfile::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        return CrabbyError{CrabbyError::Parse,
            std::string("lockfile TOML parse error: ") + std::string(e.description()),
            "delete the lockfile to re-resolve", origin,
            static_cast<int>(e.source().begin.line)};
    }

    Lockfile lf;
    auto version = doc["lockfile-version"].value<int64_t>();
    if (!version) {
        return lock_error(origin, "missing 'lockfile-version'");
    }
    if (*version < 1 || *version > kFormatVersion) {
        return lock_error(origin,
            "unsupported lockfile version " + std::to_string(*version));
    }
    lf.lockfile_version = static_cast<int>(*version);
    lf.manifest_hash = doc["manifest-hash"].value_or(std::string{});

    if (auto alg = doc["integrity-algorithm"].value<std::string>()) {
        auto parsed = parse_algorithm(*alg);
        if (!parsed) {
            return lock_error(origin, "unsupported integrity algorithm '" + *alg + "'");
        }
        lf.integrity_algorithm = *parsed;
    }

    if (auto pkgs = doc["packages"].as_array()) {
        for (auto& node : *pkgs) {
            auto tbl = node.as_table();
            if (!tbl) {
                return lock_error(origin, "'packages' entries must be tables");
            }

            LockEntry e;
            e.name = (*tbl)["name"].value_or(std::string{});
            e.version = (*tbl)["version"].value_or(std::string{});
            e.path = (*tbl)["path"].value_or(std::string{});
            e.integrity = (*tbl)["integrity"].value_or(std::string{});
            e.resolved = (*tbl)["resolved"].value_or(std::string{});

            if (!is_valid_package_name(e.name)) {
                return lock_error(origin, "invalid package name '" + e.name + "'");
            }
            if (e.path.empty()) e.path = install_path("", e.name);
            if (!valid_install_path(e.path, e.name)) {
                return lock_error(origin,
                    "invalid install path '" + e.path + "' for " + e.name);
            }

            auto source = parse_source((*tbl)["source"].value_or(std::string("registry")));
            if (!source) {
                return lock_error(origin, "unknown source for " + e.path);
            }
            e.source = *source;

            if (e.source == PackageSource::Registry) {
                if (Version::parse(e.version).is_err()) {
                    return lock_error(origin,
                        "invalid version '" + e.version + "' for " + e.path);
                }
                if (!e.integrity.empty() && Integrity::parse(e.integrity).is_err()) {
                    return lock_error(origin, "invalid integrity for " + e.path);
                }
            }

            if (auto reqs = (*tbl)["requires"].as_array()) {
                for (auto& r : *reqs) {
                    auto s = r.value<std::string>();
                    auto req = s ? LockRequirement::parse(*s) : std::nullopt;
                    if (!req) {
                        return lock_error(origin, "invalid requirement in " + e.path);
                    }
                    e.requirements.push_back(std::move(*req));
                }
            }

            lf.packages.push_back(std::move(e));
        }
    }

    lf.sort();
    for (size_t i = 1; i < lf.packages.size(); ++i) {
        if (lf.packages[i].path == lf.packages[i - 1].path) {
            return lock_error(origin, "duplicate entry for " + lf.packages[i].path);
        }
    }
    // A nested entry lives in its owner's node_modules; the owner must be locked too
    for (const auto& e : lf.packages) {
        auto owner = e.scope_path();
        if (!owner.empty() && !lf.find(owner)) {
            return lock_error(origin, "entry " + e.path + " has no parent entry " + owner);
        }
    }

    return Result<Lockfile>::ok(std::move(lf));
}

Result<Lockfile> Lockfile::load(const fs::path& path) {
    auto text = fsutil::read_file(path);
    if (text.is_err()) return std::move(text).error();
    return Lockfile::parse(text.value(), path.string());
}

// ---------------------------------------------------------------------------
// Lockfile::serialize
// ---------------------------------------------------------------------------

std::string Lockfile::serialize() const {
    auto sorted = *this;
    sorted.sort();

    toml::table root;
    root.insert("lockfile-version", static_cast<int64_t>(lockfile_version));
    root.insert("manifest-hash", manifest_hash);
    root.insert("integrity-algorithm", std::string(algorithm_name(integrity_algorithm)));

    toml::array pkgs;
    for (const auto& e : sorted.packages) {
        toml::table tbl;
        tbl.insert("name", e.name);
        tbl.insert("version", e.version);
        tbl.insert("path", e.path);
        tbl.insert("source", std::string(source_name(e.source)));
        if (!e.integrity.empty()) tbl.insert("integrity", e.integrity);
        if (!e.resolved.empty()) tbl.insert("resolved", e.resolved);

        // Declaration order: replaying the lockfile places breadth-first in
        // this order, so it decides which version gets hoisted.
        toml::array req_arr;
        for (const auto& r : e.requirements) req_arr.push_back(r.to_string());
        if (!req_arr.empty()) tbl.insert("requires", std::move(req_arr));

        pkgs.push_back(std::move(tbl));
    }
    if (!pkgs.empty()) root.insert("packages", std::move(pkgs));

    std::ostringstream out;
    out << "# This file is auto-generated by crabby. Do not edit.\n\n";
    out << root << "\n";
    return out.str();
}

Status Lockfile::save(const fs::path& path) const {
    return fsutil::write_file_atomic(path, serialize());
}

const LockEntry* Lockfile::find(const std::string& path) const {
    auto it = std::lower_bound(packages.begin(), packages.end(), path,
        [](const LockEntry& e, const std::string& p) { return e.path < p; });
    if (it != packages.end() && it->path == path) return &*it;
    // Entries appended after the last sort()
    for (const auto& e : packages) {
        if (e.path == path) return &e;
    }
    return nullptr;
}

const LockEntry* Lockfile::find_in_scope(const std::string& scope_path,
                                         const std::string& name) const {
    return find(install_path(scope_path, name));
}

void Lockfile::sort() {
    std::sort(packages.begin(), packages.end(),
        [](const LockEntry& a, const LockEntry& b) { return a.path < b.path; });
}

bool Lockfile::is_consistent(const Manifest& manifest, bool include_dev) const {
    auto hash = manifest.dependency_hash();
    if (hash.is_err() || hash.value() != manifest_hash) {
        log::debug("lockfile manifest-hash differs from package.json");
        return false;
    }

    for (const auto& spec : manifest.specs(include_dev)) {
        const LockEntry* entry = find_in_scope("", spec.name);
        if (!entry) {
            log::debug("lockfile has no entry for %s", spec.name.c_str());
            return false;
        }
        if (entry->source == PackageSource::Workspace) continue;
        if (spec.kind == RangeKind::Workspace) return false;

        auto v = Version::parse(entry->version);
        if (v.is_err() || !spec.satisfied_by(v.value())) {
            log::debug("locked %s@%s does not satisfy %s", spec.name.c_str(),
                       entry->version.c_str(), spec.range.c_str());
            return false;
        }
    }
    return true;
}

} // namespace crabby
