#include <crabby/registry.hpp>
#include <crabby/fsutil.hpp>
#include <crabby/log.hpp>
#include <crabby/name.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

namespace crabby {

const VersionRecord* PackageVersions::find(const Version& v) const {
    for (const auto& rec : versions) {
        if (rec.version == v) return &rec;
    }
    return nullptr;
}

std::vector<Version> PackageVersions::all_versions() const {
    std::vector<Version> out;
    out.reserve(versions.size());
    for (const auto& rec : versions) out.push_back(rec.version);
    return out;
}

// ---------------------------------------------------------------------------
// parse_packument
// ---------------------------------------------------------------------------

static CrabbyError bad_metadata(const std::string& name, const std::string& msg) {
    return CrabbyError{CrabbyError::RegistryUnavailable,
        "invalid registry metadata for '" + name + "': " + msg};
}

static std::optional<VersionRecord> parse_version_entry(const std::string& key,
                                                        const json& entry,
                                                        const std::string& name) {
    auto v = Version::parse(key);
    if (v.is_err()) {
        log::debug("%s: skipping unparsable version '%s'", name.c_str(), key.c_str());
        return std::nullopt;
    }
    if (!entry.is_object()) return std::nullopt;

    VersionRecord rec;
    rec.version = std::move(v).value();

    auto dist = entry.find("dist");
    if (dist == entry.end() || !dist->is_object()) {
        log::debug("%s@%s: no dist section", name.c_str(), key.c_str());
        return std::nullopt;
    }
    auto tarball = dist->find("tarball");
    if (tarball == dist->end() || !tarball->is_string()) {
        log::debug("%s@%s: no tarball URL", name.c_str(), key.c_str());
        return std::nullopt;
    }
    rec.tarball_url = tarball->get<std::string>();

    auto integrity = dist->find("integrity");
    if (integrity != dist->end() && integrity->is_string()) {
        rec.integrity = integrity->get<std::string>();
    } else {
        auto shasum = dist->find("shasum");
        if (shasum != dist->end() && shasum->is_string()) {
            rec.integrity = shasum->get<std::string>();
        }
    }

    auto deps = entry.find("dependencies");
    if (deps != entry.end() && deps->is_object()) {
        for (auto& [dep, range] : deps->items()) {
            if (!range.is_string()) {
                log::debug("%s@%s: ignoring non-string range for %s",
                           name.c_str(), key.c_str(), dep.c_str());
                continue;
            }
            rec.dependencies.emplace_back(dep, range.get<std::string>());
        }
    }
    return rec;
}

Result<PackageVersions> parse_packument(const std::string& json_text,
                                        const std::string& expected_name) {
    auto doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        return bad_metadata(expected_name, "not valid JSON");
    }
    if (!doc.is_object()) {
        return bad_metadata(expected_name, "expected a JSON object");
    }

    PackageVersions pv;
    pv.name = expected_name;
    auto name = doc.find("name");
    if (name != doc.end() && name->is_string() && name->get<std::string>() != expected_name) {
        return bad_metadata(expected_name,
            "document is for '" + name->get<std::string>() + "'");
    }

    auto versions = doc.find("versions");
    if (versions == doc.end() || !versions->is_object()) {
        return bad_metadata(expected_name, "missing 'versions' object");
    }
    for (auto& [key, entry] : versions->items()) {
        auto rec = parse_version_entry(key, entry, expected_name);
        if (rec) pv.versions.push_back(std::move(*rec));
    }
    std::sort(pv.versions.begin(), pv.versions.end(),
        [](const VersionRecord& a, const VersionRecord& b) { return a.version < b.version; });

    auto tags = doc.find("dist-tags");
    if (tags != doc.end() && tags->is_object()) {
        for (auto& [tag, target] : tags->items()) {
            if (target.is_string()) pv.dist_tags[tag] = target.get<std::string>();
        }
    }

    return Result<PackageVersions>::ok(std::move(pv));
}

// ---------------------------------------------------------------------------
// DirectoryRegistry
// ---------------------------------------------------------------------------

DirectoryRegistry::DirectoryRegistry(fs::path root)
    : root_(std::move(root)) {}

std::string DirectoryRegistry::packument_filename(const std::string& name) {
    std::string out;
    for (char c : name) {
        if (c == '/') out += "%2f";
        else out += c;
    }
    return out + ".json";
}

Result<PackageVersions> DirectoryRegistry::get_versions(const std::string& name) {
    if (!is_valid_package_name(name)) {
        return CrabbyError{CrabbyError::InvalidArg, "invalid package name '" + name + "'"};
    }
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return CrabbyError{CrabbyError::RegistryUnavailable,
            "registry directory not found: " + root_.string()};
    }
    auto path = root_ / packument_filename(name);
    if (!fs::exists(path, ec)) {
        return CrabbyError{CrabbyError::NotFound,
            "package '" + name + "' not found in registry"};
    }
    auto text = fsutil::read_file(path);
    if (text.is_err()) {
        return CrabbyError{CrabbyError::RegistryUnavailable, text.error().message};
    }
    return parse_packument(text.value(), name);
}

fs::path DirectoryRegistry::tarball_path(const std::string& url) const {
    static const std::string file_scheme = "file://";
    if (url.rfind(file_scheme, 0) == 0) {
        return fs::path(url.substr(file_scheme.size()));
    }
    if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0) {
        return root_ / url.substr(url.rfind('/') + 1);
    }
    return root_ / url;
}

Result<std::string> DirectoryRegistry::fetch_tarball(const std::string& url) {
    auto path = tarball_path(url);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return CrabbyError{CrabbyError::NotFound, "tarball not found: " + url};
    }
    auto bytes = fsutil::read_file(path);
    if (bytes.is_err()) {
        return CrabbyError{CrabbyError::Network,
            "cannot read tarball " + url + ": " + bytes.error().message};
    }
    return bytes;
}

} // namespace crabby
