#pragma once

#include <crabby/result.hpp>
#include <crabby/version.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace crabby {

// One published version of a package, as the registry describes it.
struct VersionRecord {
    Version version;
    std::string integrity;       // SRI string or legacy hex shasum
    std::string tarball_url;
    std::vector<std::pair<std::string, std::string>> dependencies;  // declaration order
};

struct PackageVersions {
    std::string name;
    std::vector<VersionRecord> versions;
    std::map<std::string, std::string> dist_tags;   // "latest" -> "1.3.1"

    const VersionRecord* find(const Version& v) const;
    std::vector<Version> all_versions() const;
};

// Source of package metadata and tarballs. get_versions is only called from
// the resolving thread; fetch_tarball is called concurrently from fetch
// workers and must be thread-safe.
class Registry {
public:
    virtual ~Registry() = default;

    // NotFound when the package does not exist, RegistryUnavailable or
    // Network for transport failures.
    virtual Result<PackageVersions> get_versions(const std::string& name) = 0;

    virtual Result<std::string> fetch_tarball(const std::string& url) = 0;
};

// Validates an npm registry document ("packument") and converts it into
// typed records. Versions that do not parse are skipped.
Result<PackageVersions> parse_packument(const std::string& json_text,
                                        const std::string& expected_name);

// Registry served from a local directory:
//   <root>/<name>.json              packument ("@scope%2fname.json" when scoped)
//   <root>/<file>.tgz               tarballs, addressed by file:// URL, by a path
//                                   relative to root, or by the last segment
//                                   of an http(s) URL
class DirectoryRegistry : public Registry {
public:
    explicit DirectoryRegistry(std::filesystem::path root);

    Result<PackageVersions> get_versions(const std::string& name) override;
    Result<std::string> fetch_tarball(const std::string& url) override;

    const std::filesystem::path& root() const { return root_; }

    static std::string packument_filename(const std::string& name);

private:
    std::filesystem::path tarball_path(const std::string& url) const;

    std::filesystem::path root_;
};

} // namespace crabby
