#pragma once

#include <crabby/registry.hpp>
#include <crabby/script.hpp>

#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace crabby::testing {

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction.
struct TempDir {
    fs::path path;

    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    void write_file(const std::string& rel, const std::string& content) const;
    std::string read_file(const std::string& rel) const;
    bool exists(const std::string& rel) const;
};

struct TarEntry {
    enum Kind { File, Directory, Symlink, Hardlink };

    std::string path;          // as stored in the archive
    std::string content;       // file data, or link target
    Kind kind = File;
    int mode = 0644;
};

// gzip'd ustar/pax tarball built with libarchive's write API.
std::string make_tarball(const std::vector<TarEntry>& entries);

// Registry-style tarball: every file below "package/".
std::string make_package_tarball(const std::map<std::string, std::string>& files);

struct FakePackage {
    std::string name;
    std::string version;
    std::vector<std::pair<std::string, std::string>> dependencies;
    std::map<std::string, std::string> bin;        // command -> path
    std::map<std::string, std::string> scripts;    // event -> command
    std::map<std::string, std::string> files;      // extra files in the package
    bool omit_integrity = false;
};

// In-memory registry. Counts every request and can be told to fail.
class FakeRegistry : public Registry {
public:
    // Builds package.json plus files into a tarball and records the version.
    // Returns the tarball URL.
    std::string publish(const FakePackage& pkg);
    std::string publish(const std::string& name, const std::string& version,
                        std::vector<std::pair<std::string, std::string>> deps = {});

    void set_dist_tag(const std::string& name, const std::string& tag,
                      const std::string& version);

    Result<PackageVersions> get_versions(const std::string& name) override;
    Result<std::string> fetch_tarball(const std::string& url) override;

    // Metadata requests for name fail with RegistryUnavailable.
    void fail_metadata(const std::string& name);
    // The next `times` tarball requests for url fail with Network.
    void fail_tarball(const std::string& url, int times);
    // Serve different bytes than the published integrity describes.
    void corrupt_tarball(const std::string& url);

    std::string tarball_url(const std::string& name, const std::string& version) const;
    std::string integrity_of(const std::string& name, const std::string& version) const;

    size_t metadata_queries() const { return metadata_queries_.load(); }
    size_t tarball_requests() const { return tarball_requests_.load(); }
    size_t metadata_queries_for(const std::string& name) const;
    void reset_counters();

private:
    mutable std::mutex mutex_;
    std::map<std::string, PackageVersions> packages_;
    std::map<std::string, std::string> tarballs_;
    std::set<std::string> failing_metadata_;
    std::map<std::string, int> failing_tarballs_;
    std::set<std::string> corrupt_;
    std::map<std::string, size_t> queries_by_name_;
    std::atomic<size_t> metadata_queries_{0};
    std::atomic<size_t> tarball_requests_{0};
};

// Records lifecycle commands instead of running them. Commands equal to
// "fail" exit with 1.
class RecordingScriptRunner : public ScriptRunner {
public:
    struct Call {
        std::string package;
        std::string event;
        std::string command;
        fs::path dir;
        std::vector<fs::path> bin_dirs;
    };

    Result<ScriptOutcome> run(const std::string& event, const std::string& command,
                              const ScriptContext& context) override;

    std::vector<Call> calls;
};

} // namespace crabby::testing
