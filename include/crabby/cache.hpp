#pragma once

#include <crabby/cache_index.hpp>
#include <crabby/digest.hpp>
#include <crabby/result.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace crabby {

struct CacheKey {
    std::string name;
    std::string version;
    std::string integrity;   // SRI; empty when the registry supplied none

    std::string to_string() const { return name + "@" + version; }
};

struct CacheEntry {
    CacheKey key;                   // integrity always filled in
    std::filesystem::path path;     // extracted package root
    bool stored = false;            // false when an existing entry was reused
};

// Content-addressed store of extracted packages shared by every project.
//
// Layout:
//   <root>/packages/<name>/<version>-<hash>/package/   extracted tree
//   <root>/packages/<name>/<version>-<hash>/.complete  commit marker
//   <root>/tmp/                                        in-progress extractions
//   <root>/index.db                                    size and age index
//
// <name> is the filename form of the package name ("@scope+pkg") and
// <hash> the first 16 hex chars of SHA-256 over the SRI string. Entries are
// never modified after the marker is written; writers extract privately
// and rename into place, so concurrent stores of one key are safe.
class PackageCache {
public:
    explicit PackageCache(std::filesystem::path root,
                          HashAlgorithm fallback = HashAlgorithm::Sha512);

    // Create the directory layout and open the index.
    Status open();

    const std::filesystem::path& root() const { return root_; }

    // Entry dir for a key with non-empty integrity.
    Result<std::filesystem::path> entry_dir(const CacheKey& key) const;

    // Committed entry for key. A key without integrity matches the single
    // stored tarball of name@version, and the result carries the integrity
    // recorded for it; with several candidates it misses.
    std::optional<CacheEntry> find(const CacheKey& key);

    // Package root of find(key).
    std::optional<std::filesystem::path> lookup(const CacheKey& key);

    // Verify bytes against key.integrity (or compute it with the fallback
    // algorithm when empty), extract and commit. IntegrityMismatch leaves
    // the cache untouched.
    Result<CacheEntry> store(const CacheKey& key, const std::string& bytes);

    Status remove(const CacheKey& key);

    // Remove every entry.
    Status clean();

    // Remove entries not used within max_age. Returns how many went.
    Result<int64_t> prune(std::chrono::seconds max_age);

    Result<CacheIndexStats> stats();

private:
    Status commit(const std::filesystem::path& staging,
                  const std::filesystem::path& entry);
    void index_entry(const CacheKey& key, const std::filesystem::path& entry);
    std::vector<CacheEntry> committed_versions(const CacheKey& key) const;

    std::filesystem::path root_;
    HashAlgorithm fallback_;
    CacheIndex index_;
};

} // namespace crabby
