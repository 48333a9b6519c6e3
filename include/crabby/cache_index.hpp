#pragma once

#include <crabby/result.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace crabby {

struct CacheIndexEntry {
    std::string key;          // relative entry dir, "packages/<file>/<version>-<hex>"
    std::string name;
    std::string version;
    std::string integrity;
    std::string path;         // absolute package dir
    int64_t size = 0;
    int64_t created_at = 0;   // seconds since epoch
    int64_t last_used = 0;
};

struct CacheIndexStats {
    int64_t entry_count = 0;
    int64_t total_bytes = 0;
};

// SQLite-backed bookkeeping for the package cache. The extracted trees are
// the source of truth; the index only answers size and age queries, so a
// lost or corrupt database is simply recreated. All calls are serialized on
// an internal mutex so fetch workers can share one instance.
class CacheIndex {
public:
    CacheIndex();
    ~CacheIndex();
    CacheIndex(CacheIndex&&) noexcept;
    CacheIndex& operator=(CacheIndex&&) noexcept;

    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    // Insert or replace by key.
    Status record(const CacheIndexEntry& entry);
    // Bump last_used; a missing key is not an error.
    Status touch(const std::string& key, int64_t now);
    Status remove(const std::string& key);

    // NotFound when the key is not indexed.
    Result<CacheIndexEntry> lookup(const std::string& key);
    Result<std::vector<CacheIndexEntry>> list();
    // Entries with last_used strictly before cutoff, oldest first.
    Result<std::vector<CacheIndexEntry>> stale(int64_t cutoff);

    Status clear();
    Result<CacheIndexStats> stats();

    static int64_t now_seconds();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace crabby
