#include <crabby/cache.hpp>
#include <crabby/fsutil.hpp>
#include <crabby/log.hpp>
#include <crabby/name.hpp>
#include <crabby/tarball.hpp>

#include <cctype>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace crabby {

static const char* kCompleteMarker = ".complete";
static const char* kPackageDir = "package";

PackageCache::PackageCache(fs::path root, HashAlgorithm fallback)
    : root_(std::move(root)), fallback_(fallback) {}

Status PackageCache::open() {
    std::error_code ec;
    for (const char* sub : {"packages", "tmp"}) {
        fs::create_directories(root_ / sub, ec);
        if (ec) {
            return CrabbyError{CrabbyError::FileSystem,
                "cannot create cache directory " + (root_ / sub).string() + ": " + ec.message()};
        }
    }
    return index_.open((root_ / "index.db").string());
}

Result<fs::path> PackageCache::entry_dir(const CacheKey& key) const {
    auto name = PkgName::parse(key.name);
    if (name.is_err()) return std::move(name).error();
    auto integrity = Integrity::parse(key.integrity);
    if (integrity.is_err()) return std::move(integrity).error();

    auto hash = sha256_hex(integrity.value().to_string());
    if (hash.is_err()) return std::move(hash).error();

    return Result<fs::path>::ok(root_ / "packages" / name.value().filename() /
                                (key.version + "-" + hash.value().substr(0, 16)));
}

// Entries of name@version whose marker records their integrity. The marker
// must agree with the directory hash, so a foreign directory never matches.
std::vector<CacheEntry> PackageCache::committed_versions(const CacheKey& key) const {
    std::vector<CacheEntry> out;
    auto name = PkgName::parse(key.name);
    if (name.is_err()) return out;

    std::error_code ec;
    fs::path parent = root_ / "packages" / name.value().filename();
    if (!fs::is_directory(parent, ec)) return out;

    const std::string prefix = key.version + "-";
    for (const auto& dir : fs::directory_iterator(parent, ec)) {
        std::string leaf = dir.path().filename().string();
        if (leaf.size() != prefix.size() + 16 || leaf.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        auto marker = fsutil::read_file(dir.path() / kCompleteMarker);
        if (marker.is_err()) continue;
        std::string integrity = marker.value();
        while (!integrity.empty() && std::isspace(static_cast<unsigned char>(integrity.back()))) {
            integrity.pop_back();
        }

        CacheEntry entry;
        entry.key = CacheKey{key.name, key.version, integrity};
        auto expected = entry_dir(entry.key);
        if (expected.is_err() || expected.value().filename() != dir.path().filename()) {
            log::debug("cache entry %s: marker does not match its directory",
                       dir.path().string().c_str());
            continue;
        }
        std::error_code pkg_ec;
        if (!fs::is_directory(dir.path() / kPackageDir, pkg_ec)) continue;
        entry.path = dir.path() / kPackageDir;
        out.push_back(std::move(entry));
    }
    return out;
}

std::optional<CacheEntry> PackageCache::find(const CacheKey& key) {
    CacheEntry found;
    if (key.integrity.empty()) {
        auto candidates = committed_versions(key);
        if (candidates.size() != 1) {
            if (candidates.size() > 1) {
                log::debug("cache holds %zu different tarballs of %s, not guessing",
                           candidates.size(), key.to_string().c_str());
            }
            return std::nullopt;
        }
        found = std::move(candidates.front());
    } else {
        auto dir = entry_dir(key);
        if (dir.is_err()) {
            log::debug("cache lookup %s: %s", key.to_string().c_str(),
                       dir.error().message.c_str());
            return std::nullopt;
        }

        std::error_code ec;
        const fs::path& entry = dir.value();
        if (!fs::exists(entry / kCompleteMarker, ec) ||
            !fs::is_directory(entry / kPackageDir, ec)) {
            return std::nullopt;
        }
        found.key = key;
        found.path = entry / kPackageDir;
    }

    if (index_.is_open()) {
        auto rel = found.path.parent_path().lexically_relative(root_).generic_string();
        auto touched = index_.touch(rel, CacheIndex::now_seconds());
        if (touched.is_err()) {
            log::debug("cache index: %s", touched.error().message.c_str());
        }
    }
    return found;
}

std::optional<fs::path> PackageCache::lookup(const CacheKey& key) {
    auto found = find(key);
    if (!found) return std::nullopt;
    return found->path;
}

Result<CacheEntry> PackageCache::store(const CacheKey& key, const std::string& bytes) {
    CacheEntry result;
    result.key = key;

    if (key.integrity.empty()) {
        auto computed = Integrity::compute(fallback_, bytes);
        if (computed.is_err()) return std::move(computed).error();
        result.key.integrity = computed.value().to_string();
        log::debug("%s has no published integrity, recorded %s",
                   key.to_string().c_str(), result.key.integrity.c_str());
    } else {
        auto expected = Integrity::parse(key.integrity);
        if (expected.is_err()) return std::move(expected).error();
        auto verified = expected.value().verify(bytes);
        if (verified.is_err()) return std::move(verified).context(key.to_string()).error();
        result.key.integrity = expected.value().to_string();
    }

    auto dir = entry_dir(result.key);
    if (dir.is_err()) return std::move(dir).error();
    const fs::path entry = dir.value();

    if (auto existing = lookup(result.key)) {
        result.path = *existing;
        return Result<CacheEntry>::ok(std::move(result));
    }

    auto staging = fsutil::temp_sibling(root_ / "tmp" / entry.filename());
    auto cleanup = [&]() {
        auto removed = fsutil::remove_path(staging);
        if (removed.is_err()) {
            log::warn("%s", removed.error().message.c_str());
        }
    };

    auto extracted = extract_tarball(bytes, staging / kPackageDir);
    if (extracted.is_err()) {
        cleanup();
        return std::move(extracted).context(key.to_string()).error();
    }

    auto marked = fsutil::write_file_atomic(staging / kCompleteMarker,
                                            result.key.integrity + "\n");
    if (marked.is_err()) {
        cleanup();
        return std::move(marked).error();
    }

    auto committed = commit(staging, entry);
    if (committed.is_err()) {
        cleanup();
        return std::move(committed).error();
    }

    std::error_code ec;
    if (fs::exists(staging, ec)) {
        // Another writer committed first; its tree has identical content.
        cleanup();
        log::debug("cache entry %s committed concurrently, reusing",
                   entry.string().c_str());
    } else {
        result.stored = true;
    }

    index_entry(result.key, entry);
    result.path = entry / kPackageDir;
    return Result<CacheEntry>::ok(std::move(result));
}

Status PackageCache::commit(const fs::path& staging, const fs::path& entry) {
    std::error_code ec;
    fs::create_directories(entry.parent_path(), ec);
    if (ec) {
        return CrabbyError{CrabbyError::FileSystem,
            "cannot create " + entry.parent_path().string() + ": " + ec.message()};
    }

    fs::rename(staging, entry, ec);
    if (!ec) return ok_status();

    // The rename fails when the target exists as a non-empty directory.
    std::error_code exists_ec;
    if (fs::exists(entry / kCompleteMarker, exists_ec)) {
        return ok_status();
    }

    // A half-written entry from a crashed writer; replace it.
    if (fs::exists(entry, exists_ec)) {
        log::warn("replacing incomplete cache entry %s", entry.string().c_str());
        CRABBY_TRY(fsutil::remove_path(entry));
        fs::rename(staging, entry, ec);
        if (!ec) return ok_status();
    }
    return CrabbyError{CrabbyError::FileSystem,
        "cannot commit cache entry " + entry.string() + ": " + ec.message()};
}

void PackageCache::index_entry(const CacheKey& key, const fs::path& entry) {
    if (!index_.is_open()) return;

    auto now = CacheIndex::now_seconds();
    CacheIndexEntry row;
    row.key = entry.lexically_relative(root_).generic_string();
    row.name = key.name;
    row.version = key.version;
    row.integrity = key.integrity;
    row.path = (entry / kPackageDir).string();
    row.size = static_cast<int64_t>(fsutil::tree_size(entry / kPackageDir));
    row.created_at = now;
    row.last_used = now;

    auto recorded = index_.record(row);
    if (recorded.is_err()) {
        log::warn("cache index: %s", recorded.error().message.c_str());
    }
}

Status PackageCache::remove(const CacheKey& key) {
    auto dir = entry_dir(key);
    if (dir.is_err()) return std::move(dir).error();

    CRABBY_TRY(fsutil::remove_path(dir.value()));
    if (index_.is_open()) {
        CRABBY_TRY(index_.remove(dir.value().lexically_relative(root_).generic_string()));
    }
    return ok_status();
}

Status PackageCache::clean() {
    log::info("removing all cached packages in %s", root_.string().c_str());
    CRABBY_TRY(fsutil::remove_path(root_ / "packages"));
    CRABBY_TRY(fsutil::remove_path(root_ / "tmp"));
    if (index_.is_open()) {
        CRABBY_TRY(index_.clear());
    }

    std::error_code ec;
    fs::create_directories(root_ / "packages", ec);
    fs::create_directories(root_ / "tmp", ec);
    if (ec) {
        return CrabbyError{CrabbyError::FileSystem,
            "cannot recreate cache layout: " + ec.message()};
    }
    return ok_status();
}

Result<int64_t> PackageCache::prune(std::chrono::seconds max_age) {
    if (!index_.is_open()) {
        return CrabbyError{CrabbyError::IO, "cache index is not open",
            "call PackageCache::open() first"};
    }

    auto cutoff = CacheIndex::now_seconds() - static_cast<int64_t>(max_age.count());
    auto stale = index_.stale(cutoff);
    if (stale.is_err()) return std::move(stale).error();

    int64_t removed = 0;
    for (const auto& row : stale.value()) {
        CRABBY_TRY(fsutil::remove_path(root_ / row.key));
        CRABBY_TRY(index_.remove(row.key));
        log::debug("pruned %s@%s", row.name.c_str(), row.version.c_str());
        ++removed;
    }
    if (removed > 0) {
        log::info("pruned %lld cached packages", static_cast<long long>(removed));
    }
    return Result<int64_t>::ok(removed);
}

Result<CacheIndexStats> PackageCache::stats() {
    if (!index_.is_open()) {
        return CrabbyError{CrabbyError::IO, "cache index is not open",
            "call PackageCache::open() first"};
    }
    return index_.stats();
}

} // namespace crabby
