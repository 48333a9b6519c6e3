#include <crabby/cache_index.hpp>
#include <crabby/log.hpp>

#include <sqlite3.h>

#include <chrono>
#include <filesystem>
#include <mutex>

namespace fs = std::filesystem;

namespace crabby {

static const std::string SCHEMA_VERSION = "1";

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

struct CacheIndex::Impl {
    sqlite3* db = nullptr;
    std::mutex mu;

    sqlite3_stmt* stmt_record = nullptr;
    sqlite3_stmt* stmt_touch = nullptr;
    sqlite3_stmt* stmt_remove = nullptr;
    sqlite3_stmt* stmt_lookup = nullptr;
    sqlite3_stmt* stmt_stale = nullptr;

    ~Impl() {
        finalize_all();
        if (db) sqlite3_close(db);
    }

    void finalize_all() {
        auto fin = [](sqlite3_stmt*& s) {
            if (s) { sqlite3_finalize(s); s = nullptr; }
        };
        fin(stmt_record);
        fin(stmt_touch);
        fin(stmt_remove);
        fin(stmt_lookup);
        fin(stmt_stale);
    }

    Status prepare(const char* sql, sqlite3_stmt*& out) {
        if (out) return ok_status();
        int rc = sqlite3_prepare_v2(db, sql, -1, &out, nullptr);
        if (rc != SQLITE_OK) {
            return CrabbyError(CrabbyError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            return CrabbyError(CrabbyError::IO, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    Status step_done(sqlite3_stmt* stmt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            return CrabbyError(CrabbyError::IO,
                std::string("SQLite step failed: ") + sqlite3_errmsg(db));
        }
        return ok_status();
    }

    Status init_schema() {
        CRABBY_TRY(exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
            "CREATE TABLE IF NOT EXISTS entries ("
            "  key TEXT PRIMARY KEY,"
            "  name TEXT NOT NULL,"
            "  version TEXT NOT NULL,"
            "  integrity TEXT,"
            "  path TEXT,"
            "  size INTEGER,"
            "  created_at INTEGER,"
            "  last_used INTEGER"
            ");"
            "CREATE INDEX IF NOT EXISTS entries_last_used ON entries(last_used);"
        ));

        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db,
            "SELECT value FROM schema_info WHERE key='version'", -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            if (stmt) sqlite3_finalize(stmt);
            return CrabbyError(CrabbyError::IO,
                std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }

        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            const char* ver = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            bool mismatch = ver && std::string(ver) != SCHEMA_VERSION;
            sqlite3_finalize(stmt);
            if (mismatch) {
                log::debug("cache index schema changed, clearing");
                CRABBY_TRY(exec("DELETE FROM entries;"));
                CRABBY_TRY(exec(ver_sql.c_str()));
            }
            return ok_status();
        }
        sqlite3_finalize(stmt);
        CRABBY_TRY(exec(ver_sql.c_str()));
        return ok_status();
    }

    CacheIndexEntry read_row(sqlite3_stmt* stmt) {
        auto text = [&](int col) {
            const char* s = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            return std::string(s ? s : "");
        };
        CacheIndexEntry e;
        e.key = text(0);
        e.name = text(1);
        e.version = text(2);
        e.integrity = text(3);
        e.path = text(4);
        e.size = sqlite3_column_int64(stmt, 5);
        e.created_at = sqlite3_column_int64(stmt, 6);
        e.last_used = sqlite3_column_int64(stmt, 7);
        return e;
    }

    Status not_open() const {
        return CrabbyError(CrabbyError::IO, "cache index is not open");
    }
};

#define ENTRY_COLUMNS "key, name, version, integrity, path, size, created_at, last_used"

// ---------------------------------------------------------------------------
// CacheIndex public interface
// ---------------------------------------------------------------------------

CacheIndex::CacheIndex() : impl_(std::make_unique<Impl>()) {}
CacheIndex::~CacheIndex() = default;
CacheIndex::CacheIndex(CacheIndex&&) noexcept = default;
CacheIndex& CacheIndex::operator=(CacheIndex&&) noexcept = default;

int64_t CacheIndex::now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

Status CacheIndex::open(const std::string& db_path) {
    close();
    std::lock_guard<std::mutex> lock(impl_->mu);

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return CrabbyError(CrabbyError::IO,
                "Failed to create cache directory: " + parent.string());
        }
    }

    auto open_db = [&]() -> Status {
        int rc = sqlite3_open(db_path.c_str(), &impl_->db);
        if (rc != SQLITE_OK) {
            std::string err_msg = impl_->db ? sqlite3_errmsg(impl_->db) : "unknown";
            if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
            return CrabbyError(CrabbyError::IO,
                "Failed to open cache index: " + err_msg);
        }
        sqlite3_busy_timeout(impl_->db, 5000);
        CRABBY_TRY(impl_->exec(
            "PRAGMA journal_mode=WAL;"
            "PRAGMA synchronous=NORMAL;"
        ));
        CRABBY_TRY(impl_->init_schema());
        return ok_status();
    };

    auto first = open_db();
    if (first.is_ok()) return ok_status();

    // Corrupt or foreign file: start over once
    log::warn("cache index unusable (%s), recreating %s",
              first.error().message.c_str(), db_path.c_str());
    impl_->finalize_all();
    if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
    std::error_code ec;
    fs::remove(db_path, ec);
    fs::remove(db_path + "-wal", ec);
    fs::remove(db_path + "-shm", ec);

    auto second = open_db();
    if (second.is_err()) {
        impl_->finalize_all();
        if (impl_->db) { sqlite3_close(impl_->db); impl_->db = nullptr; }
        return std::move(second).error();
    }
    return ok_status();
}

void CacheIndex::close() {
    if (!impl_) return;
    std::lock_guard<std::mutex> lock(impl_->mu);
    impl_->finalize_all();
    if (impl_->db) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
}

bool CacheIndex::is_open() const {
    return impl_ && impl_->db != nullptr;
}

Status CacheIndex::record(const CacheIndexEntry& entry) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    if (!impl_->db) return impl_->not_open();
    CRABBY_TRY(impl_->prepare(
        "INSERT OR REPLACE INTO entries (" ENTRY_COLUMNS ") "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?)", impl_->stmt_record));

    auto* stmt = impl_->stmt_record;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, entry.key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, entry.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, entry.version.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, entry.integrity.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, entry.path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 6, entry.size);
    sqlite3_bind_int64(stmt, 7, entry.created_at);
    sqlite3_bind_int64(stmt, 8, entry.last_used);
    return impl_->step_done(stmt);
}

Status CacheIndex::touch(const std::string& key, int64_t now) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    if (!impl_->db) return impl_->not_open();
    CRABBY_TRY(impl_->prepare(
        "UPDATE entries SET last_used = ? WHERE key = ?", impl_->stmt_touch));

    auto* stmt = impl_->stmt_touch;
    sqlite3_reset(stmt);
    sqlite3_bind_int64(stmt, 1, now);
    sqlite3_bind_text(stmt, 2, key.c_str(), -1, SQLITE_TRANSIENT);
    return impl_->step_done(stmt);
}

Status CacheIndex::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    if (!impl_->db) return impl_->not_open();
    CRABBY_TRY(impl_->prepare(
        "DELETE FROM entries WHERE key = ?", impl_->stmt_remove));

    auto* stmt = impl_->stmt_remove;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    return impl_->step_done(stmt);
}

Result<CacheIndexEntry> CacheIndex::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    if (!impl_->db) return impl_->not_open().error();
    CRABBY_TRY(impl_->prepare(
        "SELECT " ENTRY_COLUMNS " FROM entries WHERE key = ?", impl_->stmt_lookup));

    auto* stmt = impl_->stmt_lookup;
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        auto entry = impl_->read_row(stmt);
        sqlite3_reset(stmt);
        return Result<CacheIndexEntry>::ok(std::move(entry));
    }
    if (rc != SQLITE_DONE) {
        return CrabbyError(CrabbyError::IO,
            std::string("SQLite step failed: ") + sqlite3_errmsg(impl_->db));
    }
    return CrabbyError(CrabbyError::NotFound, "not in cache index: " + key);
}

Result<std::vector<CacheIndexEntry>> CacheIndex::list() {
    std::lock_guard<std::mutex> lock(impl_->mu);
    if (!impl_->db) return impl_->not_open().error();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db,
        "SELECT " ENTRY_COLUMNS " FROM entries ORDER BY key", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return CrabbyError(CrabbyError::IO,
            std::string("SQLite prepare failed: ") + sqlite3_errmsg(impl_->db));
    }

    std::vector<CacheIndexEntry> out;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        out.push_back(impl_->read_row(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return CrabbyError(CrabbyError::IO,
            std::string("SQLite step failed: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<std::vector<CacheIndexEntry>>::ok(std::move(out));
}

Result<std::vector<CacheIndexEntry>> CacheIndex::stale(int64_t cutoff) {
    std::lock_guard<std::mutex> lock(impl_->mu);
    if (!impl_->db) return impl_->not_open().error();
    CRABBY_TRY(impl_->prepare(
        "SELECT " ENTRY_COLUMNS " FROM entries WHERE last_used < ? "
        "ORDER BY last_used, key", impl_->stmt_stale));

    auto* stmt = impl_->stmt_stale;
    sqlite3_reset(stmt);
    sqlite3_bind_int64(stmt, 1, cutoff);

    std::vector<CacheIndexEntry> out;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        out.push_back(impl_->read_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        return CrabbyError(CrabbyError::IO,
            std::string("SQLite step failed: ") + sqlite3_errmsg(impl_->db));
    }
    return Result<std::vector<CacheIndexEntry>>::ok(std::move(out));
}

Status CacheIndex::clear() {
    std::lock_guard<std::mutex> lock(impl_->mu);
    if (!impl_->db) return impl_->not_open();
    return impl_->exec("DELETE FROM entries;");
}

Result<CacheIndexStats> CacheIndex::stats() {
    std::lock_guard<std::mutex> lock(impl_->mu);
    if (!impl_->db) return impl_->not_open().error();

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(impl_->db,
        "SELECT COUNT(*), COALESCE(SUM(size), 0) FROM entries", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) sqlite3_finalize(stmt);
        return CrabbyError(CrabbyError::IO,
            std::string("SQLite prepare failed: ") + sqlite3_errmsg(impl_->db));
    }

    CacheIndexStats stats;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        stats.entry_count = sqlite3_column_int64(stmt, 0);
        stats.total_bytes = sqlite3_column_int64(stmt, 1);
    }
    sqlite3_finalize(stmt);
    return Result<CacheIndexStats>::ok(stats);
}

} // namespace crabby
