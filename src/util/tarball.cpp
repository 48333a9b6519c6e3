#include <crabby/tarball.hpp>
#include <crabby/log.hpp>

#include <archive.h>
#include <archive_entry.h>

#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace crabby {

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_read_close(a);
            archive_read_free(a);
        }
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const {
        if (a) {
            archive_write_close(a);
            archive_write_free(a);
        }
    }
};

using ArchiveReadHandle = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriteHandle = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

std::string archive_message(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown archive error";
}

// Entry path relative to dest, or an empty path when the entry lies
// entirely inside the stripped prefix.
Result<fs::path> strip_entry_path(const std::string& raw, int strip) {
    fs::path entry_path(raw);
    if (entry_path.is_absolute() || (!raw.empty() && (raw[0] == '/' || raw[0] == '\\'))) {
        return CrabbyError(CrabbyError::FileSystem,
            "tarball entry has an absolute path: " + raw);
    }

    fs::path relative;
    int index = 0;
    for (const auto& component : entry_path.lexically_normal()) {
        if (component == "..") {
            return CrabbyError(CrabbyError::FileSystem,
                "tarball entry escapes the package directory: " + raw);
        }
        if (component.empty() || component == ".") continue;
        if (index++ < strip) continue;
        relative /= component;
    }
    return Result<fs::path>::ok(relative);
}

} // namespace

Result<ExtractStats> extract_tarball(const std::string& bytes,
                                     const fs::path& dest,
                                     int strip) {
    std::error_code ec;
    fs::create_directories(dest, ec);
    if (ec) {
        return CrabbyError(CrabbyError::FileSystem,
            "cannot create " + dest.string() + ": " + ec.message());
    }

    ArchiveReadHandle a(archive_read_new());
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    ArchiveWriteHandle ext(archive_write_disk_new());
    archive_write_disk_set_options(ext.get(),
        ARCHIVE_EXTRACT_TIME |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT |
        ARCHIVE_EXTRACT_SECURE_SYMLINKS);

    if (archive_read_open_memory(a.get(), bytes.data(), bytes.size()) != ARCHIVE_OK) {
        return CrabbyError(CrabbyError::IO,
            "cannot read tarball: " + archive_message(a.get()));
    }

    ExtractStats stats;
    struct archive_entry* entry;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
        const char* raw = archive_entry_pathname(entry);
        auto stripped = strip_entry_path(raw ? raw : "", strip);
        if (stripped.is_err()) return std::move(stripped).error();
        const fs::path& relative = stripped.value();

        auto type = archive_entry_filetype(entry);
        bool is_file = type == AE_IFREG && archive_entry_hardlink(entry) == nullptr;
        bool is_dir = type == AE_IFDIR;

        if (relative.empty() || (!is_file && !is_dir)) {
            if (!relative.empty()) {
                log::debug("skipping non-regular tarball entry %s", raw);
                ++stats.skipped;
            }
            archive_read_data_skip(a.get());
            continue;
        }

        fs::path dest_path = dest / relative;
        archive_entry_set_pathname(entry, dest_path.string().c_str());
        auto perm = archive_entry_perm(entry);
        archive_entry_set_perm(entry, perm | (is_dir ? 0755 : 0644));

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_OK) {
            return CrabbyError(CrabbyError::FileSystem,
                "cannot write " + dest_path.string() + ": " + archive_message(ext.get()));
        }

        if (is_file) {
            const void* buff;
            size_t size;
            la_int64_t offset;
            while ((r = archive_read_data_block(a.get(), &buff, &size, &offset)) == ARCHIVE_OK) {
                if (archive_write_data_block(ext.get(), buff, size, offset) < ARCHIVE_OK) {
                    return CrabbyError(CrabbyError::FileSystem,
                        "cannot write " + dest_path.string() + ": " +
                        archive_message(ext.get()));
                }
                stats.bytes += static_cast<int64_t>(size);
            }
            if (r != ARCHIVE_EOF) {
                return CrabbyError(CrabbyError::IO,
                    "truncated tarball entry " + std::string(raw) + ": " +
                    archive_message(a.get()));
            }
            ++stats.files;
        } else {
            ++stats.directories;
        }

        if (archive_write_finish_entry(ext.get()) < ARCHIVE_OK) {
            return CrabbyError(CrabbyError::FileSystem,
                "cannot finish " + dest_path.string() + ": " + archive_message(ext.get()));
        }
    }

    if (r != ARCHIVE_EOF) {
        return CrabbyError(CrabbyError::IO,
            "cannot read tarball: " + archive_message(a.get()));
    }

    log::trace("extracted %lld files into %s",
               static_cast<long long>(stats.files), dest.string().c_str());
    return Result<ExtractStats>::ok(stats);
}

} // namespace crabby
