#pragma once

#include <crabby/result.hpp>
#include <cstdint>
#include <filesystem>
#include <string>

namespace crabby {

struct ExtractStats {
    int64_t files = 0;
    int64_t directories = 0;
    int64_t skipped = 0;      // links and special files
    int64_t bytes = 0;
};

// Unpack a gzip'd (or plain) tarball held in memory below dest, dropping
// the first `strip` path components ("package/" in registry tarballs).
// Entries with absolute paths or ".." components fail the whole extraction.
// Symlinks, hardlinks and device nodes are skipped. Regular files get at
// least 0644 and directories at least 0755.
Result<ExtractStats> extract_tarball(const std::string& bytes,
                                     const std::filesystem::path& dest,
                                     int strip = 1);

} // namespace crabby
