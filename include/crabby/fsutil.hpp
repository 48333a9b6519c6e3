#pragma once

#include <crabby/result.hpp>
#include <cstdint>
#include <filesystem>
#include <string>

namespace crabby::fsutil {

Result<std::string> read_file(const std::filesystem::path& path);

// Write to a sibling temp file, then rename over the target. Readers see
// either the old content or the new content, never a partial file.
Status write_file_atomic(const std::filesystem::path& path, const std::string& content);

// Unique sibling path: "<path>.crabby-tmp-<pid>-<n>"
std::filesystem::path temp_sibling(const std::filesystem::path& path);

// Recursively reproduce `from` at `to` (which must not exist). With
// `hardlink`, regular files are hard-linked and fall back to copying when
// the link fails (e.g. across devices). Symlinks are recreated as-is.
Status copy_tree(const std::filesystem::path& from, const std::filesystem::path& to,
                 bool hardlink);

// Remove path (file, symlink or tree) if it exists.
Status remove_path(const std::filesystem::path& path);

// Create a directory symlink at link pointing to target, replacing whatever
// was there. On Windows a junction is used when symlinks are not permitted.
Status link_directory(const std::filesystem::path& target, const std::filesystem::path& link);

// Total size in bytes of the regular files below path.
uint64_t tree_size(const std::filesystem::path& path);

} // namespace crabby::fsutil
