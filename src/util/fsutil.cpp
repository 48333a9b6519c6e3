#include <crabby/fsutil.hpp>
#include <atomic>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#include <process.h>
#include <cstdlib>
#define getpid _getpid
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace crabby::fsutil {

Result<std::string> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return CrabbyError{CrabbyError::IO, "cannot open file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return CrabbyError{CrabbyError::IO, "error reading file: " + path.string()};
    }
    return Result<std::string>::ok(ss.str());
}

fs::path temp_sibling(const fs::path& path) {
    static std::atomic<unsigned> counter{0};
    auto name = path.filename().string() + ".crabby-tmp-" +
                std::to_string(getpid()) + "-" + std::to_string(counter++);
    return path.parent_path() / name;
}

Status write_file_atomic(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return CrabbyError{CrabbyError::FileSystem,
                "cannot create directory " + path.parent_path().string() + ": " + ec.message()};
        }
    }

    auto tmp = temp_sibling(path);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return CrabbyError{CrabbyError::IO, "cannot write " + tmp.string()};
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            return CrabbyError{CrabbyError::IO, "error writing " + tmp.string()};
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return CrabbyError{CrabbyError::FileSystem,
            "cannot replace " + path.string() + ": " + ec.message()};
    }
    return ok_status();
}

Status copy_tree(const fs::path& from, const fs::path& to, bool hardlink) {
    std::error_code ec;
    fs::create_directories(to, ec);
    if (ec) {
        return CrabbyError{CrabbyError::FileSystem,
            "cannot create " + to.string() + ": " + ec.message()};
    }

    fs::recursive_directory_iterator it(from, ec), end;
    if (ec) {
        return CrabbyError{CrabbyError::FileSystem,
            "cannot read " + from.string() + ": " + ec.message()};
    }
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return CrabbyError{CrabbyError::FileSystem,
                "error walking " + from.string() + ": " + ec.message()};
        }
        auto rel = fs::relative(it->path(), from, ec);
        if (ec) {
            return CrabbyError{CrabbyError::FileSystem, "bad path " + it->path().string()};
        }
        auto dest = to / rel;
        auto status = it->symlink_status(ec);

        if (fs::is_symlink(status)) {
            auto target = fs::read_symlink(it->path(), ec);
            if (!ec) fs::create_symlink(target, dest, ec);
        } else if (fs::is_directory(status)) {
            fs::create_directories(dest, ec);
        } else if (fs::is_regular_file(status)) {
            if (hardlink) {
                fs::create_hard_link(it->path(), dest, ec);
                if (ec) {
                    ec.clear();
                    fs::copy_file(it->path(), dest, fs::copy_options::overwrite_existing, ec);
                }
            } else {
                fs::copy_file(it->path(), dest, fs::copy_options::overwrite_existing, ec);
            }
        }
        if (ec) {
            return CrabbyError{CrabbyError::FileSystem,
                "cannot materialize " + dest.string() + ": " + ec.message()};
        }
    }
    return ok_status();
}

Status remove_path(const fs::path& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) return ok_status();
    if (fs::is_directory(status)) {
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }
    if (ec) {
        return CrabbyError{CrabbyError::FileSystem,
            "cannot remove " + path.string() + ": " + ec.message()};
    }
    return ok_status();
}

Status link_directory(const fs::path& target, const fs::path& link) {
    CRABBY_TRY(remove_path(link));
    std::error_code ec;
    if (link.has_parent_path()) {
        fs::create_directories(link.parent_path(), ec);
        if (ec) {
            return CrabbyError{CrabbyError::FileSystem,
                "cannot create " + link.parent_path().string() + ": " + ec.message()};
        }
    }

    fs::create_directory_symlink(target, link, ec);
#ifdef _WIN32
    if (ec) {
        // Junctions need no special privilege and require absolute targets
        auto abs = fs::absolute(target).string();
        std::string cmd = "mklink /J \"" + link.string() + "\" \"" + abs + "\" >NUL";
        if (std::system(cmd.c_str()) == 0) ec.clear();
    }
#endif
    if (ec) {
        return CrabbyError{CrabbyError::FileSystem,
            "cannot link " + link.string() + " -> " + target.string() + ": " + ec.message()};
    }
    return ok_status();
}

uint64_t tree_size(const fs::path& path) {
    uint64_t total = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(path, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            auto size = it->file_size(ec);
            if (!ec) total += size;
        }
    }
    return total;
}

} // namespace crabby::fsutil
