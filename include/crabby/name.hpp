#pragma once

#include <crabby/result.hpp>
#include <string>

namespace crabby {

// npm package name: "name" or "@scope/name".
// Each part is URL-safe ([A-Za-z0-9-._~]), does not start with '.' or '_',
// and the whole name is at most 214 characters. Because '/' only appears
// after a scope and ".." is rejected, a valid name is also a safe relative
// path below node_modules.
struct PkgName {
    static Result<PkgName> parse(const std::string& raw);

    const std::string& raw() const { return raw_; }
    bool is_scoped() const { return !scope_.empty(); }
    // "@scope" or empty
    const std::string& scope() const { return scope_; }
    // Name without scope
    const std::string& bare() const { return bare_; }

    // Single path component usable as a directory name: "@scope+name"
    std::string filename() const;

    bool operator==(const PkgName& o) const { return raw_ == o.raw_; }
    bool operator!=(const PkgName& o) const { return !(*this == o); }

private:
    std::string raw_;
    std::string scope_;
    std::string bare_;
};

// Convenience for call sites that only need a yes/no answer.
bool is_valid_package_name(const std::string& raw);

} // namespace crabby
