#include <crabby/name.hpp>
#include <cctype>

namespace crabby {

static constexpr size_t kMaxNameLength = 214;

static Status check_part(const std::string& part, const std::string& raw) {
    if (part.empty()) {
        return CrabbyError{CrabbyError::InvalidArg,
            "invalid package name '" + raw + "'",
            "name and scope must not be empty"};
    }
    if (part[0] == '.' || part[0] == '_') {
        return CrabbyError{CrabbyError::InvalidArg,
            "invalid package name '" + raw + "'",
            "names cannot start with '.' or '_'"};
    }
    for (char c : part) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '-' && c != '.' && c != '_' && c != '~') {
            return CrabbyError{CrabbyError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in package name '" + raw + "'",
                "allowed: [a-zA-Z0-9-._~]"};
        }
    }
    if (part.find("..") != std::string::npos) {
        return CrabbyError{CrabbyError::InvalidArg,
            "invalid package name '" + raw + "'",
            "'..' is not allowed"};
    }
    return ok_status();
}

Result<PkgName> PkgName::parse(const std::string& raw) {
    if (raw.empty()) {
        return CrabbyError{CrabbyError::InvalidArg, "empty package name"};
    }
    if (raw.size() > kMaxNameLength) {
        return CrabbyError{CrabbyError::InvalidArg,
            "package name '" + raw + "' is longer than 214 characters"};
    }

    PkgName name;
    name.raw_ = raw;

    if (raw[0] == '@') {
        size_t slash = raw.find('/');
        if (slash == std::string::npos) {
            return CrabbyError{CrabbyError::InvalidArg,
                "invalid scoped package name '" + raw + "'",
                "expected '@scope/name'"};
        }
        std::string scope = raw.substr(1, slash - 1);
        std::string bare = raw.substr(slash + 1);
        CRABBY_TRY(check_part(scope, raw));
        CRABBY_TRY(check_part(bare, raw));
        name.scope_ = "@" + scope;
        name.bare_ = bare;
    } else {
        CRABBY_TRY(check_part(raw, raw));
        name.bare_ = raw;
    }

    if (name.bare_ == "node_modules" || name.bare_ == "favicon.ico") {
        return CrabbyError{CrabbyError::InvalidArg,
            "'" + raw + "' is a reserved name"};
    }

    return Result<PkgName>::ok(std::move(name));
}

std::string PkgName::filename() const {
    if (scope_.empty()) return bare_;
    return scope_ + "+" + bare_;
}

bool is_valid_package_name(const std::string& raw) {
    return PkgName::parse(raw).is_ok();
}

} // namespace crabby
