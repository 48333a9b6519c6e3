#pragma once

#include <string>

namespace crabby {

struct CrabbyError {
    enum Code {
        IO,
        Parse,
        Version,
        Config,
        MalformedManifest,
        UnsatisfiableRange,
        RegistryUnavailable,
        Network,
        IntegrityMismatch,
        FileSystem,
        Script,
        NotFound,
        Duplicate,
        Cycle,
        InvalidArg,
        Cancelled
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    CrabbyError() = default;
    CrabbyError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    CrabbyError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    CrabbyError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;

    // Network and registry failures may succeed on a later attempt.
    bool is_transient() const;

    static const char* code_name(Code c);
};

} // namespace crabby
