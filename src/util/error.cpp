#include <crabby/error.hpp>

namespace crabby {

const char* CrabbyError::code_name(Code c) {
    switch (c) {
        case IO:                  return "IO";
        case Parse:               return "Parse";
        case Version:             return "Version";
        case Config:              return "Config";
        case MalformedManifest:   return "MalformedManifest";
        case UnsatisfiableRange:  return "UnsatisfiableRange";
        case RegistryUnavailable: return "RegistryUnavailable";
        case Network:             return "Network";
        case IntegrityMismatch:   return "IntegrityMismatch";
        case FileSystem:          return "FileSystem";
        case Script:              return "Script";
        case NotFound:            return "NotFound";
        case Duplicate:           return "Duplicate";
        case Cycle:               return "Cycle";
        case InvalidArg:          return "InvalidArg";
        case Cancelled:           return "Cancelled";
    }
    return "Unknown";
}

bool CrabbyError::is_transient() const {
    return code == Network || code == RegistryUnavailable;
}

std::string CrabbyError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace crabby
