#include <cratebox/error.hpp>

namespace cratebox {

const char* CrateboxError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Network:    return "Network";
        case Archive:    return "Archive";
        case Symlink:    return "Symlink";
        case Lock:       return "Lock";
        case Tool:       return "Tool";
        case Process:    return "Process";
        case Git:        return "Git";
        case Config:     return "Config";
        case Parse:      return "Parse";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

CrateboxError CrateboxError::context(const std::string& prefix) const {
    CrateboxError wrapped = *this;
    wrapped.message = prefix + ": " + message;
    return wrapped;
}

std::string CrateboxError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!path.empty()) {
        result += "\n  --> ";
        result += path;
    }

    return result;
}

} // namespace cratebox
