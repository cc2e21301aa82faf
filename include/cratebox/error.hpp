#pragma once

#include <string>

namespace cratebox {

struct CrateboxError {
    enum Code {
        IO,
        Network,
        Archive,
        Symlink,
        Lock,
        Tool,
        Process,
        Git,
        Config,
        Parse,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string path;   // offending filesystem path, if any

    CrateboxError() = default;
    CrateboxError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    CrateboxError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    CrateboxError(Code c, std::string msg, std::string h, std::string p)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          path(std::move(p)) {}

    // Error with an offending path but no hint
    static CrateboxError at(Code c, std::string msg, std::string p) {
        return CrateboxError{c, std::move(msg), "", std::move(p)};
    }

    // Prepend "<prefix>: " to the message, keeping code, hint and path
    CrateboxError context(const std::string& prefix) const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace cratebox
