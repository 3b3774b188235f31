#pragma once

#include <string>

namespace guid {

struct GuidError {
    enum Code {
        InvalidLength,
        InvalidTimestamp,
        InvalidFingerprint,
        InvalidIncrementCounter,
        InvalidDecrementCounter,
        InvalidRandom,
        Parse,
        IO,
        Config,
        Storage,
        Random,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string cause;   // underlying failure this error wraps, if any
    std::string hint;

    GuidError() = default;
    GuidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    GuidError(Code c, std::string msg, std::string why)
        : code(c), message(std::move(msg)), cause(std::move(why)) {}
    GuidError(Code c, std::string msg, std::string why, std::string h)
        : code(c), message(std::move(msg)), cause(std::move(why)),
          hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace guid
