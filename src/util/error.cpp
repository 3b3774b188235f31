#include <guid/error.hpp>

namespace guid {

const char* GuidError::code_name(Code c) {
    switch (c) {
        case InvalidLength:           return "InvalidLength";
        case InvalidTimestamp:        return "InvalidTimestamp";
        case InvalidFingerprint:      return "InvalidFingerprint";
        case InvalidIncrementCounter: return "InvalidIncrementCounter";
        case InvalidDecrementCounter: return "InvalidDecrementCounter";
        case InvalidRandom:           return "InvalidRandom";
        case Parse:                   return "Parse";
        case IO:                      return "IO";
        case Config:                  return "Config";
        case Storage:                 return "Storage";
        case Random:                  return "Random";
        case InvalidArg:              return "InvalidArg";
    }
    return "Unknown";
}

std::string GuidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!cause.empty()) {
        result += "\n  caused by: ";
        result += cause;
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace guid
