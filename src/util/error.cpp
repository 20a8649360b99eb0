#include <crock/error.hpp>

namespace crock {

const char* CrockError::code_name(Code c) {
    switch (c) {
        case InvalidLength:    return "InvalidLength";
        case Decode:           return "Decode";
        case WrongByteCount:   return "WrongByteCount";
        case UnsupportedInput: return "UnsupportedInput";
        case Parse:            return "Parse";
        case IO:               return "IO";
        case Config:           return "Config";
        case NotFound:         return "NotFound";
        case InvalidArg:       return "InvalidArg";
    }
    return "Unknown";
}

std::string CrockError::format() const {
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

} // namespace crock
