#pragma once

#include <string>

namespace crock {

struct CrockError {
    enum Code {
        InvalidLength,
        Decode,
        WrongByteCount,
        UnsupportedInput,
        Parse,
        IO,
        Config,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    CrockError() = default;
    CrockError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    CrockError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    CrockError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace crock
