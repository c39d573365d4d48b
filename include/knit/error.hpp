#pragma once

#include <string>

namespace knit {

struct KnitError {
    enum Code {
        IO,
        Parse,
        Scan,
        Descriptor,
        Cycle,
        Config,
        NotFound,
        InvalidArg
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    // Package the error is about (the re-entered node for Cycle errors)
    std::string subject;

    KnitError() = default;
    KnitError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    KnitError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    KnitError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace knit
