#pragma once

#include <string>

namespace hiecore {

struct HieError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg,
        Timeout,
        NoProject,      // no supported build-tool markers in any ancestor
        NoPackage,      // project found, no package owns the file
        NoComponent,    // package found, no unit/component claims the file
        Introspection,  // a unit failed to report its metadata
        Compile
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    HieError() = default;
    HieError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    HieError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    HieError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace hiecore
