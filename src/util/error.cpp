#include <hiecore/error.hpp>

namespace hiecore {

const char* HieError::code_name(Code c) {
    switch (c) {
        case IO:            return "IO";
        case Parse:         return "Parse";
        case Config:        return "Config";
        case NotFound:      return "NotFound";
        case InvalidArg:    return "InvalidArg";
        case Timeout:       return "Timeout";
        case NoProject:     return "NoProject";
        case NoPackage:     return "NoPackage";
        case NoComponent:   return "NoComponent";
        case Introspection: return "Introspection";
        case Compile:       return "Compile";
    }
    return "Unknown";
}

std::string HieError::format() const {
    std::string out = "error[";
    out += code_name(code);
    out += "]: ";
    out += message;

    if (!hint.empty()) {
        out += "\n  hint: ";
        out += hint;
    }

    if (!file.empty()) {
        out += "\n  --> ";
        out += file;
        if (line > 0) {
            out += ":" + std::to_string(line);
        }
    }

    return out;
}

} // namespace hiecore
