#include <spmsift/error.hpp>

namespace spmsift {

const char* SiftError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Encoding:   return "Encoding";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
        case Usage:      return "Usage";
    }
    return "Unknown";
}

std::string SiftError::format() const {
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

} // namespace spmsift
