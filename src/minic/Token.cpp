#include "minic/Token.hpp"

#include "fmt/format.h"

namespace minic {

std::string Token::toString() const {
    switch (name) {
    case kOpenCurly:
        return "OpenCurly";
    case kCloseCurly:
        return "CloseCurly";
    case kOpenParen:
        return "OpenParen";
    case kCloseParen:
        return "CloseParen";
    case kSemicolon:
        return "Semicolon";
    case kInt:
        return "Int";
    case kReturn:
        return "Return";
    case kIdentifier:
        return fmt::format("Identifier({})", identifier);
    case kInteger:
        return fmt::format("Integer({})", integerValue);
    }

    return "Unknown";
}

} // namespace minic
