#include "minic/Classifier.hpp"

#include "unicode/uchar.h"

#include <array>
#include <string_view>
#include <utility>

namespace {

struct Keyword {
    std::string_view spelling;
    minic::Token::Name name;
};

std::array<Keyword, 2> kKeywords = {{
    { "Int", minic::Token::Name::kInt },
    { "Return", minic::Token::Name::kReturn }
}};

} // namespace

namespace minic {

bool isPunctuation(UChar32 c) {
    switch (c) {
    case '{':
    case '}':
    case '(':
    case ')':
    case ';':
        return true;

    default:
        return false;
    }
}

bool isAlphabetic(UChar32 c) { return u_isUAlphabetic(c); }

bool isAlphanumeric(UChar32 c) {
    return u_isUAlphabetic(c) || (U_GET_GC_MASK(c) & (U_GC_ND_MASK | U_GC_NL_MASK | U_GC_NO_MASK)) != 0;
}

bool isWhitespace(UChar32 c) { return u_isUWhiteSpace(c); }

std::optional<Token> primitiveToToken(UChar32 c, Token::Location location) {
    switch (c) {
    case '{':
        return Token::make(Token::Name::kOpenCurly, location);

    case '}':
        return Token::make(Token::Name::kCloseCurly, location);

    case '(':
        return Token::make(Token::Name::kOpenParen, location);

    case ')':
        return Token::make(Token::Name::kCloseParen, location);

    case ';':
        return Token::make(Token::Name::kSemicolon, location);

    default:
        return std::nullopt;
    }
}

Token stringToToken(std::string lexeme, Token::Location location) {
    for (const auto& keyword : kKeywords) {
        if (lexeme == keyword.spelling) {
            return Token::make(keyword.name, location);
        }
    }
    return Token::makeIdentifier(std::move(lexeme), location);
}

std::optional<uint64_t> digitValue(UChar32 c, int32_t radix) {
    uint64_t value;
    if (c >= '0' && c <= '9') {
        value = static_cast<uint64_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
        value = static_cast<uint64_t>(c - 'a') + 10;
    } else if (c >= 'A' && c <= 'F') {
        value = static_cast<uint64_t>(c - 'A') + 10;
    } else {
        return std::nullopt;
    }

    if (radix <= 0 || value >= static_cast<uint64_t>(radix)) {
        return std::nullopt;
    }
    return value;
}

} // namespace minic
