#ifndef SRC_MINIC_TOKEN_HPP_
#define SRC_MINIC_TOKEN_HPP_

#include <cstdint>
#include <string>
#include <utility>

namespace minic {

// Lexer lexes source to produce Tokens, in the order their characters appear in the source.
struct Token {
    Token() = delete;
    ~Token() = default;

    enum Name : int32_t {
        kOpenCurly = 0,
        kCloseCurly = 1,
        kOpenParen = 2,
        kCloseParen = 3,
        kSemicolon = 4,

        // Keywords
        kInt = 5,
        kReturn = 6,

        kIdentifier = 7,
        kInteger = 8
    };

    Name name;
    // Only valid for kIdentifier tokens.
    std::string identifier;
    // Only valid for kInteger tokens.
    uint64_t integerValue;
    // Both are zero-based, and refer to the first character of the lexeme.
    struct Location {
        int32_t lineNumber = 0;
        int32_t characterNumber = 0;
    };
    Location location;

    // Method for making any token without a payload, punctuation or keywords.
    static inline Token make(Name n, Location loc) { return Token(n, std::string(), 0, loc); }
    static inline Token makeIdentifier(std::string name, Location loc) {
        return Token(kIdentifier, std::move(name), 0, loc);
    }
    static inline Token makeInteger(uint64_t value, Location loc) { return Token(kInteger, std::string(), value, loc); }

    // Debug rendering, like "OpenCurly", "Identifier(main)", or "Integer(31)".
    std::string toString() const;

private:
    Token(Name n, std::string ident, uint64_t value, Location l):
        name(n), identifier(std::move(ident)), integerValue(value), location(l) { }
};

} // namespace minic

#endif // SRC_MINIC_TOKEN_HPP_
