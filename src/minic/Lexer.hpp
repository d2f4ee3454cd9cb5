#ifndef SRC_MINIC_LEXER_HPP_
#define SRC_MINIC_LEXER_HPP_

#include "minic/Token.hpp"

#include "unicode/umachine.h"

#include <cstdint>
#include <istream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace minic {

class ErrorReporter;

// Lexes a line-oriented UTF-8 stream one Unicode character at a time. Lexemes never span lines, any lexeme in progress at the end
// of a line is emitted as a token before the next line starts.
class Lexer {
public:
    // Lexes lines read from an external stream, which must outlive the Lexer.
    Lexer(std::istream& stream, std::shared_ptr<ErrorReporter> errorReporter);

    // For testing, lexes the code from its own stream and builds its own ErrorReporter, which does not log errors.
    Lexer(std::string_view code);

    ~Lexer() = default;

    // Consumes the whole stream. Stops at the first I/O or lexical error, reports it to the ErrorReporter, and
    // returns false with tokens() left empty. A line that is not valid UTF-8 is an I/O error.
    bool lex();

    const std::vector<Token>& tokens() const { return m_tokens; }

    // Access for testing
    std::shared_ptr<ErrorReporter> errorReporter() { return m_errorReporter; }

private:
    // Scanner mode between characters. The payload members below are only meaningful in the states that name them.
    enum State : uint8_t {
        sIdle,        // Not inside a lexeme.
        sIdentifier,  // m_lexeme holds the UTF-8 of a non-empty identifier or keyword prefix.
        sLeadingZero, // Just read a leading '0', radix not yet determined by the next character.
        sInteger      // m_integerValue accumulated so far in m_radix.
    };

    bool lexLine(std::string_view line);
    bool consume(UChar32 c);
    bool consumeIntegerCharacter(UChar32 c);
    // Emits the pending lexeme, if any, and returns to sIdle.
    void flush();
    bool appendPunctuation(UChar32 c);
    void append(Token token);

    bool unknownCharacter(UChar32 c);
    bool unexpectedCharacter(UChar32 c);

    std::unique_ptr<std::istringstream> m_ownStream;
    std::istream* m_stream;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::vector<Token> m_tokens;

    State m_state;
    std::string m_lexeme;
    uint64_t m_integerValue;
    int32_t m_radix;
    Token::Location m_lexemeStart;
    // characterNumber counts Unicode characters, not bytes.
    Token::Location m_location;
};

} // namespace minic

#endif // SRC_MINIC_LEXER_HPP_
