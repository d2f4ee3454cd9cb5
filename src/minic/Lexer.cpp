#include "minic/Lexer.hpp"

#include "minic/Classifier.hpp"
#include "minic/ErrorReporter.hpp"

#ifdef MINIC_DEBUG_LEXER
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif
#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include "unicode/utf8.h"

#include <limits>
#include <utility>
#include <vector>

namespace {

std::string toUTF8(UChar32 c) {
    char buffer[U8_MAX_LENGTH];
    int32_t length = 0;
    U8_APPEND_UNSAFE(buffer, length, c);
    return std::string(buffer, length);
}

// Quotes c for error messages, escaping ASCII control characters and naming the code point of anything outside ASCII.
std::string describeCharacter(UChar32 c) {
    if (c >= 0x20 && c < 0x7f) {
        return fmt::format("'{}'", static_cast<char>(c));
    }
    if (c < 0x80) {
        return fmt::format("'\\x{:02x}'", c);
    }
    return fmt::format("'{}' (U+{:04X})", toUTF8(c), c);
}

// Characters that continue an integer literal, either as a digit or as a radix prefix after a leading zero. Whether
// they are valid in the current radix is decided later.
bool isIntegerCharacter(UChar32 c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F') || c == 'o' || c == 'x';
}

} // namespace

namespace minic {

Lexer::Lexer(std::istream& stream, std::shared_ptr<ErrorReporter> errorReporter):
    m_stream(&stream),
    m_errorReporter(errorReporter),
    m_state(sIdle),
    m_integerValue(0),
    m_radix(10) { }

Lexer::Lexer(std::string_view code):
    m_ownStream(std::make_unique<std::istringstream>(std::string(code))),
    m_stream(m_ownStream.get()),
    m_errorReporter(std::make_shared<ErrorReporter>(true)),
    m_state(sIdle),
    m_integerValue(0),
    m_radix(10) { }

bool Lexer::lex() {
    m_tokens.clear();
    m_state = sIdle;
    m_location = Token::Location{0, 0};

    std::string line;
    while (std::getline(*m_stream, line)) {
        SPDLOG_TRACE("lexing line {}: '{}'", m_location.lineNumber + 1, line);
        if (!lexLine(line)) {
            m_tokens.clear();
            return false;
        }
        ++m_location.lineNumber;
    }

    if (m_stream->bad()) {
        m_errorReporter->addReadError(m_location.lineNumber);
        m_tokens.clear();
        return false;
    }

    SPDLOG_DEBUG("lexed {} tokens from {} lines", m_tokens.size(), m_location.lineNumber);
    return true;
}

bool Lexer::lexLine(std::string_view line) {
    // Decode the whole line before lexing any of it, so a malformed line is always reported as an encoding error.
    std::vector<UChar32> characters;
    characters.reserve(line.size());
    auto bytes = reinterpret_cast<const uint8_t*>(line.data());
    auto length = static_cast<int32_t>(line.size());
    int32_t offset = 0;
    while (offset < length) {
        int32_t start = offset;
        UChar32 c;
        U8_NEXT(bytes, offset, length, c);
        if (c < 0) {
            m_errorReporter->addEncodingError(m_location.lineNumber, start);
            return false;
        }
        characters.emplace_back(c);
    }

    for (size_t i = 0; i < characters.size(); ++i) {
        m_location.characterNumber = static_cast<int32_t>(i);
        if (!consume(characters[i])) {
            return false;
        }
    }

    // End of line, dump whatever lexeme is pending.
    flush();
    return true;
}

bool Lexer::consume(UChar32 c) {
    switch (m_state) {
    case sIdle:
        if (isPunctuation(c)) {
            return appendPunctuation(c);
        }
        if (c == '0') {
            m_state = sLeadingZero;
            m_integerValue = 0;
            m_lexemeStart = m_location;
            return true;
        }
        if (c >= '1' && c <= '9') {
            m_state = sInteger;
            m_integerValue = static_cast<uint64_t>(c - '0');
            m_radix = 10;
            m_lexemeStart = m_location;
            return true;
        }
        if (isAlphabetic(c) || c == '_') {
            m_state = sIdentifier;
            m_lexeme = toUTF8(c);
            m_lexemeStart = m_location;
            return true;
        }
        if (isWhitespace(c)) {
            return true;
        }
        return unknownCharacter(c);

    case sIdentifier:
        if (isPunctuation(c)) {
            flush();
            return appendPunctuation(c);
        }
        if (isAlphanumeric(c) || c == '_') {
            m_lexeme.append(toUTF8(c));
            return true;
        }
        if (isWhitespace(c)) {
            flush();
            return true;
        }
        return unknownCharacter(c);

    case sLeadingZero:
    case sInteger:
        if (isPunctuation(c)) {
            flush();
            return appendPunctuation(c);
        }
        if (isWhitespace(c)) {
            flush();
            return true;
        }
        if (isIntegerCharacter(c)) {
            return consumeIntegerCharacter(c);
        }
        if (isAlphabetic(c)) {
            return unexpectedCharacter(c);
        }
        return unknownCharacter(c);
    }

    return unknownCharacter(c);
}

bool Lexer::consumeIntegerCharacter(UChar32 c) {
    if (m_state == sLeadingZero) {
        switch (c) {
        case 'b':
            m_radix = 2;
            break;

        case 'o':
            m_radix = 8;
            break;

        case 'x':
            m_radix = 16;
            break;

        default:
            if (c < '0' || c > '9') {
                return unexpectedCharacter(c);
            }
            m_radix = 10;
            m_integerValue = static_cast<uint64_t>(c - '0');
            break;
        }
        m_state = sInteger;
        return true;
    }

    auto digit = digitValue(c, m_radix);
    if (!digit) {
        return unexpectedCharacter(c);
    }

    auto radix = static_cast<uint64_t>(m_radix);
    if (m_integerValue > (std::numeric_limits<uint64_t>::max() - *digit) / radix) {
        m_errorReporter->addLexicalError(m_location.lineNumber, m_location.characterNumber,
                                         "Integer literal overflow, value does not fit in 64 bits");
        return false;
    }
    m_integerValue = (m_integerValue * radix) + *digit;
    return true;
}

void Lexer::flush() {
    switch (m_state) {
    case sIdle:
        break;

    case sIdentifier:
        append(stringToToken(std::move(m_lexeme), m_lexemeStart));
        m_lexeme.clear();
        break;

    case sLeadingZero:
    case sInteger:
        append(Token::makeInteger(m_integerValue, m_lexemeStart));
        break;
    }

    m_state = sIdle;
}

bool Lexer::appendPunctuation(UChar32 c) {
    auto token = primitiveToToken(c, m_location);
    if (!token) {
        return unexpectedCharacter(c);
    }
    append(std::move(*token));
    return true;
}

void Lexer::append(Token token) {
    SPDLOG_TRACE("token {} at {}:{}", token.toString(), token.location.lineNumber + 1,
                 token.location.characterNumber + 1);
    m_tokens.emplace_back(std::move(token));
}

bool Lexer::unknownCharacter(UChar32 c) {
    m_errorReporter->addLexicalError(m_location.lineNumber, m_location.characterNumber,
                                     fmt::format("Encountered unknown character: {}", describeCharacter(c)));
    return false;
}

bool Lexer::unexpectedCharacter(UChar32 c) {
    m_errorReporter->addLexicalError(m_location.lineNumber, m_location.characterNumber,
                                     fmt::format("Unexpected character: {}", describeCharacter(c)));
    return false;
}

} // namespace minic
