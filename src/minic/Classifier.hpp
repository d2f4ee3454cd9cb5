#ifndef SRC_MINIC_CLASSIFIER_HPP_
#define SRC_MINIC_CLASSIFIER_HPP_

#include "minic/Token.hpp"

#include "unicode/umachine.h"

#include <cstdint>
#include <optional>
#include <string>

namespace minic {

// True for exactly the single-character structural tokens { } ( ) ;
bool isPunctuation(UChar32 c);

// Unicode Alphabetic property.
bool isAlphabetic(UChar32 c);
// Alphabetic, or any numeric general category (Nd, Nl, No).
bool isAlphanumeric(UChar32 c);
// Unicode White_Space property, which includes the ASCII space, tab, and line terminator characters.
bool isWhitespace(UChar32 c);

// Maps a punctuation character to its token. Returns an empty optional for any character where isPunctuation() is
// false, and callers are expected to report that as an error.
std::optional<Token> primitiveToToken(UChar32 c, Token::Location location);

// Maps a completed UTF-8 lexeme to a keyword token if it exactly matches a keyword spelling, or an identifier token
// otherwise. Matching is case-sensitive.
Token stringToToken(std::string lexeme, Token::Location location);

/*! Returns the numeric value of c as a digit in radix, accepting ASCII 0-9 and either case of a-f, or an empty
 * optional if c is not a digit or its value is not below radix. */
std::optional<uint64_t> digitValue(UChar32 c, int32_t radix);

} // namespace minic

#endif // SRC_MINIC_CLASSIFIER_HPP_
