#include "minic/Token.hpp"

#include "doctest/doctest.h"

namespace minic {

TEST_CASE("Token toString") {
    Token::Location location{0, 0};
    CHECK(Token::make(Token::Name::kOpenCurly, location).toString() == "OpenCurly");
    CHECK(Token::make(Token::Name::kCloseCurly, location).toString() == "CloseCurly");
    CHECK(Token::make(Token::Name::kOpenParen, location).toString() == "OpenParen");
    CHECK(Token::make(Token::Name::kCloseParen, location).toString() == "CloseParen");
    CHECK(Token::make(Token::Name::kSemicolon, location).toString() == "Semicolon");
    CHECK(Token::make(Token::Name::kInt, location).toString() == "Int");
    CHECK(Token::make(Token::Name::kReturn, location).toString() == "Return");
    CHECK(Token::makeIdentifier("main", location).toString() == "Identifier(main)");
    CHECK(Token::makeInteger(31, location).toString() == "Integer(31)");
    CHECK(Token::makeInteger(18446744073709551615ull, location).toString() == "Integer(18446744073709551615)");
}

} // namespace minic
