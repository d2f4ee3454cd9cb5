#include "minic/Classifier.hpp"

#include "doctest/doctest.h"

namespace minic {

TEST_CASE("primitiveToToken") {
    Token::Location location{3, 7};
    SUBCASE("punctuation") {
        auto token = primitiveToToken('{', location);
        REQUIRE(token);
        CHECK(token->name == Token::Name::kOpenCurly);
        CHECK(token->location.lineNumber == 3);
        CHECK(token->location.characterNumber == 7);
        token = primitiveToToken('}', location);
        REQUIRE(token);
        CHECK(token->name == Token::Name::kCloseCurly);
        token = primitiveToToken('(', location);
        REQUIRE(token);
        CHECK(token->name == Token::Name::kOpenParen);
        token = primitiveToToken(')', location);
        REQUIRE(token);
        CHECK(token->name == Token::Name::kCloseParen);
        token = primitiveToToken(';', location);
        REQUIRE(token);
        CHECK(token->name == Token::Name::kSemicolon);
    }
    SUBCASE("anything else") {
        CHECK(!primitiveToToken('[', location));
        CHECK(!primitiveToToken('a', location));
        CHECK(!primitiveToToken('0', location));
        CHECK(!primitiveToToken(' ', location));
        CHECK(!primitiveToToken('\0', location));
    }
    SUBCASE("agrees with isPunctuation") {
        for (UChar32 c = 0; c < 0x3000; ++c) {
            CHECK(isPunctuation(c) == primitiveToToken(c, location).has_value());
        }
    }
}

TEST_CASE("Unicode character classes") {
    SUBCASE("alphabetic") {
        CHECK(isAlphabetic('a'));
        CHECK(isAlphabetic('Z'));
        CHECK(isAlphabetic(0x00E9)); // e with acute
        CHECK(isAlphabetic(0x03B1)); // greek alpha
        CHECK(!isAlphabetic('_'));
        CHECK(!isAlphabetic('7'));
        CHECK(!isAlphabetic(0x0661)); // arabic-indic one
        CHECK(!isAlphabetic(0x20AC)); // euro sign
    }
    SUBCASE("alphanumeric") {
        CHECK(isAlphanumeric('a'));
        CHECK(isAlphanumeric('7'));
        CHECK(isAlphanumeric(0x0661));
        CHECK(isAlphanumeric(0x00BD)); // vulgar fraction one half
        CHECK(!isAlphanumeric('_'));
        CHECK(!isAlphanumeric(';'));
        CHECK(!isAlphanumeric(0x20AC));
    }
    SUBCASE("whitespace") {
        CHECK(isWhitespace(' '));
        CHECK(isWhitespace('\t'));
        CHECK(isWhitespace('\r'));
        CHECK(isWhitespace(0x00A0)); // no-break space
        CHECK(isWhitespace(0x2003)); // em space
        CHECK(!isWhitespace('a'));
        CHECK(!isWhitespace(0x200B)); // zero width space is not White_Space
    }
}

TEST_CASE("stringToToken") {
    Token::Location location{0, 2};
    SUBCASE("keywords") {
        CHECK(stringToToken("Int", location).name == Token::Name::kInt);
        CHECK(stringToToken("Return", location).name == Token::Name::kReturn);
    }
    SUBCASE("case sensitive") {
        auto token = stringToToken("int", location);
        CHECK(token.name == Token::Name::kIdentifier);
        CHECK(token.identifier == "int");
        token = stringToToken("RETURN", location);
        CHECK(token.name == Token::Name::kIdentifier);
        CHECK(token.identifier == "RETURN");
    }
    SUBCASE("identifier") {
        auto token = stringToToken("counter_1", location);
        CHECK(token.name == Token::Name::kIdentifier);
        CHECK(token.identifier == "counter_1");
        CHECK(token.location.characterNumber == 2);
    }
}

TEST_CASE("digitValue") {
    SUBCASE("decimal") {
        CHECK(digitValue('0', 10).value() == 0);
        CHECK(digitValue('9', 10).value() == 9);
        CHECK(!digitValue('a', 10));
    }
    SUBCASE("binary") {
        CHECK(digitValue('0', 2).value() == 0);
        CHECK(digitValue('1', 2).value() == 1);
        CHECK(!digitValue('2', 2));
        CHECK(!digitValue('9', 2));
    }
    SUBCASE("octal") {
        CHECK(digitValue('7', 8).value() == 7);
        CHECK(!digitValue('8', 8));
        CHECK(!digitValue('9', 8));
    }
    SUBCASE("hexadecimal") {
        CHECK(digitValue('a', 16).value() == 10);
        CHECK(digitValue('f', 16).value() == 15);
        CHECK(digitValue('A', 16).value() == 10);
        CHECK(digitValue('F', 16).value() == 15);
        CHECK(!digitValue('g', 16));
        CHECK(!digitValue('x', 16));
        CHECK(!digitValue('o', 16));
    }
}

} // namespace minic
