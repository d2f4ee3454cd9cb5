#include "minic/Lexer.hpp"

#include "minic/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <sstream>
#include <string>
#include <vector>

namespace minic {

TEST_CASE("Lexer Base Cases") {
    SUBCASE("empty string") {
        Lexer lexer("");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 0);
    }
    SUBCASE("whitespace only") {
        Lexer lexer("   \t\n\r  \n\n");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 0);
    }
}

TEST_CASE("Lexer Punctuation") {
    SUBCASE("each punctuation character") {
        Lexer lexer("{}();");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 5);
        CHECK(lexer.tokens()[0].name == Token::Name::kOpenCurly);
        CHECK(lexer.tokens()[1].name == Token::Name::kCloseCurly);
        CHECK(lexer.tokens()[2].name == Token::Name::kOpenParen);
        CHECK(lexer.tokens()[3].name == Token::Name::kCloseParen);
        CHECK(lexer.tokens()[4].name == Token::Name::kSemicolon);
    }
    SUBCASE("whitespace contributes no tokens") {
        Lexer lexer(" ;\t( \n\n  ) }{ ;;");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 7);
        CHECK(lexer.tokens()[0].name == Token::Name::kSemicolon);
        CHECK(lexer.tokens()[1].name == Token::Name::kOpenParen);
        CHECK(lexer.tokens()[2].name == Token::Name::kCloseParen);
        CHECK(lexer.tokens()[3].name == Token::Name::kCloseCurly);
        CHECK(lexer.tokens()[4].name == Token::Name::kOpenCurly);
        CHECK(lexer.tokens()[5].name == Token::Name::kSemicolon);
        CHECK(lexer.tokens()[6].name == Token::Name::kSemicolon);
    }
}

TEST_CASE("Lexer Keywords and Identifiers") {
    SUBCASE("Int keyword") {
        Lexer lexer("Int");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::Name::kInt);
    }
    SUBCASE("Return keyword") {
        Lexer lexer("Return");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::Name::kReturn);
    }
    SUBCASE("plain identifier") {
        Lexer lexer("foo");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[0].identifier == "foo");
    }
    SUBCASE("keyword matching is case sensitive") {
        Lexer lexer("int x;");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 3);
        CHECK(lexer.tokens()[0].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[0].identifier == "int");
        CHECK(lexer.tokens()[1].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[1].identifier == "x");
        CHECK(lexer.tokens()[2].name == Token::Name::kSemicolon);
    }
    SUBCASE("keyword prefix and suffix are identifiers") {
        Lexer lexer("Integer Returns In");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 3);
        CHECK(lexer.tokens()[0].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[0].identifier == "Integer");
        CHECK(lexer.tokens()[1].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[1].identifier == "Returns");
        CHECK(lexer.tokens()[2].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[2].identifier == "In");
    }
    SUBCASE("underscores and digits") {
        Lexer lexer("_ _a1 b_2_");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 3);
        CHECK(lexer.tokens()[0].identifier == "_");
        CHECK(lexer.tokens()[1].identifier == "_a1");
        CHECK(lexer.tokens()[2].identifier == "b_2_");
    }
    SUBCASE("identifier terminated by punctuation") {
        Lexer lexer("main()");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 3);
        CHECK(lexer.tokens()[0].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[0].identifier == "main");
        CHECK(lexer.tokens()[1].name == Token::Name::kOpenParen);
        CHECK(lexer.tokens()[2].name == Token::Name::kCloseParen);
    }
    SUBCASE("invalid character mid-identifier") {
        Lexer lexer("foo+bar");
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
        REQUIRE(lexer.errorReporter()->errorCount() == 1);
        CHECK(lexer.errorReporter()->errors()[0].kind == ErrorReporter::kLexical);
    }
}

TEST_CASE("Lexer Integers") {
    SUBCASE("zero") {
        Lexer lexer("0");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::Name::kInteger);
        CHECK(lexer.tokens()[0].integerValue == 0);
    }
    SUBCASE("multi digit") {
        Lexer lexer("42");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::Name::kInteger);
        CHECK(lexer.tokens()[0].integerValue == 42);
    }
    SUBCASE("zero padded") {
        Lexer lexer("0007");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].integerValue == 7);
    }
    SUBCASE("hexadecimal") {
        Lexer lexer("0x1F 0x1f 0xff 0x0");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 4);
        CHECK(lexer.tokens()[0].name == Token::Name::kInteger);
        CHECK(lexer.tokens()[0].integerValue == 31);
        CHECK(lexer.tokens()[1].integerValue == 31);
        CHECK(lexer.tokens()[2].integerValue == 255);
        CHECK(lexer.tokens()[3].integerValue == 0);
    }
    SUBCASE("binary") {
        Lexer lexer("0b101");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::Name::kInteger);
        CHECK(lexer.tokens()[0].integerValue == 5);
    }
    SUBCASE("octal") {
        Lexer lexer("0o17");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::Name::kInteger);
        CHECK(lexer.tokens()[0].integerValue == 15);
    }
    SUBCASE("radix prefix without digits") {
        Lexer lexer("0x;0b");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 3);
        CHECK(lexer.tokens()[0].name == Token::Name::kInteger);
        CHECK(lexer.tokens()[0].integerValue == 0);
        CHECK(lexer.tokens()[1].name == Token::Name::kSemicolon);
        CHECK(lexer.tokens()[2].name == Token::Name::kInteger);
        CHECK(lexer.tokens()[2].integerValue == 0);
    }
    SUBCASE("integer terminated by punctuation") {
        Lexer lexer("Return 0;");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 3);
        CHECK(lexer.tokens()[0].name == Token::Name::kReturn);
        CHECK(lexer.tokens()[1].name == Token::Name::kInteger);
        CHECK(lexer.tokens()[1].integerValue == 0);
        CHECK(lexer.tokens()[2].name == Token::Name::kSemicolon);
    }
    SUBCASE("largest 64 bit value") {
        Lexer lexer("18446744073709551615 0xffffffffffffffff");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].integerValue == 18446744073709551615ull);
        CHECK(lexer.tokens()[1].integerValue == 18446744073709551615ull);
    }
    SUBCASE("overflow") {
        Lexer lexer("18446744073709551616");
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
        REQUIRE(lexer.errorReporter()->errorCount() == 1);
        CHECK(lexer.errorReporter()->errors()[0].kind == ErrorReporter::kLexical);
        CHECK(lexer.errorReporter()->errors()[0].message.find("overflow") != std::string::npos);
    }
}

TEST_CASE("Lexer Integer Errors") {
    SUBCASE("digit out of binary range") {
        Lexer lexer("0b2");
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
        REQUIRE(lexer.errorReporter()->errorCount() == 1);
        CHECK(lexer.errorReporter()->errors()[0].kind == ErrorReporter::kLexical);
        CHECK(lexer.errorReporter()->errors()[0].message.find("Unexpected character") != std::string::npos);
    }
    SUBCASE("nine in binary") {
        Lexer lexer("0b1019");
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
    }
    SUBCASE("eight in octal") {
        Lexer lexer("0o8");
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
    }
    SUBCASE("hex digit in decimal") {
        Lexer lexer("12a");
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
    }
    SUBCASE("second radix prefix") {
        Lexer lexer("0x0x1");
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
    }
    SUBCASE("uppercase radix prefix") {
        Lexer lexer("0X1");
        REQUIRE(!lexer.lex());
        CHECK(lexer.errorReporter()->errors()[0].message.find("Unexpected character") != std::string::npos);
    }
    SUBCASE("invalid letter after leading zero") {
        Lexer lexer("0a");
        REQUIRE(!lexer.lex());
        CHECK(lexer.errorReporter()->errors()[0].message.find("Unexpected character") != std::string::npos);
    }
    SUBCASE("alphabetic non-digit mid-integer") {
        Lexer lexer("12z");
        REQUIRE(!lexer.lex());
        CHECK(lexer.errorReporter()->errors()[0].message.find("Unexpected character") != std::string::npos);
    }
    SUBCASE("unknown character mid-integer") {
        Lexer lexer("12_");
        REQUIRE(!lexer.lex());
        CHECK(lexer.errorReporter()->errors()[0].message.find("Encountered unknown character") !=
              std::string::npos);
    }
}

TEST_CASE("Lexer Unknown Characters") {
    SUBCASE("at start") {
        Lexer lexer("@");
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
        REQUIRE(lexer.errorReporter()->errorCount() == 1);
        CHECK(lexer.errorReporter()->errors()[0].kind == ErrorReporter::kLexical);
        CHECK(lexer.errorReporter()->errors()[0].message == "1:1: Encountered unknown character: '@'");
    }
    SUBCASE("after valid tokens") {
        Lexer lexer("Int main() {\n    Return 0; #\n}");
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
        REQUIRE(lexer.errorReporter()->errorCount() == 1);
        CHECK(lexer.errorReporter()->errors()[0].message == "2:15: Encountered unknown character: '#'");
    }
    SUBCASE("unprintable") {
        Lexer lexer(std::string("a \x01"));
        REQUIRE(!lexer.lex());
        CHECK(lexer.errorReporter()->errors()[0].message == "1:3: Encountered unknown character: '\\x01'");
    }
    SUBCASE("non-ascii symbol") {
        Lexer lexer("x \xe2\x82\xac");
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
        REQUIRE(lexer.errorReporter()->errorCount() == 1);
        CHECK(lexer.errorReporter()->errors()[0].message ==
              "1:3: Encountered unknown character: '\xe2\x82\xac' (U+20AC)");
    }
    SUBCASE("non-alphabetic digit cannot start an identifier") {
        Lexer lexer("\xd9\xa1");
        REQUIRE(!lexer.lex());
        CHECK(lexer.errorReporter()->errors()[0].message.find("Encountered unknown character") !=
              std::string::npos);
    }
}

TEST_CASE("Lexer Unicode") {
    SUBCASE("accented identifier") {
        Lexer lexer("Int caf\xc3\xa9;");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 3);
        CHECK(lexer.tokens()[0].name == Token::Name::kInt);
        CHECK(lexer.tokens()[1].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[1].identifier == "caf\xc3\xa9");
        CHECK(lexer.tokens()[2].name == Token::Name::kSemicolon);
        // Columns count characters, not bytes.
        CHECK(lexer.tokens()[2].location.characterNumber == 8);
    }
    SUBCASE("greek identifier") {
        Lexer lexer("\xce\xb1\xce\xb2 x");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[0].identifier == "\xce\xb1\xce\xb2");
        CHECK(lexer.tokens()[1].identifier == "x");
        CHECK(lexer.tokens()[1].location.characterNumber == 3);
    }
    SUBCASE("non-ascii digit continues an identifier") {
        Lexer lexer("x\xd9\xa1;");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].identifier == "x\xd9\xa1");
        CHECK(lexer.tokens()[1].name == Token::Name::kSemicolon);
    }
    SUBCASE("no-break space separates identifiers") {
        Lexer lexer("x\xc2\xa0y");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].identifier == "x");
        CHECK(lexer.tokens()[1].identifier == "y");
        CHECK(lexer.tokens()[1].location.characterNumber == 2);
    }
    SUBCASE("no-break space terminates an integer") {
        Lexer lexer("12\xc2\xa0" "3");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].integerValue == 12);
        CHECK(lexer.tokens()[1].integerValue == 3);
    }
    SUBCASE("non-ascii letter mid-integer") {
        Lexer lexer("12\xc3\xa9");
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
        REQUIRE(lexer.errorReporter()->errorCount() == 1);
        CHECK(lexer.errorReporter()->errors()[0].kind == ErrorReporter::kLexical);
        CHECK(lexer.errorReporter()->errors()[0].message == "1:3: Unexpected character: '\xc3\xa9' (U+00E9)");
    }
    SUBCASE("invalid utf-8 is an io error") {
        Lexer lexer("Int x;\nInt \xff;\n");
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
        REQUIRE(lexer.errorReporter()->errorCount() == 1);
        CHECK(lexer.errorReporter()->errors()[0].kind == ErrorReporter::kInputOutput);
        CHECK(lexer.errorReporter()->errors()[0].message == "Invalid UTF-8 on input stream at line 2, byte 5");
    }
    SUBCASE("invalid utf-8 reported before lexical errors on the same line") {
        Lexer lexer("@ \xc3");
        REQUIRE(!lexer.lex());
        REQUIRE(lexer.errorReporter()->errorCount() == 1);
        CHECK(lexer.errorReporter()->errors()[0].kind == ErrorReporter::kInputOutput);
    }
}

TEST_CASE("Lexer Line Boundaries") {
    SUBCASE("identifier split across lines") {
        Lexer lexer("fo\no");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[0].identifier == "fo");
        CHECK(lexer.tokens()[1].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[1].identifier == "o");
    }
    SUBCASE("integer split across lines") {
        Lexer lexer("12\n34\n");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].integerValue == 12);
        CHECK(lexer.tokens()[1].integerValue == 34);
    }
    SUBCASE("radix prefix does not carry to next line") {
        Lexer lexer("0x\nff");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].name == Token::Name::kInteger);
        CHECK(lexer.tokens()[0].integerValue == 0);
        CHECK(lexer.tokens()[1].name == Token::Name::kIdentifier);
        CHECK(lexer.tokens()[1].identifier == "ff");
    }
    SUBCASE("windows line endings") {
        Lexer lexer("Int\r\nx\r\n");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].name == Token::Name::kInt);
        CHECK(lexer.tokens()[1].identifier == "x");
    }
}

TEST_CASE("Lexer Locations") {
    Lexer lexer("Int main() {\n    Return 0x2a;\n}\n");
    REQUIRE(lexer.lex());
    REQUIRE(lexer.tokens().size() == 9);

    CHECK(lexer.tokens()[0].name == Token::Name::kInt);
    CHECK(lexer.tokens()[0].location.lineNumber == 0);
    CHECK(lexer.tokens()[0].location.characterNumber == 0);
    CHECK(lexer.tokens()[1].name == Token::Name::kIdentifier);
    CHECK(lexer.tokens()[1].location.lineNumber == 0);
    CHECK(lexer.tokens()[1].location.characterNumber == 4);
    CHECK(lexer.tokens()[2].name == Token::Name::kOpenParen);
    CHECK(lexer.tokens()[2].location.characterNumber == 8);
    CHECK(lexer.tokens()[3].name == Token::Name::kCloseParen);
    CHECK(lexer.tokens()[3].location.characterNumber == 9);
    CHECK(lexer.tokens()[4].name == Token::Name::kOpenCurly);
    CHECK(lexer.tokens()[4].location.characterNumber == 11);

    CHECK(lexer.tokens()[5].name == Token::Name::kReturn);
    CHECK(lexer.tokens()[5].location.lineNumber == 1);
    CHECK(lexer.tokens()[5].location.characterNumber == 4);
    CHECK(lexer.tokens()[6].name == Token::Name::kInteger);
    CHECK(lexer.tokens()[6].integerValue == 42);
    CHECK(lexer.tokens()[6].location.lineNumber == 1);
    CHECK(lexer.tokens()[6].location.characterNumber == 11);
    CHECK(lexer.tokens()[7].name == Token::Name::kSemicolon);
    CHECK(lexer.tokens()[7].location.characterNumber == 15);

    CHECK(lexer.tokens()[8].name == Token::Name::kCloseCurly);
    CHECK(lexer.tokens()[8].location.lineNumber == 2);
    CHECK(lexer.tokens()[8].location.characterNumber == 0);
}

TEST_CASE("Lexer Determinism") {
    SUBCASE("identical tokens") {
        std::string code = "Int f() { Return 0b11; }";
        Lexer first(code);
        Lexer second(code);
        REQUIRE(first.lex());
        REQUIRE(second.lex());
        REQUIRE(first.tokens().size() == second.tokens().size());
        for (size_t i = 0; i < first.tokens().size(); ++i) {
            CHECK(first.tokens()[i].toString() == second.tokens()[i].toString());
        }
    }
    SUBCASE("identical errors") {
        std::string code = "Int f() { Return 0o9; }";
        Lexer first(code);
        Lexer second(code);
        REQUIRE(!first.lex());
        REQUIRE(!second.lex());
        REQUIRE(first.errorReporter()->errorCount() == 1);
        REQUIRE(second.errorReporter()->errorCount() == 1);
        CHECK(first.errorReporter()->errors()[0].message == second.errorReporter()->errors()[0].message);
    }
}

TEST_CASE("Lexer External Stream") {
    SUBCASE("reads from caller stream") {
        std::istringstream stream("Int x;\nReturn x;\n");
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Lexer lexer(stream, errorReporter);
        REQUIRE(lexer.lex());
        REQUIRE(errorReporter->ok());
        REQUIRE(lexer.tokens().size() == 6);
        CHECK(lexer.tokens()[3].name == Token::Name::kReturn);
    }
    SUBCASE("bad stream is an io error") {
        std::istringstream stream("Int x;");
        stream.setstate(std::ios_base::badbit);
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Lexer lexer(stream, errorReporter);
        REQUIRE(!lexer.lex());
        CHECK(lexer.tokens().size() == 0);
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->errors()[0].kind == ErrorReporter::kInputOutput);
    }
}

} // namespace minic
