#include "minic/ErrorReporter.hpp"

#include "doctest/doctest.h"

namespace minic {

TEST_CASE("ErrorReporter") {
    SUBCASE("starts ok") {
        ErrorReporter er(true);
        CHECK(er.ok());
        CHECK(er.errorCount() == 0);
    }
    SUBCASE("lexical error locations are one-based") {
        ErrorReporter er(true);
        er.addLexicalError(0, 0, "Unexpected character: 'z'");
        REQUIRE(er.errorCount() == 1);
        CHECK(!er.ok());
        CHECK(er.errors()[0].kind == ErrorReporter::kLexical);
        CHECK(er.errors()[0].message == "1:1: Unexpected character: 'z'");
    }
    SUBCASE("io errors") {
        ErrorReporter er(true);
        er.addFileNotFoundError("missing.c");
        er.addFileOpenError("locked.c");
        er.addReadError(4);
        REQUIRE(er.errorCount() == 3);
        CHECK(er.errors()[0].kind == ErrorReporter::kInputOutput);
        CHECK(er.errors()[0].message == "File: 'missing.c' not found");
        CHECK(er.errors()[1].kind == ErrorReporter::kInputOutput);
        CHECK(er.errors()[1].message == "File: 'locked.c' open error");
        CHECK(er.errors()[2].kind == ErrorReporter::kInputOutput);
        CHECK(er.errors()[2].message == "Read error on input stream at line 5");
    }
}

} // namespace minic
