#include "minic/SourceFile.hpp"

#include "minic/ErrorReporter.hpp"
#include "minic/internal/FileSystem.hpp"
#include "minic/Lexer.hpp"

#include "doctest/doctest.h"

#include <fstream>
#include <memory>

namespace minic {

TEST_CASE("SourceFile") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);

    SUBCASE("missing file") {
        SourceFile file((fs::temp_directory_path() / "minic_no_such_file.c").string());
        REQUIRE(!file.open(errorReporter));
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->errors()[0].kind == ErrorReporter::kInputOutput);
    }
    SUBCASE("directory") {
        SourceFile file(fs::temp_directory_path().string());
        REQUIRE(!file.open(errorReporter));
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->errors()[0].kind == ErrorReporter::kInputOutput);
    }
    SUBCASE("lexes file contents") {
        auto path = fs::temp_directory_path() / "minic_source_file_unittest.c";
        {
            std::ofstream out(path, std::ofstream::binary);
            out << "Int main() {\n    Return 0b101;\n}\n";
        }
        SourceFile file(path.string());
        REQUIRE(file.open(errorReporter));
        Lexer lexer(file.stream(), errorReporter);
        REQUIRE(lexer.lex());
        CHECK(errorReporter->ok());
        REQUIRE(lexer.tokens().size() == 9);
        CHECK(lexer.tokens()[6].name == Token::Name::kInteger);
        CHECK(lexer.tokens()[6].integerValue == 5);

        std::error_code ec;
        fs::remove(path, ec);
    }
}

} // namespace minic
