// minic-lex, command line lexer for minic source files. Prints the token sequence of one file.
#include "minic/ErrorReporter.hpp"
#include "minic/Lexer.hpp"
#include "minic/SourceFile.hpp"

#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <iostream>
#include <memory>

DEFINE_string(logLevel, "warn", "Logging level, one of trace, debug, info, warn, error, critical, or off.");
DEFINE_bool(locations, false, "Prefix each printed token with its line and column number.");

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("minic-lex [options] input-file");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    spdlog::set_level(spdlog::level::from_str(FLAGS_logLevel));

    if (argc != 2) {
        std::cerr << "usage: minic-lex [options] input-file" << std::endl;
        return -1;
    }

    auto errorReporter = std::make_shared<minic::ErrorReporter>();
    minic::SourceFile sourceFile(argv[1]);
    if (!sourceFile.open(errorReporter)) {
        return -1;
    }

    minic::Lexer lexer(sourceFile.stream(), errorReporter);
    if (!lexer.lex() || !errorReporter->ok()) {
        return -1;
    }

    for (const auto& token : lexer.tokens()) {
        if (FLAGS_locations) {
            std::cout << token.location.lineNumber + 1 << ":" << token.location.characterNumber + 1 << " ";
        }
        std::cout << token.toString() << std::endl;
    }

    return 0;
}
