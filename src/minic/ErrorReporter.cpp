#include "minic/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace minic {

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(Kind kind, const std::string& error) {
    if (!m_suppress) {
        spdlog::error(error);
    }
    m_errors.emplace_back(Error{kind, error});
}

void ErrorReporter::addFileNotFoundError(std::string filePath) {
    addError(kInputOutput, fmt::format("File: '{}' not found", filePath));
}

void ErrorReporter::addFileOpenError(std::string filePath) {
    addError(kInputOutput, fmt::format("File: '{}' open error", filePath));
}

void ErrorReporter::addReadError(int32_t lineNumber) {
    addError(kInputOutput, fmt::format("Read error on input stream at line {}", lineNumber + 1));
}

void ErrorReporter::addEncodingError(int32_t lineNumber, int32_t byteOffset) {
    addError(kInputOutput, fmt::format("Invalid UTF-8 on input stream at line {}, byte {}", lineNumber + 1,
                                       byteOffset + 1));
}

void ErrorReporter::addLexicalError(int32_t lineNumber, int32_t characterNumber, const std::string& error) {
    // Report as 1-based, the way editors number lines and columns.
    addError(kLexical, fmt::format("{}:{}: {}", lineNumber + 1, characterNumber + 1, error));
}

} // namespace minic
