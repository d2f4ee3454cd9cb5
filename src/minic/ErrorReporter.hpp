#ifndef SRC_MINIC_ERROR_REPORTER_HPP_
#define SRC_MINIC_ERROR_REPORTER_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace minic {

class ErrorReporter {
public:
    enum Kind {
        kInputOutput, // Failure to find, open, or read the input.
        kLexical      // Invalid data in otherwise readable input.
    };

    struct Error {
        Kind kind;
        std::string message;
    };

    // If suppress is true, will not print reported errors to log (useful for testing failures without
    // polluting the log)
    ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    void addError(Kind kind, const std::string& error);

    // Specific errors.

    // Fatal error, unable to locate a file under filePath.
    void addFileNotFoundError(std::string filePath);
    // Fatal error, unable to open file at filePath.
    void addFileOpenError(std::string filePath);
    // Fatal error, the input stream failed while reading lineNumber (zero-based).
    void addReadError(int32_t lineNumber);
    // Fatal error, lineNumber (zero-based) is not valid UTF-8 starting at byteOffset.
    void addEncodingError(int32_t lineNumber, int32_t byteOffset);
    // Fatal lexer error at the zero-based line and character location.
    void addLexicalError(int32_t lineNumber, int32_t characterNumber, const std::string& error);

    size_t errorCount() const { return m_errors.size(); }
    bool ok() const { return m_errors.size() == 0; }
    const std::vector<Error>& errors() const { return m_errors; }

private:
    bool m_suppress;
    std::vector<Error> m_errors;
};

} // namespace minic

#endif // SRC_MINIC_ERROR_REPORTER_HPP_
