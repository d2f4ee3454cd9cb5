#ifndef SRC_MINIC_SOURCE_FILE_HPP_
#define SRC_MINIC_SOURCE_FILE_HPP_

#include <fstream>
#include <istream>
#include <memory>
#include <string>

namespace minic {

class ErrorReporter;

// Represents a file of source code, opened as a stream for the Lexer to read line by line.
class SourceFile {
public:
    SourceFile() = delete;
    SourceFile(std::string path);
    ~SourceFile() = default;

    bool open(std::shared_ptr<ErrorReporter> errorReporter);

    const std::string& path() const { return m_path; }
    // Only valid after a successful call to open().
    std::istream& stream() { return m_stream; }

private:
    std::string m_path;
    std::ifstream m_stream;
};

} // namespace minic

#endif // SRC_MINIC_SOURCE_FILE_HPP_
