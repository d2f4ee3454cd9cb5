#include "minic/SourceFile.hpp"

#include "minic/ErrorReporter.hpp"
#include "minic/internal/FileSystem.hpp"

#include "spdlog/spdlog.h"

#include <system_error>

namespace minic {

SourceFile::SourceFile(std::string path): m_path(path) { }

bool SourceFile::open(std::shared_ptr<ErrorReporter> errorReporter) {
    fs::path filePath(m_path);
    std::error_code ec;
    if (!fs::exists(filePath, ec)) {
        errorReporter->addFileNotFoundError(m_path);
        return false;
    }

    if (fs::is_directory(filePath, ec)) {
        errorReporter->addFileOpenError(m_path);
        return false;
    }

    m_stream.open(filePath, std::ifstream::binary);
    if (!m_stream) {
        errorReporter->addFileOpenError(m_path);
        return false;
    }

    SPDLOG_DEBUG("opened source file '{}'", m_path);
    return true;
}

} // namespace minic
