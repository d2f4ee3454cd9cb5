#ifndef SRC_MINIC_INTERNAL_FILE_SYSTEM_HPP_
#define SRC_MINIC_INTERNAL_FILE_SYSTEM_HPP_

#include <filesystem>
namespace fs = std::filesystem;

#endif // SRC_MINIC_INTERNAL_FILE_SYSTEM_HPP_
