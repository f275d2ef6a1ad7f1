#include "branta/ExampleFile.hpp"

#include "branta/ErrorReporter.hpp"
#include "branta/internal/FileSystem.hpp"

#include "spdlog/spdlog.h"

#include <fstream>

namespace branta {

ExampleFile::ExampleFile(std::string path): m_path(std::move(path)) {}

bool ExampleFile::read(std::shared_ptr<ErrorReporter> errorReporter) {
    m_examples.clear();
    fs::path filePath(m_path);
    if (!fs::exists(filePath)) {
        errorReporter->addFileNotFoundError(m_path);
        return false;
    }

    std::ifstream inFile(filePath, std::ifstream::binary);
    if (!inFile) {
        errorReporter->addFileOpenError(m_path);
        return false;
    }

    std::string line;
    while (std::getline(inFile, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        m_examples.emplace_back(std::move(line));
        line.clear();
    }
    if (inFile.bad()) {
        errorReporter->addFileReadError(m_path);
        return false;
    }

    SPDLOG_DEBUG("Read {} examples from '{}'.", m_examples.size(), m_path);
    return true;
}

} // namespace branta
