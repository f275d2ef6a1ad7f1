#include "branta/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace branta {

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::setCode(std::string_view code) {
    m_code = code;
    m_lineEndings.clear();
}

void ErrorReporter::addError(const std::string& error) {
    if (!m_suppress) {
        SPDLOG_ERROR(error);
    }
    m_errors.emplace_back(error);
}

void ErrorReporter::addFileNotFoundError(const std::string& filePath) {
    addError(fmt::format("File '{}' not found.", filePath));
}

void ErrorReporter::addFileOpenError(const std::string& filePath) {
    addError(fmt::format("Unable to open file '{}'.", filePath));
}

void ErrorReporter::addFileReadError(const std::string& filePath) {
    addError(fmt::format("Error reading file '{}'.", filePath));
}

size_t ErrorReporter::getLineNumber(const char* location) {
    // Lazily construct the line number map on first request for line number.
    if (!m_lineEndings.size()) {
        const char* code = m_code.data();
        const char* end = code + m_code.size();
        m_lineEndings.emplace_back(code);
        while (code < end) {
            if (*code == '\n') {
                m_lineEndings.emplace_back(code);
            }
            ++code;
        }
        m_lineEndings.emplace_back(end);
    }

    // Binary search on ranges to find line number.
    size_t start = 0;
    size_t end = m_lineEndings.size() - 1;
    while (start < end) {
        size_t middle = start + ((end - start) / 2);
        if (m_lineEndings[middle] < location) {
            if (m_lineEndings[middle + 1] >= location) {
                return middle + 1;
            }
            start = middle;
        } else {
            end = middle;
        }
    }

    return start + 1;
}

} // namespace branta
