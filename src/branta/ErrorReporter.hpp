#ifndef SRC_BRANTA_ERROR_REPORTER_HPP_
#define SRC_BRANTA_ERROR_REPORTER_HPP_

#include <string>
#include <string_view>
#include <vector>

namespace branta {

class ErrorReporter {
public:
    // If suppress is true, will not print reported errors to log (useful for scoring candidate grammars that are
    // expected to fail, or for testing failures without polluting the log)
    ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    // Must be called before getLineNumber() can be called.
    void setCode(std::string_view code);

    void addError(const std::string& error);

    // Fatal error, unable to locate a file under filePath.
    void addFileNotFoundError(const std::string& filePath);
    // Fatal error, unable to open file at filePath.
    void addFileOpenError(const std::string& filePath);
    // Fatal error, failed to read file at filePath.
    void addFileReadError(const std::string& filePath);

    size_t getLineNumber(const char* location);
    size_t errorCount() const { return m_errors.size(); }
    bool ok() const { return m_errors.size() == 0; }
    const std::vector<std::string>& errors() const { return m_errors; }
    void clear() { m_errors.clear(); }

private:
    bool m_suppress;
    std::string_view m_code;
    std::vector<std::string> m_errors;
    std::vector<const char*> m_lineEndings;
};

} // namespace branta

#endif // SRC_BRANTA_ERROR_REPORTER_HPP_
