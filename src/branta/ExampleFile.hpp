#ifndef SRC_BRANTA_EXAMPLE_FILE_HPP_
#define SRC_BRANTA_EXAMPLE_FILE_HPP_

#include <memory>
#include <string>
#include <vector>

namespace branta {

class ErrorReporter;

// A file of example strings, one per line. Carriage returns before line endings are stripped, and a final newline
// does not produce an extra empty example. Interior empty lines are kept as empty examples.
class ExampleFile {
public:
    ExampleFile() = delete;
    explicit ExampleFile(std::string path);
    ~ExampleFile() = default;

    bool read(std::shared_ptr<ErrorReporter> errorReporter);

    const std::string& path() const { return m_path; }
    const std::vector<std::string>& examples() const { return m_examples; }

private:
    std::string m_path;
    std::vector<std::string> m_examples;
};

} // namespace branta

#endif // SRC_BRANTA_EXAMPLE_FILE_HPP_
