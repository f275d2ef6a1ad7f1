#ifndef SRC_BRANTA_GRAMMAR_READER_HPP_
#define SRC_BRANTA_GRAMMAR_READER_HPP_

#include "branta/Grammar.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace branta {

class ErrorReporter;

// Reads the text produced by Grammar::render() back into a Grammar. Rules are written "name: body | body", alternatives
// may continue on following lines, terminals are double-quoted, "" is an empty body and // starts a comment.
class GrammarReader {
public:
    GrammarReader(std::string_view text, std::shared_ptr<ErrorReporter> errorReporter);
    ~GrammarReader() = default;

    // Returns nullptr on any syntax error, with details added to the ErrorReporter.
    std::unique_ptr<Grammar> read();

private:
    struct Token {
        enum Name {
            kIdentifier,
            kString,
            kColon,
            kPipe
        };
        Name name;
        std::string value;
        const char* location;
    };

    bool tokenize();
    bool readString(const char*& p, std::string& value);
    void addError(const char* location, const std::string& message);

    std::string_view m_text;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::vector<Token> m_tokens;
};

} // namespace branta

#endif // SRC_BRANTA_GRAMMAR_READER_HPP_
