#ifndef SRC_BRANTA_GRAMMAR_TEST_FIXTURE_HPP_
#define SRC_BRANTA_GRAMMAR_TEST_FIXTURE_HPP_

#include "branta/EarleyParser.hpp"
#include "branta/ErrorReporter.hpp"
#include "branta/Grammar.hpp"
#include "branta/GrammarReader.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace branta {

// Helpers for tests comparing the languages of grammars by brute force over short strings.
class GrammarTestFixture {
public:
    GrammarTestFixture(): m_errorReporter(std::make_shared<ErrorReporter>()) {}
    virtual ~GrammarTestFixture() = default;

    // Every string over |characters| with length 0 through |maxLength|.
    static std::vector<std::string> allStrings(std::string_view characters, size_t maxLength) {
        std::vector<std::string> strings{std::string()};
        size_t levelStart = 0;
        for (size_t length = 1; length <= maxLength; ++length) {
            size_t levelEnd = strings.size();
            for (size_t i = levelStart; i < levelEnd; ++i) {
                for (char c : characters) {
                    strings.emplace_back(strings[i] + c);
                }
            }
            levelStart = levelEnd;
        }
        return strings;
    }

    // The subset of |strings| accepted by |grammar|, which must compile.
    std::set<std::string> accepted(const Grammar& grammar, const std::vector<std::string>& strings) {
        EarleyParser parser(m_errorReporter);
        REQUIRE(parser.compile(grammar));
        std::set<std::string> result;
        for (const auto& s : strings) {
            auto parseResult = parser.parse(s);
            REQUIRE(parseResult != EarleyParser::Result::kBudgetExceeded);
            if (parseResult == EarleyParser::Result::kAccepted) {
                result.insert(s);
            }
        }
        return result;
    }

    bool accepts(const Grammar& grammar, std::string_view input) {
        EarleyParser parser(m_errorReporter);
        REQUIRE(parser.compile(grammar));
        return parser.accepts(input);
    }

    // Reads grammar text that must be free of errors.
    std::unique_ptr<Grammar> readGrammar(std::string_view text) {
        GrammarReader reader(text, m_errorReporter);
        auto grammar = reader.read();
        REQUIRE(grammar);
        return grammar;
    }

    static bool isSubset(const std::set<std::string>& a, const std::set<std::string>& b) {
        for (const auto& s : a) {
            if (!b.count(s)) { return false; }
        }
        return true;
    }

protected:
    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace branta

#endif // SRC_BRANTA_GRAMMAR_TEST_FIXTURE_HPP_
