#ifndef SRC_BRANTA_EARLEY_PARSER_HPP_
#define SRC_BRANTA_EARLEY_PARSER_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace branta {

class ErrorReporter;
class Grammar;

// Membership tester for arbitrary context-free Grammars. Compiles a Grammar into integer-indexed productions and runs
// an Earley recognizer over input strings, rooted at the start rule. Any structure the mutation operators can produce
// compiles except for references to undefined nonterminals and empty terminals. Each parse is bounded by a budget on
// the number of chart items created, so a degenerate grammar costs at most that much work per input.
class EarleyParser {
public:
    enum class Result {
        kAccepted,
        kRejected,
        kBudgetExceeded
    };

    static constexpr size_t kDefaultBudget = 250000;

    explicit EarleyParser(std::shared_ptr<ErrorReporter> errorReporter);
    ~EarleyParser() = default;

    // Returns false, with details in the ErrorReporter, if the grammar can't be compiled.
    bool compile(const Grammar& grammar);
    // Reads a rendered grammar with GrammarReader and compiles it.
    bool compile(std::string_view rendering);

    // Parsing without a successful compile() always rejects.
    Result parse(std::string_view input, size_t budget = kDefaultBudget) const;
    bool accepts(std::string_view input, size_t budget = kDefaultBudget) const {
        return parse(input, budget) == Result::kAccepted;
    }

private:
    // Right hand side symbols are nonterminal indices when >= 0, or -(terminal index + 1) when negative.
    struct Production {
        int32_t lhs;
        std::vector<int32_t> rhs;
    };

    struct Item {
        uint32_t production;
        uint32_t dot;
        uint32_t origin;
    };

    void computeNullable();

    std::shared_ptr<ErrorReporter> m_errorReporter;
    bool m_compiled;
    int32_t m_startIndex;
    size_t m_maxBodyLength;
    std::vector<std::string> m_terminals;
    std::vector<Production> m_productions;
    // Production indices for each nonterminal.
    std::vector<std::vector<uint32_t>> m_productionsByLhs;
    std::vector<bool> m_nullable;
};

} // namespace branta

#endif // SRC_BRANTA_EARLEY_PARSER_HPP_
