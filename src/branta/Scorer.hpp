#ifndef SRC_BRANTA_SCORER_HPP_
#define SRC_BRANTA_SCORER_HPP_

#include "branta/EarleyParser.hpp"
#include "branta/Hash.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace branta {

class ErrorReporter;
class Grammar;

// Fitness of a candidate Grammar against fixed positive and negative examples. The score is the product of the
// fraction of positives accepted and the fraction of negatives rejected, each floored at 0.5 / (number of examples)
// so that no grammar scores zero. A grammar that fails to compile, or an example that exceeds the parse budget,
// counts as not matching.
class Scorer {
public:
    static constexpr size_t kMaxCachedScores = 4096;

    Scorer(std::vector<std::string> positives, std::vector<std::string> negatives,
           size_t parseBudget = EarleyParser::kDefaultBudget);
    ~Scorer() = default;

    double score(const Grammar& grammar);

    static bool isGoodEnough(double score) { return score >= 1.0; }

    const std::vector<std::string>& positives() const { return m_positives; }
    const std::vector<std::string>& negatives() const { return m_negatives; }
    size_t parseBudget() const { return m_parseBudget; }

private:
    struct CachedScore {
        std::string rendering;
        double score;
    };

    size_t countMatches(const EarleyParser& parser, const std::vector<std::string>& examples) const;

    const std::vector<std::string> m_positives;
    const std::vector<std::string> m_negatives;
    size_t m_parseBudget;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::unordered_map<Hash, CachedScore> m_cache;
};

} // namespace branta

#endif // SRC_BRANTA_SCORER_HPP_
