#include "branta/Scorer.hpp"

#include "branta/ErrorReporter.hpp"
#include "branta/Grammar.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace branta {

Scorer::Scorer(std::vector<std::string> positives, std::vector<std::string> negatives, size_t parseBudget):
    m_positives(std::move(positives)),
    m_negatives(std::move(negatives)),
    m_parseBudget(parseBudget),
    m_errorReporter(std::make_shared<ErrorReporter>(true)) {}

double Scorer::score(const Grammar& grammar) {
    const std::string& rendering = grammar.render();
    Hash h = grammar.hash();
    auto cacheIter = m_cache.find(h);
    if (cacheIter != m_cache.end() && cacheIter->second.rendering == rendering) {
        return cacheIter->second.score;
    }

    // Compile once and test every example against the same parser.
    EarleyParser parser(m_errorReporter);
    size_t positivesMatched = 0;
    size_t negativesMatched = 0;
    if (parser.compile(grammar)) {
        positivesMatched = countMatches(parser, m_positives);
        negativesMatched = countMatches(parser, m_negatives);
    } else {
        SPDLOG_DEBUG("Candidate grammar failed to compile, scoring as matching nothing.");
    }
    m_errorReporter->clear();

    double positiveScore = 1.0;
    if (m_positives.size()) {
        double total = static_cast<double>(m_positives.size());
        positiveScore = std::max(static_cast<double>(positivesMatched) / total, 0.5 / total);
    }
    double negativeScore = 1.0;
    if (m_negatives.size()) {
        double total = static_cast<double>(m_negatives.size());
        negativeScore = std::max(1.0 - (static_cast<double>(negativesMatched) / total), 0.5 / total);
    }
    double result = positiveScore * negativeScore;

    SPDLOG_TRACE("Scored grammar {:08x}: {}/{} positives, {}/{} negatives matched, score {}", h, positivesMatched,
            m_positives.size(), negativesMatched, m_negatives.size(), result);

    if (m_cache.size() >= kMaxCachedScores) {
        m_cache.clear();
    }
    // On a hash collision the most recent grammar wins the slot.
    m_cache[h] = CachedScore{rendering, result};
    return result;
}

size_t Scorer::countMatches(const EarleyParser& parser, const std::vector<std::string>& examples) const {
    size_t matched = 0;
    for (const auto& example : examples) {
        auto result = parser.parse(example, m_parseBudget);
        if (result == EarleyParser::Result::kAccepted) {
            SPDLOG_TRACE("Accepted example '{}'.", example);
            ++matched;
        } else if (result == EarleyParser::Result::kRejected) {
            SPDLOG_TRACE("Rejected example '{}'.", example);
        } else {
            SPDLOG_TRACE("Parse budget exceeded on example '{}', counting as no match.", example);
        }
    }
    return matched;
}

} // namespace branta
