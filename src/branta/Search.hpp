#ifndef SRC_BRANTA_SEARCH_HPP_
#define SRC_BRANTA_SEARCH_HPP_

#include "branta/EarleyParser.hpp"
#include "branta/Population.hpp"
#include "branta/Scorer.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace branta {

class ErrorReporter;
class Grammar;
class Mutator;

struct SearchOptions {
    size_t populationSize = 20;
    size_t generations = 30;
    // A cascade length is drawn uniformly from this list each generation.
    std::vector<size_t> cascadeLengths = {1, 2, 4, 8, 16};
    // Stop as soon as the best grammar accepts every positive and rejects every negative.
    bool stopWhenGoodEnough = false;
    size_t parseBudget = EarleyParser::kDefaultBudget;
    // Mutation cascades discarded for unmet preconditions before a generation is counted without a candidate.
    size_t maxAttemptsPerGeneration = 100;
    uint64_t seed = 0;
};

// Seeds a generator from all 64 bits of |seed|.
std::mt19937 seedRandom(uint64_t seed);

// Population based search for a grammar matching the positive examples and rejecting the negative ones. Seeds the
// population with a grammar accepting exactly the guides, then each generation mutates a uniformly chosen parent
// through a cascade of randomly chosen operators and admits the result if it beats the lowest score held.
class Search {
public:
    Search(std::vector<std::string> guides, std::vector<std::string> positives, std::vector<std::string> negatives,
           SearchOptions options, std::shared_ptr<ErrorReporter> errorReporter);
    ~Search();

    // Validates options, builds and scores the seed grammar. Must succeed before any other call.
    bool initialize();

    // Draws a parent uniformly from the population. Returns nullptr before initialize() has seeded it.
    const Population::Entry* selectParent();
    // Applies a cascade of mutations to |parent|, each step to the previous step's output. Returns nullptr if any
    // step's preconditions were unmet, discarding the whole cascade.
    std::unique_ptr<Grammar> proposeMutant(const Grammar& parent);
    // Admits |grammar| if |score| is strictly greater than the current minimum score. Returns true if admitted.
    bool tryAdmit(std::unique_ptr<Grammar> grammar, double score);

    // Runs one counted generation, retrying discarded cascades. Returns true if a candidate was admitted.
    bool runGeneration();
    // Runs every configured generation, or until good enough if so configured. Initializes first if needed, returns
    // false only if initialization fails. The winner is then available from best().
    bool run();

    const Population& population() const { return m_population; }
    const Population::Entry& best() const { return m_population.best(); }
    int64_t generation() const { return m_generation; }
    double minimumScore() const { return m_minimumScore; }
    Scorer& scorer() { return m_scorer; }
    const SearchOptions& options() const { return m_options; }

private:
    std::vector<std::string> m_guides;
    SearchOptions m_options;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    Scorer m_scorer;
    Population m_population;
    std::vector<std::unique_ptr<Mutator>> m_mutators;
    std::mt19937 m_random;
    int64_t m_generation;
    double m_minimumScore;
    bool m_initialized;
};

} // namespace branta

#endif // SRC_BRANTA_SEARCH_HPP_
