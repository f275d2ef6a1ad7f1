#include "branta/Search.hpp"

#include "branta/AlternateMutator.hpp"
#include "branta/BubbleMutator.hpp"
#include "branta/CoalesceMutator.hpp"
#include "branta/ErrorReporter.hpp"
#include "branta/Grammar.hpp"
#include "branta/Mutator.hpp"
#include "branta/RepeatMutator.hpp"
#include "branta/SeedBuilder.hpp"

#include "spdlog/spdlog.h"

namespace branta {

std::mt19937 seedRandom(uint64_t seed) {
    std::seed_seq sequence{static_cast<uint32_t>(seed & 0xffffffff), static_cast<uint32_t>(seed >> 32)};
    return std::mt19937(sequence);
}

Search::Search(std::vector<std::string> guides, std::vector<std::string> positives,
        std::vector<std::string> negatives, SearchOptions options, std::shared_ptr<ErrorReporter> errorReporter):
    m_guides(std::move(guides)),
    m_options(std::move(options)),
    m_errorReporter(errorReporter),
    m_scorer(std::move(positives), std::move(negatives), m_options.parseBudget),
    m_population(m_options.populationSize),
    m_random(seedRandom(m_options.seed)),
    m_generation(0),
    m_minimumScore(0.0),
    m_initialized(false) {
    m_mutators.emplace_back(std::make_unique<BubbleMutator>());
    m_mutators.emplace_back(std::make_unique<CoalesceMutator>());
    m_mutators.emplace_back(std::make_unique<AlternateMutator>());
    m_mutators.emplace_back(std::make_unique<RepeatMutator>());
}

Search::~Search() {}

bool Search::initialize() {
    if (m_initialized) { return true; }

    bool ok = true;
    if (m_options.populationSize == 0) {
        m_errorReporter->addError("Population size must be at least 1.");
        ok = false;
    }
    if (m_options.cascadeLengths.empty()) {
        m_errorReporter->addError("At least one mutation cascade length is required.");
        ok = false;
    }
    for (auto length : m_options.cascadeLengths) {
        if (length == 0) {
            m_errorReporter->addError("Mutation cascade lengths must be at least 1.");
            ok = false;
            break;
        }
    }
    if (m_options.maxAttemptsPerGeneration == 0) {
        m_errorReporter->addError("At least one mutation attempt per generation is required.");
        ok = false;
    }
    if (m_guides.empty()) {
        m_errorReporter->addError("At least one guide string is required to seed the search.");
        ok = false;
    }
    if (!ok) { return false; }

    SeedBuilder builder;
    auto seed = std::make_shared<const Grammar>(builder.build(m_guides));
    double score = m_scorer.score(*seed);
    m_generation = 0;
    m_population.insert(seed, m_generation, score);
    m_minimumScore = m_population.lowest().score;
    m_initialized = true;

    SPDLOG_INFO("Seeded search from {} guides, {} positives, {} negatives. Seed score {}.", m_guides.size(),
            m_scorer.positives().size(), m_scorer.negatives().size(), score);
    SPDLOG_DEBUG("Seed grammar:\n{}", seed->render());
    return true;
}

const Population::Entry* Search::selectParent() {
    if (m_population.empty()) { return nullptr; }
    std::uniform_int_distribution<size_t> distribution(0, m_population.size() - 1);
    return &m_population.at(distribution(m_random));
}

std::unique_ptr<Grammar> Search::proposeMutant(const Grammar& parent) {
    std::uniform_int_distribution<size_t> lengthDistribution(0, m_options.cascadeLengths.size() - 1);
    size_t cascadeLength = m_options.cascadeLengths[lengthDistribution(m_random)];
    std::uniform_int_distribution<size_t> mutatorDistribution(0, m_mutators.size() - 1);

    std::unique_ptr<Grammar> mutant;
    const Grammar* input = &parent;
    for (size_t i = 0; i < cascadeLength; ++i) {
        Mutator* mutator = m_mutators[mutatorDistribution(m_random)].get();
        auto next = mutator->mutate(*input, m_random);
        if (!next) {
            SPDLOG_DEBUG("{} mutation {} of {} failed with {}, discarding cascade.", mutator->name(), i + 1,
                    cascadeLength, mutationErrorName(mutator->error()));
            return nullptr;
        }
        mutant = std::move(next);
        input = mutant.get();
    }
    return mutant;
}

bool Search::tryAdmit(std::unique_ptr<Grammar> grammar, double score) {
    if (!grammar || !(score > m_minimumScore)) {
        return false;
    }

    minimize(*grammar);
    size_t evicted = m_population.insert(std::shared_ptr<const Grammar>(std::move(grammar)), m_generation, score);
    m_minimumScore = m_population.lowest().score;
    SPDLOG_DEBUG("Admitted grammar {} with score {}, evicted {}, minimum score now {}.", m_generation, score, evicted,
            m_minimumScore);
    return true;
}

bool Search::runGeneration() {
    if (!initialize()) { return false; }

    ++m_generation;
    for (size_t attempt = 0; attempt < m_options.maxAttemptsPerGeneration; ++attempt) {
        // Hold a reference to the parent grammar, the population may evict it during admission.
        auto parent = selectParent()->grammar;
        auto mutant = proposeMutant(*parent);
        if (!mutant) { continue; }
        double score = m_scorer.score(*mutant);
        return tryAdmit(std::move(mutant), score);
    }

    SPDLOG_WARN("Generation {} discarded {} mutation cascades, continuing without a candidate.", m_generation,
            m_options.maxAttemptsPerGeneration);
    return false;
}

bool Search::run() {
    if (!initialize()) { return false; }

    for (size_t i = 0; i < m_options.generations; ++i) {
        if (m_options.stopWhenGoodEnough && Scorer::isGoodEnough(best().score)) {
            SPDLOG_INFO("Best score {} is good enough, stopping after {} generations.", best().score, i);
            break;
        }
        runGeneration();
        SPDLOG_INFO("Generation {}: best score {}, minimum score {}.", m_generation, best().score, m_minimumScore);
    }

    SPDLOG_INFO("Search finished after {} generations with best score {}.", m_generation, best().score);
    return true;
}

} // namespace branta
