#include "branta/Mutator.hpp"

#include <vector>

namespace branta {

const char* mutationErrorName(MutationError error) {
    switch (error) {
    case MutationError::kNone:
        return "None";
    case MutationError::kInsufficientNonterminals:
        return "InsufficientNonterminals";
    case MutationError::kNoBodies:
        return "NoBodies";
    case MutationError::kEmptyBody:
        return "EmptyBody";
    case MutationError::kNoAlternateSymbol:
        return "NoAlternateSymbol";
    case MutationError::kInvalidSite:
        return "InvalidSite";
    }
    return "Unknown";
}

bool Mutator::chooseSite(const Grammar& grammar, std::mt19937& random, Site& site) {
    auto nonterminals = grammar.nonterminals();
    std::vector<double> weights;
    weights.reserve(nonterminals.size());
    size_t totalBodies = 0;
    for (const auto& name : nonterminals) {
        size_t bodies = grammar.findRule(name)->bodies.size();
        totalBodies += bodies;
        weights.emplace_back(static_cast<double>(bodies));
    }
    if (totalBodies == 0) {
        m_error = MutationError::kNoBodies;
        return false;
    }

    std::discrete_distribution<size_t> ruleDistribution(weights.begin(), weights.end());
    site.nonterminal = nonterminals[ruleDistribution(random)];
    const Rule* rule = grammar.findRule(site.nonterminal);
    std::uniform_int_distribution<size_t> bodyDistribution(0, rule->bodies.size() - 1);
    site.body = bodyDistribution(random);

    const Body& body = rule->bodies[site.body];
    if (body.empty()) {
        m_error = MutationError::kEmptyBody;
        return false;
    }
    std::uniform_int_distribution<size_t> positionDistribution(0, body.size() - 1);
    site.position = positionDistribution(random);
    return true;
}

std::unique_ptr<Grammar> Mutator::fail(MutationError error) {
    m_error = error;
    return nullptr;
}

const Body* Mutator::findSiteBody(const Grammar& grammar, const Site& site) {
    const Rule* rule = grammar.findRule(site.nonterminal);
    if (!rule || site.body >= rule->bodies.size()) {
        return nullptr;
    }
    const Body& body = rule->bodies[site.body];
    if (site.position >= body.size()) {
        return nullptr;
    }
    return &body;
}

void minimize(Grammar& /* grammar */) {}

} // namespace branta
