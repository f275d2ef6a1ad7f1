#include "branta/AlternateMutator.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <vector>

namespace branta {

std::unique_ptr<Grammar> AlternateMutator::mutate(const Grammar& grammar, std::mt19937& random) {
    m_error = MutationError::kNone;
    Site site;
    if (!chooseSite(grammar, random, site)) {
        return nullptr;
    }

    const Symbol& current = grammar.findRule(site.nonterminal)->bodies[site.body][site.position];
    auto alternates = grammar.alphabet();
    alternates.erase(std::remove(alternates.begin(), alternates.end(), current), alternates.end());
    if (alternates.empty()) {
        return fail(MutationError::kNoAlternateSymbol);
    }
    std::uniform_int_distribution<size_t> distribution(0, alternates.size() - 1);
    return apply(grammar, site, alternates[distribution(random)]);
}

std::unique_ptr<Grammar> AlternateMutator::apply(const Grammar& grammar, const Site& site,
        const Symbol& replacement) {
    m_error = MutationError::kNone;
    const Body* body = findSiteBody(grammar, site);
    if (!body) {
        return fail(MutationError::kInvalidSite);
    }

    Body newBody(*body);
    newBody[site.position] = replacement;
    auto mutant = std::make_unique<Grammar>(grammar.clone());
    mutant->addBody(site.nonterminal, newBody);

    SPDLOG_DEBUG("Alternated {} body {} at {}: {} | {}", site.nonterminal, site.body, site.position,
            (*body)[site.position].toString(), replacement.toString());
    return mutant;
}

} // namespace branta
