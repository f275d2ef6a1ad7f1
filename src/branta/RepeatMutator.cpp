#include "branta/RepeatMutator.hpp"

#include "spdlog/spdlog.h"

namespace branta {

std::unique_ptr<Grammar> RepeatMutator::mutate(const Grammar& grammar, std::mt19937& random) {
    m_error = MutationError::kNone;
    Site site;
    if (!chooseSite(grammar, random, site)) {
        return nullptr;
    }
    return apply(grammar, site);
}

std::unique_ptr<Grammar> RepeatMutator::apply(const Grammar& grammar, const Site& site) {
    m_error = MutationError::kNone;
    const Body* body = findSiteBody(grammar, site);
    if (!body) {
        return fail(MutationError::kInvalidSite);
    }

    const Symbol repeated = (*body)[site.position];
    Symbol repeater = Symbol::nonterminal(grammar.freshNonterminal());

    Rule rule(*grammar.findRule(site.nonterminal));
    rule.bodies[site.body][site.position] = repeater;
    auto mutant = std::make_unique<Grammar>(grammar.clone());
    mutant->addOrReplaceRule(std::move(rule));
    mutant->addOrReplaceRule(Rule(repeater.text).addBody({repeated}).addBody({repeated, repeater}));

    SPDLOG_DEBUG("Repeated {} in {} body {} as {}", repeated.toString(), site.nonterminal, site.body, repeater.text);
    return mutant;
}

} // namespace branta
