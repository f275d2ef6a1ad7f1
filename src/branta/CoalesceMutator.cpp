#include "branta/CoalesceMutator.hpp"

#include "fmt/format.h"
#include "fmt/ranges.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace branta {

std::unique_ptr<Grammar> CoalesceMutator::mutate(const Grammar& grammar, std::mt19937& random) {
    m_error = MutationError::kNone;
    auto nonterminals = grammar.nonterminals();
    if (nonterminals.size() < kMinimumMerge) {
        return fail(MutationError::kInsufficientNonterminals);
    }

    std::uniform_int_distribution<size_t> countDistribution(kMinimumMerge,
            std::min(kMaximumMerge, nonterminals.size()));
    size_t count = countDistribution(random);
    std::vector<std::string> chosen;
    chosen.reserve(count);
    std::sample(nonterminals.begin(), nonterminals.end(), std::back_inserter(chosen), count, random);
    std::shuffle(chosen.begin(), chosen.end(), random);
    return apply(grammar, chosen);
}

std::unique_ptr<Grammar> CoalesceMutator::apply(const Grammar& grammar, const std::vector<std::string>& names) {
    m_error = MutationError::kNone;
    if (names.size() < kMinimumMerge) {
        return fail(MutationError::kInsufficientNonterminals);
    }

    std::unordered_set<std::string> merged(names.begin(), names.end());
    Symbol replacement = Symbol::nonterminal(grammar.freshNonterminal());
    auto mutant = std::make_unique<Grammar>(grammar.clone());
    for (const auto& rule : grammar.rules()) {
        Rule newRule(rule.name);
        for (const auto& body : rule.bodies) {
            Body newBody;
            newBody.reserve(body.size());
            for (const auto& symbol : body) {
                if (symbol.isNonterminal() && merged.count(symbol.text)) {
                    newBody.emplace_back(replacement);
                } else {
                    newBody.emplace_back(symbol);
                }
            }
            newRule.addBody(std::move(newBody));
        }
        mutant->addOrReplaceRule(std::move(newRule));
    }

    // The merged rule takes the original bodies, before any references were rewritten.
    Rule replacer(replacement.text);
    for (const auto& name : names) {
        const Rule* rule = grammar.findRule(name);
        if (!rule) { continue; }
        for (const auto& body : rule->bodies) {
            replacer.addBody(body);
        }
    }
    mutant->addOrReplaceRule(std::move(replacer));

    SPDLOG_DEBUG("Coalesced [{}] -> {}", fmt::join(names, ", "), replacement.text);
    return mutant;
}

} // namespace branta
