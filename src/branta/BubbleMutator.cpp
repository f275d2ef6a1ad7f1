#include "branta/BubbleMutator.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <set>

namespace branta {

std::unique_ptr<Grammar> BubbleMutator::mutate(const Grammar& grammar, std::mt19937& random) {
    m_error = MutationError::kNone;
    auto candidates = candidateSequences(grammar);
    if (candidates.empty()) {
        return std::make_unique<Grammar>(grammar.clone());
    }
    std::uniform_int_distribution<size_t> distribution(0, candidates.size() - 1);
    return apply(grammar, candidates[distribution(random)]);
}

std::unique_ptr<Grammar> BubbleMutator::apply(const Grammar& grammar, const Body& sequence) {
    m_error = MutationError::kNone;
    auto mutant = std::make_unique<Grammar>(grammar.clone());
    if (sequence.empty()) {
        return mutant;
    }

    Symbol replacement = Symbol::nonterminal(grammar.freshNonterminal());
    for (const auto& rule : grammar.rules()) {
        Rule newRule(rule.name);
        for (const auto& body : rule.bodies) {
            Body newBody(body);
            auto match = std::search(newBody.begin(), newBody.end(), sequence.begin(), sequence.end());
            if (match != newBody.end()) {
                auto position = newBody.erase(match, match + sequence.size());
                newBody.insert(position, replacement);
            }
            newRule.addBody(std::move(newBody));
        }
        mutant->addOrReplaceRule(std::move(newRule));
    }
    mutant->addOrReplaceRule(Rule(replacement.text).addBody(sequence));

    SPDLOG_DEBUG("Bubble extracted {} -> {}", replacement.text, bodyToString(sequence));
    return mutant;
}

std::vector<Body> BubbleMutator::candidateSequences(const Grammar& grammar) {
    std::set<Body> sequences;
    for (const auto& rule : grammar.rules()) {
        for (const auto& body : rule.bodies) {
            for (size_t start = 0; start < body.size(); ++start) {
                for (size_t length = 1; start + length <= body.size(); ++length) {
                    if (length == body.size()) { continue; }
                    sequences.emplace(body.begin() + start, body.begin() + start + length);
                }
            }
        }
    }
    return std::vector<Body>(sequences.begin(), sequences.end());
}

} // namespace branta
