#ifndef SRC_BRANTA_BUBBLE_MUTATOR_HPP_
#define SRC_BRANTA_BUBBLE_MUTATOR_HPP_

#include "branta/Mutator.hpp"

#include <vector>

namespace branta {

// Extraction refactor. Picks a proper subsequence of some body, moves it into a fresh rule, and replaces its first
// occurrence in every body with the fresh nonterminal. The language is unchanged.
class BubbleMutator : public Mutator {
public:
    BubbleMutator() = default;
    ~BubbleMutator() override = default;

    // Returns an unchanged copy when no body has a proper subsequence to extract.
    std::unique_ptr<Grammar> mutate(const Grammar& grammar, std::mt19937& random) override;
    std::string_view name() const override { return "Bubble"; }

    std::unique_ptr<Grammar> apply(const Grammar& grammar, const Body& sequence);

    // Every distinct contiguous, non-empty sequence shorter than the body it occurs in, in sorted order.
    static std::vector<Body> candidateSequences(const Grammar& grammar);
};

} // namespace branta

#endif // SRC_BRANTA_BUBBLE_MUTATOR_HPP_
