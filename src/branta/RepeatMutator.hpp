#ifndef SRC_BRANTA_REPEAT_MUTATOR_HPP_
#define SRC_BRANTA_REPEAT_MUTATOR_HPP_

#include "branta/Mutator.hpp"

namespace branta {

// Generalization by right recursion. Draws a site holding symbol x, adds a fresh rule R: x | x R, and puts R at the
// site. A single x is still derivable through R's first body, so the language can only grow.
class RepeatMutator : public Mutator {
public:
    RepeatMutator() = default;
    ~RepeatMutator() override = default;

    std::unique_ptr<Grammar> mutate(const Grammar& grammar, std::mt19937& random) override;
    std::string_view name() const override { return "Repeat"; }

    std::unique_ptr<Grammar> apply(const Grammar& grammar, const Site& site);
};

} // namespace branta

#endif // SRC_BRANTA_REPEAT_MUTATOR_HPP_
