#ifndef SRC_BRANTA_ALTERNATE_MUTATOR_HPP_
#define SRC_BRANTA_ALTERNATE_MUTATOR_HPP_

#include "branta/Mutator.hpp"

namespace branta {

// Generalization by substitution. Draws a site, then appends to that rule a copy of the site's body with the symbol at
// the site replaced by a different symbol from the grammar's alphabet. The original body stays, so the language can
// only grow.
class AlternateMutator : public Mutator {
public:
    AlternateMutator() = default;
    ~AlternateMutator() override = default;

    std::unique_ptr<Grammar> mutate(const Grammar& grammar, std::mt19937& random) override;
    std::string_view name() const override { return "Alternate"; }

    std::unique_ptr<Grammar> apply(const Grammar& grammar, const Site& site, const Symbol& replacement);
};

} // namespace branta

#endif // SRC_BRANTA_ALTERNATE_MUTATOR_HPP_
