#ifndef SRC_BRANTA_COALESCE_MUTATOR_HPP_
#define SRC_BRANTA_COALESCE_MUTATOR_HPP_

#include "branta/Mutator.hpp"

#include <string>
#include <vector>

namespace branta {

// Merging refactor. Samples between 2 and 5 nonterminals other than the start rule and replaces every reference to
// any of them with one fresh nonterminal, whose bodies are all of the sampled rules' bodies concatenated. Every string
// the input accepts is still accepted, and sites that named different merged rules become interchangeable.
class CoalesceMutator : public Mutator {
public:
    static constexpr size_t kMinimumMerge = 2;
    static constexpr size_t kMaximumMerge = 5;

    CoalesceMutator() = default;
    ~CoalesceMutator() override = default;

    std::unique_ptr<Grammar> mutate(const Grammar& grammar, std::mt19937& random) override;
    std::string_view name() const override { return "Coalesce"; }

    std::unique_ptr<Grammar> apply(const Grammar& grammar, const std::vector<std::string>& names);
};

} // namespace branta

#endif // SRC_BRANTA_COALESCE_MUTATOR_HPP_
