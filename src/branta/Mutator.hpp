#ifndef SRC_BRANTA_MUTATOR_HPP_
#define SRC_BRANTA_MUTATOR_HPP_

#include "branta/Grammar.hpp"

#include <cstddef>
#include <memory>
#include <random>
#include <string>
#include <string_view>

namespace branta {

// Structural preconditions a mutation operator can find unmet. None of these are fatal, the search discards the
// attempt and draws again.
enum class MutationError {
    kNone,
    // Coalesce needs at least two nonterminals besides the start rule.
    kInsufficientNonterminals,
    // No nonterminal besides the start rule has any bodies to choose a site from.
    kNoBodies,
    // The chosen body has no positions.
    kEmptyBody,
    // Every symbol of the alphabet is the one already at the chosen position.
    kNoAlternateSymbol,
    // A directly specified site doesn't exist in the grammar.
    kInvalidSite
};

const char* mutationErrorName(MutationError error);

// A position within one body of a rule.
struct Site {
    std::string nonterminal;
    size_t body;
    size_t position;
};

// Base class for the structural transforms that produce a new candidate Grammar from an existing one. Operators never
// modify the Grammar they are given.
class Mutator {
public:
    Mutator(): m_error(MutationError::kNone) {}
    virtual ~Mutator() = default;

    // Returns a new Grammar, or nullptr with error() set if |grammar| lacks the structure this operator needs.
    virtual std::unique_ptr<Grammar> mutate(const Grammar& grammar, std::mt19937& random) = 0;
    virtual std::string_view name() const = 0;

    MutationError error() const { return m_error; }

    // Draws a site across every nonterminal but the start rule. Each nonterminal is weighted by its number of bodies,
    // then a body and a position within it are drawn uniformly. Returns false with error() set on failure.
    bool chooseSite(const Grammar& grammar, std::mt19937& random, Site& site);

protected:
    std::unique_ptr<Grammar> fail(MutationError error);
    // Returns the body |site| points into, or nullptr if |site| is out of range.
    static const Body* findSiteBody(const Grammar& grammar, const Site& site);

    MutationError m_error;
};

// Hook for simplifying a grammar before it joins the population. Intentionally leaves the grammar unchanged.
void minimize(Grammar& grammar);

} // namespace branta

#endif // SRC_BRANTA_MUTATOR_HPP_
