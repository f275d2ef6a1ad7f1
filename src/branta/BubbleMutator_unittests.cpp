#include "branta/BubbleMutator.hpp"

#include "branta/GrammarTestFixture.hpp"
#include "branta/SeedBuilder.hpp"

#include "doctest/doctest.h"

#include <random>

namespace branta {

TEST_CASE_FIXTURE(GrammarTestFixture, "BubbleMutator") {
    SeedBuilder builder;
    BubbleMutator bubble;

    SUBCASE("candidate sequences") {
        Grammar grammar = builder.build({"ab", "ac"});
        auto candidates = BubbleMutator::candidateSequences(grammar);
        REQUIRE(candidates.size() == 3);
        CHECK(candidates[0] == Body{Symbol::nonterminal("t1")});
        CHECK(candidates[1] == Body{Symbol::nonterminal("t2")});
        CHECK(candidates[2] == Body{Symbol::nonterminal("t3")});
    }
    SUBCASE("candidates exclude whole bodies") {
        Grammar grammar = builder.build({"abc"});
        auto candidates = BubbleMutator::candidateSequences(grammar);
        // t1, t2, t3, t1 t2, t2 t3.
        CHECK(candidates.size() == 5);
        for (const auto& candidate : candidates) {
            CHECK(candidate.size() < 3);
            CHECK(!candidate.empty());
        }
    }
    SUBCASE("nothing to extract copies unchanged") {
        Grammar grammar = builder.build({"a"});
        std::mt19937 random(1);
        auto mutant = bubble.mutate(grammar, random);
        REQUIRE(mutant);
        CHECK(bubble.error() == MutationError::kNone);
        CHECK(mutant->render() == grammar.render());
    }
    SUBCASE("extracts sequence") {
        Grammar grammar = builder.build({"ab", "ac"});
        const std::string before = grammar.render();
        auto mutant = bubble.apply(grammar, Body{Symbol::nonterminal("t1")});
        REQUIRE(mutant);
        CHECK(mutant->render() ==
              "start: t0\n"
              "t1: \"a\"\n"
              "t2: \"b\"\n"
              "t3: \"c\"\n"
              "t0: t5 t2\n"
              "  | t5 t3\n"
              "t5: t1\n");
        CHECK(grammar.render() == before);
    }
    SUBCASE("replaces only first occurrence per body") {
        Grammar grammar = builder.build({"abab"});
        auto mutant = bubble.apply(grammar, Body{Symbol::nonterminal("t1"), Symbol::nonterminal("t2")});
        REQUIRE(mutant);
        const Rule* entry = mutant->findRule("t0");
        REQUIRE(entry);
        std::string fresh = mutant->rules().back().name;
        CHECK(entry->bodies[0] ==
              Body{Symbol::nonterminal(fresh), Symbol::nonterminal("t1"), Symbol::nonterminal("t2")});
        CHECK(accepts(*mutant, "abab"));
    }
    SUBCASE("preserves language") {
        Grammar grammar = builder.build({"abc", "acb", "bca", "aab"});
        auto strings = allStrings("abc", 4);
        auto language = accepted(grammar, strings);
        for (uint32_t seed = 0; seed < 10; ++seed) {
            std::mt19937 random(seed);
            Grammar current = grammar.clone();
            for (int i = 0; i < 5; ++i) {
                auto mutant = bubble.mutate(current, random);
                REQUIRE(mutant);
                current = *mutant;
            }
            CHECK(accepted(current, strings) == language);
        }
    }
}

} // namespace branta
