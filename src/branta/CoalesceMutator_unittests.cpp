#include "branta/CoalesceMutator.hpp"

#include "branta/GrammarTestFixture.hpp"
#include "branta/SeedBuilder.hpp"

#include "doctest/doctest.h"

#include <random>

namespace branta {

TEST_CASE_FIXTURE(GrammarTestFixture, "CoalesceMutator") {
    SeedBuilder builder;
    CoalesceMutator coalesce;

    SUBCASE("needs two nonterminals") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t0").addBody({Symbol::terminal("a")}));
        std::mt19937 random(1);
        CHECK(!coalesce.mutate(grammar, random));
        CHECK(coalesce.error() == MutationError::kInsufficientNonterminals);
        CHECK(!coalesce.apply(grammar, {"t0"}));
        CHECK(coalesce.error() == MutationError::kInsufficientNonterminals);
    }
    SUBCASE("merges named rules") {
        Grammar grammar = builder.build({"ab", "ac"});
        const std::string before = grammar.render();
        auto mutant = coalesce.apply(grammar, {"t2", "t3"});
        REQUIRE(mutant);
        CHECK(coalesce.error() == MutationError::kNone);
        CHECK(mutant->render() ==
              "start: t0\n"
              "t1: \"a\"\n"
              "t2: \"b\"\n"
              "t3: \"c\"\n"
              "t0: t1 t5\n"
              "  | t1 t5\n"
              "t5: \"b\"\n"
              "  | \"c\"\n");
        CHECK(grammar.render() == before);
        CHECK(accepts(*mutant, "ab"));
        CHECK(accepts(*mutant, "ac"));
        CHECK(!accepts(*mutant, "ba"));
    }
    SUBCASE("merging the entry rewrites start") {
        Grammar grammar = builder.build({"ab"});
        auto mutant = coalesce.apply(grammar, {"t0", "t1"});
        REQUIRE(mutant);
        CHECK(mutant->entry() != "t0");
        CHECK(accepts(*mutant, "ab"));
        CHECK(accepts(*mutant, "a"));
    }
    SUBCASE("merges between two and five rules") {
        Grammar grammar = builder.build({"abcdefg"});
        for (uint32_t seed = 0; seed < 20; ++seed) {
            std::mt19937 random(seed);
            auto mutant = coalesce.mutate(grammar, random);
            REQUIRE(mutant);
            // Every rule in the seed has exactly one body, so the merged rule has one body per merged rule.
            size_t merged = mutant->rules().back().bodies.size();
            CHECK(merged >= 2);
            CHECK(merged <= 5);
            CHECK(mutant->rules().size() == grammar.rules().size() + 1);
        }
    }
    SUBCASE("keeps every accepted string") {
        Grammar grammar = builder.build({"abc", "acb", "bca", "aab"});
        auto strings = allStrings("abc", 4);
        auto language = accepted(grammar, strings);
        for (uint32_t seed = 0; seed < 10; ++seed) {
            std::mt19937 random(seed);
            Grammar current = grammar.clone();
            for (int i = 0; i < 3; ++i) {
                auto mutant = coalesce.mutate(current, random);
                REQUIRE(mutant);
                current = *mutant;
            }
            CHECK(isSubset(language, accepted(current, strings)));
        }
    }
}

} // namespace branta
