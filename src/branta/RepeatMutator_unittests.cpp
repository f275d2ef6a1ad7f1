#include "branta/RepeatMutator.hpp"

#include "branta/GrammarTestFixture.hpp"
#include "branta/SeedBuilder.hpp"

#include "doctest/doctest.h"

#include <random>

namespace branta {

TEST_CASE_FIXTURE(GrammarTestFixture, "RepeatMutator") {
    SeedBuilder builder;
    RepeatMutator repeat;

    SUBCASE("repeats single symbol body") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t1").addBody({Symbol::terminal("a")}));
        grammar.addOrReplaceRule(Rule("t0").addBody({Symbol::nonterminal("t1")}));
        const std::string before = grammar.render();

        auto mutant = repeat.apply(grammar, Site{"t0", 0, 0});
        REQUIRE(mutant);
        CHECK(repeat.error() == MutationError::kNone);
        const std::string repeater = mutant->rules().back().name;
        CHECK(!grammar.hasRule(repeater));

        const Rule* rule = mutant->findRule(repeater);
        REQUIRE(rule);
        REQUIRE(rule->bodies.size() == 2);
        CHECK(rule->bodies[0] == Body{Symbol::nonterminal("t1")});
        CHECK(rule->bodies[1] == Body{Symbol::nonterminal("t1"), Symbol::nonterminal(repeater)});
        CHECK(mutant->findRule("t0")->bodies[0] == Body{Symbol::nonterminal(repeater)});

        CHECK(accepts(*mutant, "a"));
        CHECK(accepts(*mutant, "aa"));
        CHECK(accepts(*mutant, "aaaaa"));
        CHECK(!accepts(*mutant, ""));
        CHECK(grammar.render() == before);
    }
    SUBCASE("other bodies unchanged") {
        Grammar grammar = builder.build({"ab", "ba"});
        auto mutant = repeat.apply(grammar, Site{"t0", 1, 0});
        REQUIRE(mutant);
        const Rule* entry = mutant->findRule("t0");
        REQUIRE(entry);
        CHECK(entry->bodies[0] == grammar.findRule("t0")->bodies[0]);
        CHECK(accepts(*mutant, "ab"));
        CHECK(accepts(*mutant, "ba"));
        CHECK(accepts(*mutant, "bbba"));
        CHECK(!accepts(*mutant, "aab"));
    }
    SUBCASE("invalid site") {
        Grammar grammar = builder.build({"ab"});
        CHECK(!repeat.apply(grammar, Site{"t0", 1, 0}));
        CHECK(repeat.error() == MutationError::kInvalidSite);
    }
    SUBCASE("no bodies") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t0"));
        std::mt19937 random(5);
        CHECK(!repeat.mutate(grammar, random));
        CHECK(repeat.error() == MutationError::kNoBodies);
    }
    SUBCASE("site weighting favors rules with more bodies") {
        // t0 has 9 bodies and t1 one, so about 90% of draws should land in t0.
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t1").addBody({Symbol::terminal("a")}));
        Rule entry("t0");
        for (int i = 0; i < 9; ++i) {
            entry.addBody({Symbol::nonterminal("t1")});
        }
        grammar.addOrReplaceRule(std::move(entry));

        std::mt19937 random(11);
        int inEntry = 0;
        for (int i = 0; i < 1000; ++i) {
            Site site;
            REQUIRE(repeat.chooseSite(grammar, random, site));
            CHECK(site.nonterminal != "start");
            if (site.nonterminal == "t0") { ++inEntry; }
        }
        CHECK(inEntry > 820);
        CHECK(inEntry < 970);
    }
    SUBCASE("enlarges language") {
        Grammar grammar = builder.build({"abc", "acb", "bca", "aab"});
        auto strings = allStrings("abc", 4);
        auto language = accepted(grammar, strings);
        for (uint32_t seed = 0; seed < 10; ++seed) {
            std::mt19937 random(seed);
            Grammar current = grammar.clone();
            for (int i = 0; i < 4; ++i) {
                auto mutant = repeat.mutate(current, random);
                REQUIRE(mutant);
                current = *mutant;
            }
            CHECK(isSubset(language, accepted(current, strings)));
        }
    }
}

} // namespace branta
