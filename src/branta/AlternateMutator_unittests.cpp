#include "branta/AlternateMutator.hpp"

#include "branta/GrammarTestFixture.hpp"
#include "branta/SeedBuilder.hpp"

#include "doctest/doctest.h"

#include <random>

namespace branta {

TEST_CASE_FIXTURE(GrammarTestFixture, "AlternateMutator") {
    SeedBuilder builder;
    AlternateMutator alternate;

    SUBCASE("appends alternative body") {
        Grammar grammar = builder.build({"ab"});
        const std::string before = grammar.render();
        auto mutant = alternate.apply(grammar, Site{"t0", 0, 1}, Symbol::nonterminal("t1"));
        REQUIRE(mutant);
        const Rule* entry = mutant->findRule("t0");
        REQUIRE(entry);
        REQUIRE(entry->bodies.size() == 2);
        CHECK(entry->bodies[0] == Body{Symbol::nonterminal("t1"), Symbol::nonterminal("t2")});
        CHECK(entry->bodies[1] == Body{Symbol::nonterminal("t1"), Symbol::nonterminal("t1")});
        CHECK(accepts(*mutant, "ab"));
        CHECK(accepts(*mutant, "aa"));
        CHECK(!accepts(*mutant, "bb"));
        CHECK(grammar.render() == before);
    }
    SUBCASE("terminal replacement") {
        Grammar grammar = builder.build({"ab"});
        auto mutant = alternate.apply(grammar, Site{"t2", 0, 0}, Symbol::terminal("a"));
        REQUIRE(mutant);
        CHECK(accepts(*mutant, "aa"));
        CHECK(accepts(*mutant, "ab"));
    }
    SUBCASE("invalid site") {
        Grammar grammar = builder.build({"ab"});
        CHECK(!alternate.apply(grammar, Site{"t0", 0, 2}, Symbol::terminal("a")));
        CHECK(alternate.error() == MutationError::kInvalidSite);
        CHECK(!alternate.apply(grammar, Site{"t7", 0, 0}, Symbol::terminal("a")));
        CHECK(alternate.error() == MutationError::kInvalidSite);
    }
    SUBCASE("no bodies") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t0"));
        std::mt19937 random(3);
        CHECK(!alternate.mutate(grammar, random));
        CHECK(alternate.error() == MutationError::kNoBodies);
    }
    SUBCASE("empty body") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t0").addBody({}));
        std::mt19937 random(3);
        CHECK(!alternate.mutate(grammar, random));
        CHECK(alternate.error() == MutationError::kEmptyBody);
    }
    SUBCASE("no other symbol") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t0").addBody({Symbol::nonterminal("t0")}));
        std::mt19937 random(3);
        CHECK(!alternate.mutate(grammar, random));
        CHECK(alternate.error() == MutationError::kNoAlternateSymbol);
    }
    SUBCASE("random draws add one body with one change") {
        Grammar grammar = builder.build({"abc", "cab"});
        for (uint32_t seed = 0; seed < 20; ++seed) {
            std::mt19937 random(seed);
            auto mutant = alternate.mutate(grammar, random);
            REQUIRE(mutant);
            CHECK(mutant->bodyCount() == grammar.bodyCount() + 1);
            CHECK(mutant->rules().size() == grammar.rules().size());

            // Find the rule that grew and compare its new body against the originals.
            for (const auto& rule : mutant->rules()) {
                const Rule* original = grammar.findRule(rule.name);
                REQUIRE(original);
                if (rule.bodies.size() == original->bodies.size()) { continue; }
                const Body& added = rule.bodies.back();
                bool matchesOneOriginal = false;
                for (const auto& body : original->bodies) {
                    if (body.size() != added.size()) { continue; }
                    size_t differences = 0;
                    for (size_t i = 0; i < body.size(); ++i) {
                        if (body[i] != added[i]) { ++differences; }
                    }
                    if (differences == 1) { matchesOneOriginal = true; }
                }
                CHECK(matchesOneOriginal);
            }
        }
    }
    SUBCASE("enlarges language") {
        Grammar grammar = builder.build({"abc", "acb", "bca", "aab"});
        auto strings = allStrings("abc", 4);
        auto language = accepted(grammar, strings);
        for (uint32_t seed = 0; seed < 10; ++seed) {
            std::mt19937 random(seed);
            Grammar current = grammar.clone();
            for (int i = 0; i < 4; ++i) {
                auto mutant = alternate.mutate(current, random);
                REQUIRE(mutant);
                current = *mutant;
            }
            CHECK(isSubset(language, accepted(current, strings)));
        }
    }
}

} // namespace branta
