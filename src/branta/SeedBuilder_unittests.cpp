#include "branta/SeedBuilder.hpp"

#include "branta/GrammarTestFixture.hpp"

#include "doctest/doctest.h"

namespace branta {

TEST_CASE_FIXTURE(GrammarTestFixture, "SeedBuilder") {
    SeedBuilder builder;

    SUBCASE("structure") {
        Grammar grammar = builder.build({"ab", "ac"});
        CHECK(grammar.entry() == "t0");
        REQUIRE(grammar.rules().size() == 5);
        for (const char* leaf : {"t1", "t2", "t3"}) {
            const Rule* rule = grammar.findRule(leaf);
            REQUIRE(rule);
            REQUIRE(rule->bodies.size() == 1);
            REQUIRE(rule->bodies[0].size() == 1);
            CHECK(rule->bodies[0][0].isTerminal());
        }
        const Rule* entry = grammar.findRule("t0");
        REQUIRE(entry);
        REQUIRE(entry->bodies.size() == 2);
        CHECK(entry->bodies[0] == Body{Symbol::nonterminal("t1"), Symbol::nonterminal("t2")});
        CHECK(entry->bodies[1] == Body{Symbol::nonterminal("t1"), Symbol::nonterminal("t3")});
    }
    SUBCASE("accepts exactly the guides") {
        Grammar grammar = builder.build({"ab", "ac"});
        CHECK(accepts(grammar, "ab"));
        CHECK(accepts(grammar, "ac"));
        CHECK(!accepts(grammar, "ba"));
        CHECK(!accepts(grammar, "abc"));
        CHECK(!accepts(grammar, "a"));
        CHECK(!accepts(grammar, ""));
        CHECK(!accepts(grammar, "ad"));

        auto language = accepted(grammar, allStrings("abc", 4));
        CHECK(language == std::set<std::string>{"ab", "ac"});
    }
    SUBCASE("repeated characters share a leaf") {
        Grammar grammar = builder.build({"aaa"});
        CHECK(grammar.rules().size() == 3);
        CHECK(accepts(grammar, "aaa"));
        CHECK(!accepts(grammar, "aa"));
    }
    SUBCASE("empty guide") {
        Grammar grammar = builder.build({"", "x"});
        CHECK(accepts(grammar, ""));
        CHECK(accepts(grammar, "x"));
        CHECK(!accepts(grammar, "xx"));
    }
    SUBCASE("multi-byte characters make one leaf") {
        Grammar grammar = builder.build({"\xC3\xA9"});
        REQUIRE(grammar.rules().size() == 3);
        const Rule* leaf = grammar.findRule("t1");
        REQUIRE(leaf);
        CHECK(leaf->bodies[0][0] == Symbol::terminal("\xC3\xA9"));
        CHECK(grammar.findRule("t0")->bodies[0] == Body{Symbol::nonterminal("t1")});
        CHECK(accepts(grammar, "\xC3\xA9"));
        CHECK(!accepts(grammar, "\xC3"));
    }
    SUBCASE("mixed width characters share leaves") {
        // "a", U+20AC and U+1F600 are one, three and four bytes long.
        Grammar grammar = builder.build({"a\xE2\x82\xAC\xF0\x9F\x98\x80", "\xE2\x82\xAC" "a"});
        REQUIRE(grammar.rules().size() == 5);
        CHECK(grammar.findRule("t2")->bodies[0][0].text == "\xE2\x82\xAC");
        CHECK(grammar.findRule("t3")->bodies[0][0].text == "\xF0\x9F\x98\x80");
        CHECK(grammar.findRule("t0")->bodies[1] == Body{Symbol::nonterminal("t2"), Symbol::nonterminal("t1")});
    }
    SUBCASE("invalid UTF-8 falls back to bytes") {
        // A lead byte followed by a non-continuation byte, and a lone continuation byte.
        Grammar grammar = builder.build({"\xC3" "a\xA9"});
        REQUIRE(grammar.rules().size() == 5);
        CHECK(grammar.findRule("t1")->bodies[0][0].text == "\xC3");
        CHECK(grammar.findRule("t3")->bodies[0][0].text == "\xA9");
        CHECK(accepts(grammar, "\xC3" "a\xA9"));
    }
    SUBCASE("special characters") {
        Grammar grammar = builder.build({"\"\\\n"});
        CHECK(accepts(grammar, "\"\\\n"));
        auto reread = readGrammar(grammar.render());
        CHECK(reread->render() == grammar.render());
    }
}

} // namespace branta
