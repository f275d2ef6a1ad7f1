#include "branta/Grammar.hpp"

#include "branta/SeedBuilder.hpp"

#include "doctest/doctest.h"

#include <string>
#include <vector>

namespace branta {

TEST_CASE("Grammar construction") {
    SUBCASE("start rule only") {
        Grammar grammar("t0");
        REQUIRE(grammar.rules().size() == 1);
        const Rule* start = grammar.findRule("start");
        REQUIRE(start);
        REQUIRE(start->bodies.size() == 1);
        REQUIRE(start->bodies[0].size() == 1);
        CHECK(start->bodies[0][0] == Symbol::nonterminal("t0"));
        CHECK(grammar.entry() == "t0");
        CHECK(grammar.nonterminals().empty());
    }
    SUBCASE("add rules preserves order") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t2").addBody({Symbol::terminal("b")}));
        grammar.addOrReplaceRule(Rule("t1").addBody({Symbol::terminal("a")}));
        grammar.addOrReplaceRule(Rule("t0").addBody({Symbol::nonterminal("t1"), Symbol::nonterminal("t2")}));
        REQUIRE(grammar.rules().size() == 4);
        CHECK(grammar.rules()[0].name == "start");
        CHECK(grammar.rules()[1].name == "t2");
        CHECK(grammar.rules()[2].name == "t1");
        CHECK(grammar.rules()[3].name == "t0");
        CHECK(grammar.nonterminals() == std::vector<std::string>{"t2", "t1", "t0"});
        CHECK(grammar.bodyCount() == 4);
    }
    SUBCASE("replace keeps position") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t1").addBody({Symbol::terminal("a")}));
        grammar.addOrReplaceRule(Rule("t0").addBody({Symbol::nonterminal("t1")}));
        grammar.addOrReplaceRule(Rule("t1").addBody({Symbol::terminal("x")}).addBody({Symbol::terminal("y")}));
        REQUIRE(grammar.rules().size() == 3);
        CHECK(grammar.rules()[1].name == "t1");
        CHECK(grammar.rules()[1].bodies.size() == 2);
        CHECK(grammar.rules()[1].bodies[0][0].text == "x");
    }
    SUBCASE("add body") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t0").addBody({Symbol::terminal("a")}));
        CHECK(grammar.addBody("t0", {Symbol::terminal("b")}));
        CHECK(!grammar.addBody("t9", {Symbol::terminal("b")}));
        CHECK(grammar.findRule("t0")->bodies.size() == 2);
        CHECK(grammar.findRule("t9") == nullptr);
    }
}

TEST_CASE("Grammar symbols") {
    SeedBuilder builder;
    Grammar grammar = builder.build({"ab", "ca"});

    SUBCASE("terminals in order of first appearance") {
        auto terminals = grammar.terminals();
        REQUIRE(terminals.size() == 3);
        CHECK(terminals[0] == Symbol::terminal("a"));
        CHECK(terminals[1] == Symbol::terminal("b"));
        CHECK(terminals[2] == Symbol::terminal("c"));
    }
    SUBCASE("alphabet excludes start") {
        auto alphabet = grammar.alphabet();
        REQUIRE(alphabet.size() == 7);
        CHECK(alphabet[3] == Symbol::nonterminal("t1"));
        CHECK(alphabet[6] == Symbol::nonterminal("t0"));
        for (const auto& symbol : alphabet) {
            CHECK(symbol.text != "start");
        }
    }
    SUBCASE("terminal and nonterminal with same text are distinct") {
        CHECK(Symbol::terminal("t1") != Symbol::nonterminal("t1"));
        CHECK(Symbol::terminal("t1") < Symbol::nonterminal("t1"));
    }
    SUBCASE("fresh nonterminal") {
        std::string fresh = grammar.freshNonterminal();
        CHECK(!grammar.hasRule(fresh));
        CHECK(fresh != "start");
        for (const auto& symbol : grammar.alphabet()) {
            CHECK(symbol.text != fresh);
        }
    }
    SUBCASE("fresh nonterminal skips dangling references") {
        Grammar dangling("t0");
        dangling.addOrReplaceRule(Rule("t0").addBody({Symbol::nonterminal("t2")}));
        CHECK(dangling.freshNonterminal() == "t3");
    }
}

TEST_CASE("Grammar render") {
    SUBCASE("seed grammar") {
        SeedBuilder builder;
        Grammar grammar = builder.build({"ab", "ac"});
        CHECK(grammar.render() ==
              "start: t0\n"
              "t1: \"a\"\n"
              "t2: \"b\"\n"
              "t3: \"c\"\n"
              "t0: t1 t2\n"
              "  | t1 t3\n");
    }
    SUBCASE("empty body and rule without bodies") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t0").addBody({}).addBody({Symbol::nonterminal("t1")}));
        grammar.addOrReplaceRule(Rule("t1"));
        CHECK(grammar.render() ==
              "start: t0\n"
              "t0: \"\"\n"
              "  | t1\n"
              "t1:\n");
    }
    SUBCASE("escaped terminals") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t0").addBody(
                {Symbol::terminal("\""), Symbol::terminal("\\"), Symbol::terminal("\n"), Symbol::terminal("\x01")}));
        CHECK(grammar.render() == "start: t0\nt0: \"\\\"\" \"\\\\\" \"\\n\" \"\\x01\"\n");
    }
    SUBCASE("memoized until changed") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t0").addBody({Symbol::terminal("a")}));
        const std::string first = grammar.render();
        Hash firstHash = grammar.hash();
        auto version = grammar.version();
        CHECK(grammar.render() == first);
        CHECK(grammar.version() == version);

        grammar.addBody("t0", {Symbol::terminal("b")});
        CHECK(grammar.version() > version);
        CHECK(grammar.render() != first);
        CHECK(grammar.hash() != firstHash);
    }
    SUBCASE("equal structure hashes equal") {
        SeedBuilder builder;
        Grammar a = builder.build({"ab", "ac"});
        Grammar b = builder.build({"ab", "ac"});
        CHECK(a.hash() == b.hash());
    }
}

TEST_CASE("Grammar clone") {
    SeedBuilder builder;
    Grammar original = builder.build({"ab"});
    const std::string rendering = original.render();

    Grammar copy = original.clone();
    CHECK(copy.render() == rendering);

    copy.addBody("t0", {Symbol::terminal("z")});
    copy.addOrReplaceRule(Rule("t1").addBody({Symbol::terminal("q")}));
    copy.addOrReplaceRule(Rule("t9"));
    CHECK(original.render() == rendering);
    CHECK(original.findRule("t0")->bodies.size() == 1);
    CHECK(original.findRule("t1")->bodies[0][0].text == "a");
    CHECK(!original.hasRule("t9"));
}

} // namespace branta
