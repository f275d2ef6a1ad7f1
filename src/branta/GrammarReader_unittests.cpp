#include "branta/GrammarReader.hpp"

#include "branta/ErrorReporter.hpp"
#include "branta/SeedBuilder.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>

namespace branta {

TEST_CASE("GrammarReader valid input") {
    auto errorReporter = std::make_shared<ErrorReporter>();

    SUBCASE("reads back a rendering") {
        SeedBuilder builder;
        Grammar seed = builder.build({"ab", "ac", "cab"});
        GrammarReader reader(seed.render(), errorReporter);
        auto grammar = reader.read();
        REQUIRE(grammar);
        CHECK(grammar->render() == seed.render());
        CHECK(grammar->entry() == "t0");
    }
    SUBCASE("alternatives on one line") {
        GrammarReader reader("start: expr\nexpr: term \"+\" expr | term\nterm: \"1\" | \"2\"\n", errorReporter);
        auto grammar = reader.read();
        REQUIRE(grammar);
        REQUIRE(grammar->rules().size() == 3);
        const Rule* expr = grammar->findRule("expr");
        REQUIRE(expr);
        REQUIRE(expr->bodies.size() == 2);
        REQUIRE(expr->bodies[0].size() == 3);
        CHECK(expr->bodies[0][0] == Symbol::nonterminal("term"));
        CHECK(expr->bodies[0][1] == Symbol::terminal("+"));
        CHECK(expr->bodies[0][2] == Symbol::nonterminal("expr"));
        CHECK(expr->bodies[1].size() == 1);
    }
    SUBCASE("empty body and rule without bodies") {
        GrammarReader reader("start: a\na: \"\" | b\nb:\n", errorReporter);
        auto grammar = reader.read();
        REQUIRE(grammar);
        const Rule* a = grammar->findRule("a");
        REQUIRE(a);
        REQUIRE(a->bodies.size() == 2);
        CHECK(a->bodies[0].empty());
        const Rule* b = grammar->findRule("b");
        REQUIRE(b);
        CHECK(b->bodies.empty());
    }
    SUBCASE("escapes") {
        GrammarReader reader("start: a\na: \"\\\"\" \"\\\\\" \"\\n\\t\\r\" \"\\x41\"\n", errorReporter);
        auto grammar = reader.read();
        REQUIRE(grammar);
        const Rule* a = grammar->findRule("a");
        REQUIRE(a);
        REQUIRE(a->bodies.size() == 1);
        REQUIRE(a->bodies[0].size() == 4);
        CHECK(a->bodies[0][0].text == "\"");
        CHECK(a->bodies[0][1].text == "\\");
        CHECK(a->bodies[0][2].text == "\n\t\r");
        CHECK(a->bodies[0][3].text == "A");
    }
    SUBCASE("comments") {
        GrammarReader reader("// leading comment\nstart: a // trailing\na: \"x\"\n", errorReporter);
        auto grammar = reader.read();
        REQUIRE(grammar);
        CHECK(grammar->rules().size() == 2);
    }
    SUBCASE("start need not come first") {
        GrammarReader reader("a: \"x\"\nstart: a\n", errorReporter);
        auto grammar = reader.read();
        REQUIRE(grammar);
        CHECK(grammar->rules()[0].name == "start");
        CHECK(grammar->entry() == "a");
    }
    CHECK(errorReporter->ok());
}

TEST_CASE("GrammarReader errors") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);

    SUBCASE("missing start rule") {
        GrammarReader reader("a: \"x\"\n", errorReporter);
        CHECK(!reader.read());
        CHECK(errorReporter->errorCount() == 1);
    }
    SUBCASE("start rule with terminal") {
        GrammarReader reader("start: \"x\"\n", errorReporter);
        CHECK(!reader.read());
        CHECK(!errorReporter->ok());
    }
    SUBCASE("start rule with two bodies") {
        GrammarReader reader("start: a | b\na: \"x\"\nb: \"y\"\n", errorReporter);
        CHECK(!reader.read());
        CHECK(!errorReporter->ok());
    }
    SUBCASE("duplicate rule") {
        GrammarReader reader("start: a\na: \"x\"\na: \"y\"\n", errorReporter);
        CHECK(!reader.read());
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->errors()[0].find("line 3") != std::string::npos);
    }
    SUBCASE("unterminated string") {
        GrammarReader reader("start: a\na: \"x\nb: \"y\"\n", errorReporter);
        CHECK(!reader.read());
        REQUIRE(errorReporter->errorCount() >= 1);
        CHECK(errorReporter->errors()[0].find("line 2") != std::string::npos);
    }
    SUBCASE("unknown escape") {
        GrammarReader reader("start: a\na: \"\\q\"\n", errorReporter);
        CHECK(!reader.read());
        CHECK(!errorReporter->ok());
    }
    SUBCASE("bad hex escape") {
        GrammarReader reader("start: a\na: \"\\xZZ\"\n", errorReporter);
        CHECK(!reader.read());
        CHECK(!errorReporter->ok());
    }
    SUBCASE("symbols before any rule") {
        GrammarReader reader("\"x\" start: a\na: \"x\"\n", errorReporter);
        CHECK(!reader.read());
        CHECK(!errorReporter->ok());
    }
    SUBCASE("unexpected character") {
        GrammarReader reader("start: a\na: \"x\" ; \n", errorReporter);
        CHECK(!reader.read());
        CHECK(!errorReporter->ok());
    }
    SUBCASE("stray colon") {
        GrammarReader reader("start: a\na: \"x\" : \"y\"\n", errorReporter);
        CHECK(!reader.read());
        CHECK(!errorReporter->ok());
    }
}

} // namespace branta
