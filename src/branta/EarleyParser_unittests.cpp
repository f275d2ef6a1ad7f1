#include "branta/EarleyParser.hpp"

#include "branta/ErrorReporter.hpp"
#include "branta/Grammar.hpp"
#include "branta/GrammarTestFixture.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace branta {

TEST_CASE_FIXTURE(GrammarTestFixture, "EarleyParser recognition") {
    SUBCASE("single terminal") {
        auto grammar = readGrammar("start: a\na: \"x\"\n");
        EarleyParser parser(m_errorReporter);
        REQUIRE(parser.compile(*grammar));
        CHECK(parser.accepts("x"));
        CHECK(!parser.accepts(""));
        CHECK(!parser.accepts("xx"));
        CHECK(!parser.accepts("y"));
    }
    SUBCASE("alternatives and sequence") {
        auto grammar = readGrammar("start: s\ns: a b | b a\na: \"a\"\nb: \"b\"\n");
        EarleyParser parser(m_errorReporter);
        REQUIRE(parser.compile(*grammar));
        CHECK(parser.accepts("ab"));
        CHECK(parser.accepts("ba"));
        CHECK(!parser.accepts("aa"));
        CHECK(!parser.accepts("aba"));
    }
    SUBCASE("right recursion") {
        auto grammar = readGrammar("start: r\nr: \"a\" | \"a\" r\n");
        EarleyParser parser(m_errorReporter);
        REQUIRE(parser.compile(*grammar));
        CHECK(!parser.accepts(""));
        CHECK(parser.accepts("a"));
        CHECK(parser.accepts("aaaaaaaaaaaaaaaa"));
        CHECK(!parser.accepts("aaab"));
    }
    SUBCASE("left recursion") {
        auto grammar = readGrammar("start: e\ne: e \"+\" n | n\nn: \"1\" | \"2\"\n");
        EarleyParser parser(m_errorReporter);
        REQUIRE(parser.compile(*grammar));
        CHECK(parser.accepts("1"));
        CHECK(parser.accepts("1+2+1"));
        CHECK(!parser.accepts("1+"));
        CHECK(!parser.accepts("+1"));
    }
    SUBCASE("nullable rules") {
        auto grammar = readGrammar("start: s\ns: o \"x\" o\no: \"\" | \"y\"\n");
        EarleyParser parser(m_errorReporter);
        REQUIRE(parser.compile(*grammar));
        CHECK(parser.accepts("x"));
        CHECK(parser.accepts("yx"));
        CHECK(parser.accepts("xy"));
        CHECK(parser.accepts("yxy"));
        CHECK(!parser.accepts("yy"));
    }
    SUBCASE("chain of nullable rules") {
        auto grammar = readGrammar("start: a\na: b c\nb: c\nc: \"\"\n");
        EarleyParser parser(m_errorReporter);
        REQUIRE(parser.compile(*grammar));
        CHECK(parser.accepts(""));
        CHECK(!parser.accepts("c"));
    }
    SUBCASE("multi character terminals") {
        auto grammar = readGrammar("start: s\ns: \"ab\" \"c\" | \"abc\" \"d\"\n");
        EarleyParser parser(m_errorReporter);
        REQUIRE(parser.compile(*grammar));
        CHECK(parser.accepts("abc"));
        CHECK(parser.accepts("abcd"));
        CHECK(!parser.accepts("ab"));
    }
    SUBCASE("rule without bodies matches nothing") {
        auto grammar = readGrammar("start: s\ns: \"a\" | t\nt:\nu: \"q\"\n");
        EarleyParser parser(m_errorReporter);
        REQUIRE(parser.compile(*grammar));
        CHECK(parser.accepts("a"));
        CHECK(!parser.accepts(""));
        CHECK(!parser.accepts("q"));
    }
    CHECK(m_errorReporter->ok());
}

TEST_CASE("EarleyParser failures") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);

    SUBCASE("undefined nonterminal") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t0").addBody({Symbol::nonterminal("t1")}));
        EarleyParser parser(errorReporter);
        CHECK(!parser.compile(grammar));
        CHECK(!errorReporter->ok());
        CHECK(parser.parse("") == EarleyParser::Result::kRejected);
    }
    SUBCASE("missing entry rule") {
        Grammar grammar("t0");
        EarleyParser parser(errorReporter);
        CHECK(!parser.compile(grammar));
    }
    SUBCASE("empty terminal") {
        Grammar grammar("t0");
        grammar.addOrReplaceRule(Rule("t0").addBody({Symbol::terminal("")}));
        EarleyParser parser(errorReporter);
        CHECK(!parser.compile(grammar));
    }
    SUBCASE("uncompiled parser rejects") {
        EarleyParser parser(errorReporter);
        CHECK(parser.parse("a") == EarleyParser::Result::kRejected);
    }
    SUBCASE("malformed rendering") {
        EarleyParser parser(errorReporter);
        REQUIRE(parser.compile(std::string_view("start: a\na: \"a\"\n")));
        REQUIRE(parser.accepts("a"));
        CHECK(!parser.compile(std::string_view("start: \"unterminated\n")));
        CHECK(parser.parse("a") == EarleyParser::Result::kRejected);
    }
    SUBCASE("budget exceeded") {
        Grammar grammar("s");
        grammar.addOrReplaceRule(Rule("s")
                .addBody({Symbol::nonterminal("s"), Symbol::nonterminal("s")})
                .addBody({Symbol::terminal("a")}));
        EarleyParser parser(errorReporter);
        REQUIRE(parser.compile(grammar));
        CHECK(parser.parse("aaaaaaaaaaaa", 20) == EarleyParser::Result::kBudgetExceeded);
        CHECK(parser.parse("aaaaaaaaaaaa") == EarleyParser::Result::kAccepted);
    }
}

TEST_CASE("EarleyParser compiles renderings") {
    auto errorReporter = std::make_shared<ErrorReporter>();
    EarleyParser parser(errorReporter);
    REQUIRE(parser.compile(std::string_view("start: t0\nt1: \"a\"\nt2: \"b\"\nt0: t1 t2\n  | t2 t1\n")));
    CHECK(parser.accepts("ab"));
    CHECK(parser.accepts("ba"));
    CHECK(!parser.accepts("aa"));
    CHECK(errorReporter->ok());
}

} // namespace branta
