#include "branta/Scorer.hpp"

#include "branta/Grammar.hpp"
#include "branta/SeedBuilder.hpp"

#include "doctest/doctest.h"
#include "spdlog/sinks/ostream_sink.h"
#include "spdlog/spdlog.h"

#include <memory>
#include <sstream>

namespace branta {

TEST_CASE("Scorer scores") {
    SeedBuilder builder;
    Grammar grammar = builder.build({"ab", "ac"});

    SUBCASE("perfect") {
        Scorer scorer({"ab", "ac"}, {"ba"});
        double score = scorer.score(grammar);
        CHECK(score == doctest::Approx(1.0));
        CHECK(Scorer::isGoodEnough(score));
    }
    SUBCASE("partial") {
        Scorer scorer({"ab", "zz"}, {"ba", "ac"});
        CHECK(scorer.score(grammar) == doctest::Approx(0.25));
        CHECK(!Scorer::isGoodEnough(scorer.score(grammar)));
    }
    SUBCASE("floored when nothing right") {
        Scorer scorer({"x", "y", "z", "w"}, {"ab", "ac"});
        // max(0, 0.5 / 4) * max(0, 0.5 / 2)
        CHECK(scorer.score(grammar) == doctest::Approx(0.125 * 0.25));
        CHECK(scorer.score(grammar) > 0.0);
    }
    SUBCASE("grammar that fails to compile matches nothing") {
        Grammar broken("t0");
        broken.addOrReplaceRule(Rule("t0").addBody({Symbol::nonterminal("missing")}));
        Scorer scorer({"ab", "ac"}, {"ba", "ca"});
        CHECK(scorer.score(broken) == doctest::Approx(0.25));
    }
    SUBCASE("empty example sets count as satisfied") {
        Scorer noNegatives({"ab"}, {});
        CHECK(noNegatives.score(grammar) == doctest::Approx(1.0));
        Scorer noPositives({}, {"ab"});
        CHECK(noPositives.score(grammar) == doctest::Approx(0.5));
    }
    SUBCASE("deterministic and cached") {
        Scorer scorer({"ab", "b"}, {"ac"});
        double first = scorer.score(grammar);
        CHECK(scorer.score(grammar) == first);
        Grammar copy = grammar.clone();
        CHECK(scorer.score(copy) == first);
    }
    SUBCASE("cache follows grammar changes") {
        Scorer scorer({"ab", "b"}, {});
        Grammar copy = grammar.clone();
        CHECK(scorer.score(copy) == doctest::Approx(0.5));
        copy.addBody("t0", {Symbol::nonterminal("t2")});
        CHECK(scorer.score(copy) == doctest::Approx(1.0));
    }
    SUBCASE("budget exceeded counts as no match") {
        Grammar ambiguous("s");
        ambiguous.addOrReplaceRule(Rule("s")
                .addBody({Symbol::nonterminal("s"), Symbol::nonterminal("s")})
                .addBody({Symbol::terminal("a")}));
        Scorer scorer({"aaaaaaaaaa"}, {}, 5);
        CHECK(scorer.score(ambiguous) == doctest::Approx(0.5));
        Scorer generous({"aaaaaaaaaa"}, {});
        CHECK(generous.score(ambiguous) == doctest::Approx(1.0));
    }
}

TEST_CASE("Scorer traces each example") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto previousLogger = spdlog::default_logger();
    auto previousLevel = spdlog::get_level();
    auto logger = std::make_shared<spdlog::logger>("scorer_trace", sink);
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);

    SeedBuilder builder;
    Grammar grammar = builder.build({"ab"});
    Scorer scorer({"ab", "zz"}, {"ba"});
    double score = scorer.score(grammar);

    spdlog::set_default_logger(previousLogger);
    spdlog::drop("scorer_trace");
    spdlog::set_level(previousLevel);

    CHECK(score == doctest::Approx(0.5));
    std::string log = out.str();
    CHECK(log.find("Accepted example 'ab'") != std::string::npos);
    CHECK(log.find("Rejected example 'zz'") != std::string::npos);
    CHECK(log.find("Rejected example 'ba'") != std::string::npos);
}

TEST_CASE("Scorer good enough") {
    CHECK(Scorer::isGoodEnough(1.0));
    CHECK(!Scorer::isGoodEnough(0.999));
    CHECK(!Scorer::isGoodEnough(0.0));
}

} // namespace branta
