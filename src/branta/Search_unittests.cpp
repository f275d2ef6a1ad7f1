#include "branta/Search.hpp"

#include "branta/ErrorReporter.hpp"
#include "branta/Grammar.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace branta {

TEST_CASE("Search initialize") {
    auto errorReporter = std::make_shared<ErrorReporter>();

    SUBCASE("seeds population") {
        Search search({"ab"}, {"ab"}, {"ba"}, SearchOptions(), errorReporter);
        REQUIRE(search.initialize());
        CHECK(errorReporter->ok());
        REQUIRE(search.population().size() == 1);
        CHECK(search.best().id == 0);
        CHECK(search.best().score == doctest::Approx(1.0));
        CHECK(search.minimumScore() == doctest::Approx(1.0));
        CHECK(search.generation() == 0);
        CHECK(search.best().grammar->entry() == "t0");
    }
    SUBCASE("no parent before initialize") {
        Search search({"ab"}, {"ab"}, {}, SearchOptions(), errorReporter);
        CHECK(search.selectParent() == nullptr);
        REQUIRE(search.initialize());
        const Population::Entry* parent = search.selectParent();
        REQUIRE(parent);
        CHECK(parent->id == 0);
    }
    SUBCASE("empty guides") {
        Search search({}, {"ab"}, {}, SearchOptions(), errorReporter);
        CHECK(!search.initialize());
        CHECK(errorReporter->errorCount() == 1);
        CHECK(!search.run());
    }
    SUBCASE("invalid options") {
        SearchOptions options;
        options.populationSize = 0;
        options.cascadeLengths = {1, 0};
        Search search({"ab"}, {"ab"}, {}, options, errorReporter);
        CHECK(!search.initialize());
        CHECK(errorReporter->errorCount() == 2);
    }
    SUBCASE("no cascade lengths") {
        SearchOptions options;
        options.cascadeLengths.clear();
        Search search({"ab"}, {"ab"}, {}, options, errorReporter);
        CHECK(!search.initialize());
        CHECK(errorReporter->errorCount() == 1);
    }
}

TEST_CASE("Search run") {
    auto errorReporter = std::make_shared<ErrorReporter>();

    SUBCASE("runs every generation by default") {
        SearchOptions options;
        options.seed = 17;
        Search search({"ab"}, {"ab"}, {"ba"}, options, errorReporter);
        REQUIRE(search.run());
        CHECK(search.generation() == 30);
        // Nothing can beat a perfect seed, so it stays the best.
        CHECK(search.best().id == 0);
        CHECK(search.best().score == doctest::Approx(1.0));
        CHECK(search.population().size() == 1);
    }
    SUBCASE("stops early when good enough") {
        SearchOptions options;
        options.stopWhenGoodEnough = true;
        Search search({"ab"}, {"ab"}, {"ba"}, options, errorReporter);
        REQUIRE(search.run());
        CHECK(search.generation() == 0);
        CHECK(search.best().id == 0);
    }
    SUBCASE("population invariants hold every generation") {
        SearchOptions options;
        options.populationSize = 5;
        options.seed = 3;
        Search search({"ab", "aab"}, {"ab", "aab", "aaab", "aaaab"}, {"b", "ba", "abb"}, options, errorReporter);
        REQUIRE(search.initialize());
        double seedScore = search.best().score;
        for (int i = 0; i < 30; ++i) {
            double previousMinimum = search.minimumScore();
            size_t previousSize = search.population().size();
            bool admitted = search.runGeneration();
            CHECK(search.generation() == i + 1);
            const Population& population = search.population();
            CHECK(population.size() <= population.capacity());
            CHECK(population.isSorted());
            CHECK(search.minimumScore() == population.lowest().score);
            CHECK(search.minimumScore() >= previousMinimum);
            for (const auto& entry : population.entries()) {
                CHECK(entry.id <= search.generation());
                if (entry.id == search.generation()) {
                    CHECK(admitted);
                    CHECK(entry.score > previousMinimum);
                }
            }
            if (!admitted) {
                CHECK(population.size() == previousSize);
            }
        }
        CHECK(search.best().score >= seedScore);
    }
    SUBCASE("same seed same result") {
        SearchOptions options;
        options.seed = 42;
        options.generations = 10;
        Search first({"ab"}, {"ab", "aab"}, {"ba"}, options, errorReporter);
        Search second({"ab"}, {"ab", "aab"}, {"ba"}, options, errorReporter);
        REQUIRE(first.run());
        REQUIRE(second.run());
        REQUIRE(first.population().size() == second.population().size());
        for (size_t i = 0; i < first.population().size(); ++i) {
            CHECK(first.population().at(i).id == second.population().at(i).id);
            CHECK(first.population().at(i).grammar->render() == second.population().at(i).grammar->render());
        }
    }
    SUBCASE("generation counted when no candidate found") {
        SearchOptions options;
        options.cascadeLengths = {1};
        options.maxAttemptsPerGeneration = 3;
        // The seed for an empty guide is a single empty body, so no mutation can change it.
        Search search({""}, {""}, {"a"}, options, errorReporter);
        REQUIRE(search.initialize());
        CHECK(!search.runGeneration());
        CHECK(search.generation() == 1);
        CHECK(search.population().size() == 1);
    }
}

TEST_CASE("Search seedRandom uses all seed bits") {
    std::mt19937 low = seedRandom(1);
    std::mt19937 high = seedRandom(4294967297ULL);
    std::mt19937 same = seedRandom(4294967297ULL);
    CHECK(high == same);
    CHECK(!(low == high));
    for (int i = 0; i < 4; ++i) {
        CHECK(high() == same());
    }
}

TEST_CASE("Search tryAdmit") {
    auto errorReporter = std::make_shared<ErrorReporter>();
    SearchOptions options;
    options.populationSize = 2;
    Search search({"ab"}, {"ab", "xy"}, {}, options, errorReporter);
    REQUIRE(search.initialize());
    REQUIRE(search.minimumScore() == doctest::Approx(0.5));
    const Grammar& seed = *search.best().grammar;

    CHECK(!search.tryAdmit(std::make_unique<Grammar>(seed.clone()), 0.5));
    CHECK(!search.tryAdmit(std::make_unique<Grammar>(seed.clone()), 0.25));
    CHECK(search.population().size() == 1);

    CHECK(search.tryAdmit(std::make_unique<Grammar>(seed.clone()), 0.75));
    CHECK(search.population().size() == 2);
    CHECK(search.minimumScore() == doctest::Approx(0.5));

    CHECK(search.tryAdmit(std::make_unique<Grammar>(Grammar("t0")), 0.6));
    CHECK(search.population().size() == 2);
    CHECK(search.minimumScore() == doctest::Approx(0.6));
    CHECK(search.best().score == doctest::Approx(0.75));

    CHECK(!search.tryAdmit(nullptr, 0.9));
}

TEST_CASE("Search proposeMutant") {
    auto errorReporter = std::make_shared<ErrorReporter>();
    SearchOptions options;
    options.seed = 9;
    Search search({"abc", "cab"}, {"abc"}, {}, options, errorReporter);
    REQUIRE(search.initialize());

    const Population::Entry* entry = search.selectParent();
    REQUIRE(entry);
    auto parent = entry->grammar;
    const std::string before = parent->render();
    int produced = 0;
    for (int i = 0; i < 50; ++i) {
        auto mutant = search.proposeMutant(*parent);
        if (mutant) {
            ++produced;
            CHECK(mutant->entry().size() > 0);
        }
        CHECK(parent->render() == before);
    }
    CHECK(produced > 0);
}

} // namespace branta
