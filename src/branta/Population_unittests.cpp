#include "branta/Population.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace branta {

TEST_CASE("Population insert") {
    auto grammar = std::make_shared<const Grammar>(Grammar("t0"));

    SUBCASE("keeps ascending order") {
        Population population(5);
        CHECK(population.empty());
        CHECK(population.insert(grammar, 0, 0.5) == 0);
        CHECK(population.insert(grammar, 1, 0.25) == 0);
        CHECK(population.insert(grammar, 2, 0.75) == 0);
        CHECK(population.insert(grammar, 3, 0.3) == 0);
        REQUIRE(population.size() == 4);
        CHECK(population.isSorted());
        CHECK(population.lowest().id == 1);
        CHECK(population.best().id == 2);
        CHECK(population.at(1).id == 3);
        CHECK(population.at(2).id == 0);
    }
    SUBCASE("equal scores insert after existing") {
        Population population(5);
        population.insert(grammar, 0, 0.5);
        population.insert(grammar, 1, 0.5);
        population.insert(grammar, 2, 0.5);
        REQUIRE(population.size() == 3);
        CHECK(population.at(0).id == 0);
        CHECK(population.at(1).id == 1);
        CHECK(population.at(2).id == 2);
        CHECK(population.best().id == 2);
    }
    SUBCASE("evicts lowest when over capacity") {
        Population population(2);
        CHECK(population.capacity() == 2);
        population.insert(grammar, 0, 0.5);
        population.insert(grammar, 1, 0.25);
        CHECK(population.insert(grammar, 2, 0.75) == 1);
        REQUIRE(population.size() == 2);
        CHECK(population.lowest().id == 0);
        CHECK(population.best().id == 2);
    }
    SUBCASE("oldest of equal scores evicted first") {
        Population population(2);
        population.insert(grammar, 0, 0.5);
        population.insert(grammar, 1, 0.5);
        CHECK(population.insert(grammar, 2, 0.5) == 1);
        REQUIRE(population.size() == 2);
        CHECK(population.at(0).id == 1);
        CHECK(population.at(1).id == 2);
    }
    SUBCASE("entry below everything at capacity is evicted at once") {
        Population population(2);
        population.insert(grammar, 0, 0.5);
        population.insert(grammar, 1, 0.75);
        CHECK(population.insert(grammar, 2, 0.1) == 1);
        CHECK(population.lowest().id == 0);
        CHECK(population.size() == 2);
    }
    SUBCASE("never exceeds capacity") {
        Population population(3);
        for (int i = 0; i < 20; ++i) {
            population.insert(grammar, i, static_cast<double>((i * 7) % 11) / 10.0);
            CHECK(population.size() <= 3);
            CHECK(population.isSorted());
        }
        CHECK(population.size() == 3);
        CHECK(population.best().score == doctest::Approx(1.0));
    }
}

} // namespace branta
