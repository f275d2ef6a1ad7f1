#include "branta/DumpPopulationJSON.hpp"

#include "branta/ErrorReporter.hpp"
#include "branta/Grammar.hpp"
#include "branta/Search.hpp"

#include "doctest/doctest.h"
#include "rapidjson/document.h"

#include <memory>

namespace branta {

TEST_CASE("DumpPopulationJSON") {
    auto errorReporter = std::make_shared<ErrorReporter>();
    SearchOptions options;
    options.populationSize = 3;
    Search search({"ab"}, {"ab", "xy"}, {"ba"}, options, errorReporter);
    REQUIRE(search.initialize());
    const std::string seedRendering = search.best().grammar->render();
    REQUIRE(search.tryAdmit(std::make_unique<Grammar>(search.best().grammar->clone()), 0.75));

    auto json = DumpPopulationJSON(search);
    rapidjson::Document document;
    document.Parse(json.data(), json.size());
    REQUIRE(!document.HasParseError());
    REQUIRE(document.IsObject());

    REQUIRE(document.HasMember("generations"));
    CHECK(document["generations"].GetInt64() == 0);
    REQUIRE(document.HasMember("bestScore"));
    CHECK(document["bestScore"].GetDouble() == doctest::Approx(0.75));
    REQUIRE(document.HasMember("goodEnough"));
    CHECK(!document["goodEnough"].GetBool());

    REQUIRE(document.HasMember("population"));
    const auto& population = document["population"];
    REQUIRE(population.IsArray());
    REQUIRE(population.Size() == 2);
    CHECK(population[0]["score"].GetDouble() == doctest::Approx(0.5));
    CHECK(population[1]["score"].GetDouble() == doctest::Approx(0.75));
    CHECK(population[0]["id"].GetInt64() == 0);
    CHECK(std::string(population[0]["grammar"].GetString()) == seedRendering);
}

} // namespace branta
