#include "branta/DumpPopulationJSON.hpp"

#include "branta/Grammar.hpp"
#include "branta/Population.hpp"
#include "branta/Scorer.hpp"
#include "branta/Search.hpp"

#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

namespace branta {

std::string DumpPopulationJSON(const Search& search) {
    rapidjson::Document document;
    document.SetObject();
    auto& allocator = document.GetAllocator();

    const Population& population = search.population();
    document.AddMember("generations", rapidjson::Value(search.generation()), allocator);
    if (!population.empty()) {
        document.AddMember("bestScore", rapidjson::Value(population.best().score), allocator);
        document.AddMember("goodEnough", rapidjson::Value(Scorer::isGoodEnough(population.best().score)), allocator);
    }

    rapidjson::Value entries(rapidjson::kArrayType);
    for (const auto& entry : population.entries()) {
        rapidjson::Value value(rapidjson::kObjectType);
        value.AddMember("id", rapidjson::Value(entry.id), allocator);
        value.AddMember("score", rapidjson::Value(entry.score), allocator);
        const std::string& rendering = entry.grammar->render();
        value.AddMember("grammar",
                rapidjson::Value(rendering.data(), static_cast<rapidjson::SizeType>(rendering.size()), allocator),
                allocator);
        entries.PushBack(value, allocator);
    }
    document.AddMember("population", entries, allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    document.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace branta
