#include "branta/SeedBuilder.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <unordered_map>

namespace {

// Length in bytes of the UTF-8 sequence starting at |text[i]|, or 1 if the bytes there don't form a valid sequence.
size_t characterLength(const std::string& text, size_t i) {
    auto byte = static_cast<unsigned char>(text[i]);
    size_t length = 1;
    if (byte >= 0xc2 && byte <= 0xdf) {
        length = 2;
    } else if (byte >= 0xe0 && byte <= 0xef) {
        length = 3;
    } else if (byte >= 0xf0 && byte <= 0xf4) {
        length = 4;
    }
    if (i + length > text.size()) { return 1; }
    for (size_t j = 1; j < length; ++j) {
        if ((static_cast<unsigned char>(text[i + j]) & 0xc0) != 0x80) { return 1; }
    }
    return length;
}

// Splits |guide| into its characters, each multi-byte UTF-8 sequence kept whole.
std::vector<std::string> splitCharacters(const std::string& guide) {
    std::vector<std::string> characters;
    size_t i = 0;
    while (i < guide.size()) {
        size_t length = characterLength(guide, i);
        characters.emplace_back(guide.substr(i, length));
        i += length;
    }
    return characters;
}

} // namespace

namespace branta {

Grammar SeedBuilder::build(const std::vector<std::string>& guides) const {
    Grammar grammar{std::string(kEntryName)};

    std::vector<std::vector<std::string>> splitGuides;
    splitGuides.reserve(guides.size());
    std::unordered_map<std::string, std::string> leafNames;
    for (const auto& guide : guides) {
        splitGuides.emplace_back(splitCharacters(guide));
        for (const auto& character : splitGuides.back()) {
            if (leafNames.count(character)) { continue; }
            std::string name = fmt::format("t{}", leafNames.size() + 1);
            grammar.addOrReplaceRule(Rule(name).addBody({Symbol::terminal(character)}));
            leafNames.emplace(character, std::move(name));
        }
    }

    Rule entryRule{std::string(kEntryName)};
    for (const auto& characters : splitGuides) {
        Body body;
        body.reserve(characters.size());
        for (const auto& character : characters) {
            body.emplace_back(Symbol::nonterminal(leafNames[character]));
        }
        entryRule.addBody(std::move(body));
    }
    grammar.addOrReplaceRule(std::move(entryRule));

    SPDLOG_DEBUG("Seed grammar has {} leaf rules and {} entry bodies.", leafNames.size(), guides.size());
    return grammar;
}

} // namespace branta
