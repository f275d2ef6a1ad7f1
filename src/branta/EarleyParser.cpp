#include "branta/EarleyParser.hpp"

#include "branta/ErrorReporter.hpp"
#include "branta/Grammar.hpp"
#include "branta/GrammarReader.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace branta {

EarleyParser::EarleyParser(std::shared_ptr<ErrorReporter> errorReporter):
    m_errorReporter(errorReporter), m_compiled(false), m_startIndex(-1), m_maxBodyLength(0) {}

bool EarleyParser::compile(const Grammar& grammar) {
    m_compiled = false;
    m_startIndex = -1;
    m_maxBodyLength = 0;
    m_terminals.clear();
    m_productions.clear();
    m_productionsByLhs.clear();
    m_nullable.clear();

    std::unordered_map<std::string, int32_t> nonterminalIndices;
    for (const auto& rule : grammar.rules()) {
        nonterminalIndices.emplace(rule.name, static_cast<int32_t>(nonterminalIndices.size()));
    }
    auto startIter = nonterminalIndices.find(std::string(Grammar::kStartRuleName));
    if (startIter == nonterminalIndices.end()) {
        m_errorReporter->addError(fmt::format("Grammar has no '{}' rule.", Grammar::kStartRuleName));
        return false;
    }
    m_startIndex = startIter->second;
    m_productionsByLhs.resize(nonterminalIndices.size());

    std::unordered_map<std::string, int32_t> terminalIndices;
    bool ok = true;
    for (const auto& rule : grammar.rules()) {
        int32_t lhs = nonterminalIndices[rule.name];
        for (const auto& body : rule.bodies) {
            Production production{lhs, {}};
            production.rhs.reserve(body.size());
            for (const auto& symbol : body) {
                if (symbol.isNonterminal()) {
                    auto iter = nonterminalIndices.find(symbol.text);
                    if (iter == nonterminalIndices.end()) {
                        m_errorReporter->addError(fmt::format("Rule '{}' references undefined nonterminal '{}'.",
                                                              rule.name, symbol.text));
                        ok = false;
                        continue;
                    }
                    production.rhs.emplace_back(iter->second);
                } else {
                    if (symbol.text.empty()) {
                        m_errorReporter->addError(fmt::format("Rule '{}' contains an empty terminal.", rule.name));
                        ok = false;
                        continue;
                    }
                    auto iter = terminalIndices.find(symbol.text);
                    if (iter == terminalIndices.end()) {
                        iter = terminalIndices.emplace(symbol.text, static_cast<int32_t>(m_terminals.size())).first;
                        m_terminals.emplace_back(symbol.text);
                    }
                    production.rhs.emplace_back(-(iter->second + 1));
                }
            }
            m_maxBodyLength = std::max(m_maxBodyLength, production.rhs.size());
            m_productionsByLhs[lhs].emplace_back(static_cast<uint32_t>(m_productions.size()));
            m_productions.emplace_back(std::move(production));
        }
    }
    if (!ok) { return false; }

    computeNullable();
    m_compiled = true;
    return true;
}

bool EarleyParser::compile(std::string_view rendering) {
    GrammarReader reader(rendering, m_errorReporter);
    auto grammar = reader.read();
    if (!grammar) {
        m_compiled = false;
        return false;
    }
    return compile(*grammar);
}

EarleyParser::Result EarleyParser::parse(std::string_view input, size_t budget) const {
    if (!m_compiled) { return Result::kRejected; }

    const size_t length = input.size();
    std::vector<std::vector<Item>> chart(length + 1);
    std::vector<std::unordered_set<uint64_t>> seen(length + 1);
    size_t itemCount = 0;

    // Items are uniquely identified by (production, dot, origin) flattened into one integer.
    auto add = [&](size_t position, Item item) {
        uint64_t key = (static_cast<uint64_t>(item.production) * (m_maxBodyLength + 1) + item.dot) * (length + 1)
            + item.origin;
        if (seen[position].insert(key).second) {
            chart[position].emplace_back(item);
            ++itemCount;
        }
    };

    for (auto production : m_productionsByLhs[m_startIndex]) {
        add(0, Item{production, 0, 0});
    }

    for (size_t i = 0; i <= length; ++i) {
        // chart[i] may grow while it is being processed, so index rather than iterate.
        for (size_t k = 0; k < chart[i].size(); ++k) {
            if (itemCount > budget) {
                SPDLOG_TRACE("Earley parse exceeded budget of {} items at position {} of {}", budget, i, length);
                return Result::kBudgetExceeded;
            }
            const Item item = chart[i][k];
            const Production& production = m_productions[item.production];

            if (item.dot < production.rhs.size()) {
                int32_t next = production.rhs[item.dot];
                if (next >= 0) {
                    // Predict.
                    for (auto predicted : m_productionsByLhs[next]) {
                        add(i, Item{predicted, 0, static_cast<uint32_t>(i)});
                    }
                    // Nullable nonterminals can be stepped over immediately, otherwise completions of empty
                    // derivations within this set could be missed.
                    if (m_nullable[next]) {
                        add(i, Item{item.production, item.dot + 1, item.origin});
                    }
                } else {
                    // Scan.
                    const std::string& terminal = m_terminals[-next - 1];
                    if (input.substr(i, terminal.size()) == terminal) {
                        add(i + terminal.size(), Item{item.production, item.dot + 1, item.origin});
                    }
                }
            } else {
                // Complete.
                const auto& originSet = chart[item.origin];
                for (size_t j = 0; j < originSet.size(); ++j) {
                    const Item waiting = originSet[j];
                    const Production& waitingProduction = m_productions[waiting.production];
                    if (waiting.dot < waitingProduction.rhs.size()
                        && waitingProduction.rhs[waiting.dot] == production.lhs) {
                        add(i, Item{waiting.production, waiting.dot + 1, waiting.origin});
                    }
                }
            }
        }
    }

    for (const auto& item : chart[length]) {
        const Production& production = m_productions[item.production];
        if (production.lhs == m_startIndex && item.origin == 0 && item.dot == production.rhs.size()) {
            return Result::kAccepted;
        }
    }
    return Result::kRejected;
}

void EarleyParser::computeNullable() {
    m_nullable.assign(m_productionsByLhs.size(), false);
    bool changed = true;
    while (changed) {
        changed = false;
        for (const auto& production : m_productions) {
            if (m_nullable[production.lhs]) { continue; }
            bool allNullable = true;
            for (auto symbol : production.rhs) {
                if (symbol < 0 || !m_nullable[symbol]) {
                    allNullable = false;
                    break;
                }
            }
            if (allNullable) {
                m_nullable[production.lhs] = true;
                changed = true;
            }
        }
    }
}

} // namespace branta
