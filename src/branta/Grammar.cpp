#include "branta/Grammar.hpp"

#include "fmt/format.h"

#include <set>
#include <unordered_set>

namespace branta {

Grammar::Grammar(std::string entry): m_version(1), m_hash(0), m_renderedVersion(0) {
    Rule startRule{std::string(kStartRuleName)};
    startRule.addBody({Symbol::nonterminal(std::move(entry))});
    addOrReplaceRule(std::move(startRule));
}

Grammar Grammar::clone() const {
    Grammar copy(*this);
    copy.m_rendering.clear();
    copy.m_hash = 0;
    copy.m_renderedVersion = 0;
    return copy;
}

void Grammar::addOrReplaceRule(Rule rule) {
    auto iter = m_ruleIndices.find(rule.name);
    if (iter != m_ruleIndices.end()) {
        m_rules[iter->second] = std::move(rule);
    } else {
        m_ruleIndices.emplace(rule.name, m_rules.size());
        m_rules.emplace_back(std::move(rule));
    }
    touch();
}

bool Grammar::addBody(std::string_view name, Body body) {
    auto iter = m_ruleIndices.find(std::string(name));
    if (iter == m_ruleIndices.end()) {
        return false;
    }
    m_rules[iter->second].addBody(std::move(body));
    touch();
    return true;
}

const Rule* Grammar::findRule(std::string_view name) const {
    auto iter = m_ruleIndices.find(std::string(name));
    if (iter == m_ruleIndices.end()) {
        return nullptr;
    }
    return &m_rules[iter->second];
}

std::string Grammar::entry() const {
    const Rule* startRule = findRule(kStartRuleName);
    if (!startRule || startRule->bodies.empty() || startRule->bodies[0].empty()) {
        return std::string();
    }
    return startRule->bodies[0][0].text;
}

std::vector<std::string> Grammar::nonterminals() const {
    std::vector<std::string> names;
    names.reserve(m_rules.size());
    for (const auto& rule : m_rules) {
        if (rule.name != kStartRuleName) {
            names.emplace_back(rule.name);
        }
    }
    return names;
}

std::vector<Symbol> Grammar::terminals() const {
    std::vector<Symbol> found;
    std::set<std::string> seen;
    for (const auto& rule : m_rules) {
        for (const auto& body : rule.bodies) {
            for (const auto& symbol : body) {
                if (symbol.isTerminal() && seen.insert(symbol.text).second) {
                    found.emplace_back(symbol);
                }
            }
        }
    }
    return found;
}

std::vector<Symbol> Grammar::alphabet() const {
    auto symbols = terminals();
    for (auto& name : nonterminals()) {
        symbols.emplace_back(Symbol::nonterminal(std::move(name)));
    }
    return symbols;
}

size_t Grammar::bodyCount() const {
    size_t count = 0;
    for (const auto& rule : m_rules) {
        count += rule.bodies.size();
    }
    return count;
}

std::string Grammar::freshNonterminal() const {
    std::unordered_set<std::string> used;
    for (const auto& rule : m_rules) {
        used.insert(rule.name);
        for (const auto& body : rule.bodies) {
            for (const auto& symbol : body) {
                if (symbol.isNonterminal()) {
                    used.insert(symbol.text);
                }
            }
        }
    }

    size_t index = m_rules.size();
    std::string name = fmt::format("t{}", index);
    while (used.count(name)) {
        ++index;
        name = fmt::format("t{}", index);
    }
    return name;
}

const std::string& Grammar::render() const {
    if (m_renderedVersion == m_version) {
        return m_rendering;
    }

    m_rendering.clear();
    for (const auto& rule : m_rules) {
        m_rendering += rule.name;
        m_rendering += ':';
        for (size_t i = 0; i < rule.bodies.size(); ++i) {
            if (i == 0) {
                m_rendering += ' ';
            } else {
                m_rendering += "\n  | ";
            }
            m_rendering += bodyToString(rule.bodies[i]);
        }
        m_rendering += '\n';
    }
    m_hash = branta::hash(m_rendering);
    m_renderedVersion = m_version;
    return m_rendering;
}

Hash Grammar::hash() const {
    render();
    return m_hash;
}

} // namespace branta
