#ifndef SRC_BRANTA_GRAMMAR_HPP_
#define SRC_BRANTA_GRAMMAR_HPP_

#include "branta/Hash.hpp"
#include "branta/Rule.hpp"
#include "branta/Symbol.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace branta {

// An ordered collection of uniquely named Rules. Every Grammar carries a distinguished "start" rule with the single
// body [entry], so the top level production is fixed no matter which nonterminal is the current entry point.
//
// Grammars are treated as values: mutation operators build new Grammars rather than editing the ones they are given.
// The rendering and hash are memoized against a structural version number that every edit advances.
class Grammar {
public:
    static constexpr std::string_view kStartRuleName = "start";

    Grammar() = delete;
    // Builds a Grammar with only the start rule, pointing at |entry|.
    explicit Grammar(std::string entry);
    Grammar(const Grammar&) = default;
    Grammar(Grammar&&) = default;
    Grammar& operator=(const Grammar&) = default;
    Grammar& operator=(Grammar&&) = default;
    ~Grammar() = default;

    // Deep copy that shares no state with this Grammar, and starts with an empty render cache.
    Grammar clone() const;

    // Replaces any rule with the same name in place, preserving its position, otherwise appends |rule|.
    void addOrReplaceRule(Rule rule);
    // Appends |body| to the rule called |name|. Returns false if there is no such rule.
    bool addBody(std::string_view name, Body body);

    // Returns nullptr if not found.
    const Rule* findRule(std::string_view name) const;
    bool hasRule(std::string_view name) const { return findRule(name) != nullptr; }
    const std::vector<Rule>& rules() const { return m_rules; }

    // The nonterminal named by the start rule's body.
    std::string entry() const;
    // All rule names except the start rule, in rule order.
    std::vector<std::string> nonterminals() const;
    // Every distinct terminal appearing in any body, in order of first appearance.
    std::vector<Symbol> terminals() const;
    // terminals() followed by nonterminals(), as Symbols.
    std::vector<Symbol> alphabet() const;
    size_t bodyCount() const;

    // Returns a nonterminal name not used by any rule or referenced from any body.
    std::string freshNonterminal() const;

    const std::string& render() const;
    Hash hash() const;
    uint64_t version() const { return m_version; }

private:
    void touch() { ++m_version; }

    std::vector<Rule> m_rules;
    std::unordered_map<std::string, size_t> m_ruleIndices;
    uint64_t m_version;

    mutable std::string m_rendering;
    mutable Hash m_hash;
    // Version the cached rendering and hash were computed at, or 0 if never computed. Versions start at 1.
    mutable uint64_t m_renderedVersion;
};

} // namespace branta

#endif // SRC_BRANTA_GRAMMAR_HPP_
