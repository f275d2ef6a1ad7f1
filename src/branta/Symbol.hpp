#ifndef SRC_BRANTA_SYMBOL_HPP_
#define SRC_BRANTA_SYMBOL_HPP_

#include <string>
#include <vector>

namespace branta {

// One element of a rule body. Terminals hold the literal text they match, nonterminals hold the name of the Rule they
// refer to. The two kinds share one namespace of strings, so the kind is always carried alongside the text.
struct Symbol {
    enum Kind : int {
        kTerminal = 0,
        kNonterminal = 1
    };

    Symbol() = delete;
    Symbol(Kind k, std::string t): kind(k), text(std::move(t)) {}

    static Symbol terminal(std::string literal) { return Symbol(kTerminal, std::move(literal)); }
    static Symbol nonterminal(std::string name) { return Symbol(kNonterminal, std::move(name)); }

    bool isTerminal() const { return kind == kTerminal; }
    bool isNonterminal() const { return kind == kNonterminal; }

    // Terminals render double-quoted and escaped, nonterminals render as their bare name.
    std::string toString() const;

    bool operator==(const Symbol& s) const { return kind == s.kind && text == s.text; }
    bool operator!=(const Symbol& s) const { return !(*this == s); }
    bool operator<(const Symbol& s) const { return kind < s.kind || (kind == s.kind && text < s.text); }

    Kind kind;
    std::string text;
};

// An ordered sequence of symbols, one alternative derivation of a Rule.
using Body = std::vector<Symbol>;

// Returns a copy of |literal| surrounded in double quotes, with quotes, backslashes and non-printing characters
// escaped.
std::string quoteTerminal(const std::string& literal);

// Space-separated rendering of every symbol in |body|, or "\"\"" for an empty body.
std::string bodyToString(const Body& body);

} // namespace branta

#endif // SRC_BRANTA_SYMBOL_HPP_
