#ifndef SRC_BRANTA_RULE_HPP_
#define SRC_BRANTA_RULE_HPP_

#include "branta/Symbol.hpp"

#include <string>
#include <vector>

namespace branta {

// A named nonterminal and its alternatives. Alternative order does not change the language, but it is kept stable so
// that renderings, and so hashes, are reproducible.
struct Rule {
    Rule() = delete;
    explicit Rule(std::string ruleName): name(std::move(ruleName)) {}
    Rule(std::string ruleName, std::vector<Body> ruleBodies): name(std::move(ruleName)), bodies(std::move(ruleBodies)) {}

    Rule& addBody(Body body) {
        bodies.emplace_back(std::move(body));
        return *this;
    }

    std::string name;
    std::vector<Body> bodies;
};

} // namespace branta

#endif // SRC_BRANTA_RULE_HPP_
