#include "branta/GrammarReader.hpp"

#include "branta/ErrorReporter.hpp"

#include "fmt/format.h"

#include <cctype>
#include <unordered_set>

namespace {

bool isIdentifierStart(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool isIdentifierChar(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

int hexValue(char c) {
    if (c >= '0' && c <= '9') { return c - '0'; }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return -1;
}

} // namespace

namespace branta {

GrammarReader::GrammarReader(std::string_view text, std::shared_ptr<ErrorReporter> errorReporter):
    m_text(text), m_errorReporter(errorReporter) {
    m_errorReporter->setCode(m_text);
}

std::unique_ptr<Grammar> GrammarReader::read() {
    m_tokens.clear();
    if (!tokenize()) { return nullptr; }

    std::vector<Rule> rules;
    std::unordered_set<std::string> names;
    bool ok = true;
    size_t i = 0;
    while (i < m_tokens.size()) {
        const Token& head = m_tokens[i];
        if (head.name != Token::kIdentifier || i + 1 >= m_tokens.size() || m_tokens[i + 1].name != Token::kColon) {
            addError(head.location, "Expected rule definition of the form 'name:'.");
            return nullptr;
        }
        if (!names.insert(head.value).second) {
            addError(head.location, fmt::format("Duplicate definition of rule '{}'.", head.value));
            ok = false;
        }
        Rule rule(head.value);
        i += 2;

        // A rule with no tokens at all before the next definition has no bodies. Otherwise each '|' separates
        // bodies, any of which may be empty.
        bool hasBodies = false;
        Body body;
        while (i < m_tokens.size()) {
            const Token& token = m_tokens[i];
            if (token.name == Token::kIdentifier && i + 1 < m_tokens.size()
                && m_tokens[i + 1].name == Token::kColon) {
                break;
            }
            hasBodies = true;
            if (token.name == Token::kPipe) {
                rule.addBody(std::move(body));
                body = Body();
            } else if (token.name == Token::kIdentifier) {
                body.emplace_back(Symbol::nonterminal(token.value));
            } else if (token.name == Token::kString) {
                // The empty string is the empty body marker, not a symbol.
                if (!token.value.empty()) {
                    body.emplace_back(Symbol::terminal(token.value));
                }
            } else {
                addError(token.location, "Unexpected ':' inside rule body.");
                return nullptr;
            }
            ++i;
        }
        if (hasBodies) {
            rule.addBody(std::move(body));
        }
        rules.emplace_back(std::move(rule));
    }

    if (!ok) { return nullptr; }

    const Rule* startRule = nullptr;
    for (const auto& rule : rules) {
        if (rule.name == Grammar::kStartRuleName) {
            startRule = &rule;
            break;
        }
    }
    if (!startRule) {
        addError(m_text.data(), fmt::format("Missing '{}' rule.", Grammar::kStartRuleName));
        return nullptr;
    }
    if (startRule->bodies.size() != 1 || startRule->bodies[0].size() != 1
        || !startRule->bodies[0][0].isNonterminal()) {
        addError(m_text.data(),
                 fmt::format("The '{}' rule must have exactly one body naming a single nonterminal.",
                             Grammar::kStartRuleName));
        return nullptr;
    }

    auto grammar = std::make_unique<Grammar>(startRule->bodies[0][0].text);
    for (auto& rule : rules) {
        grammar->addOrReplaceRule(std::move(rule));
    }
    return grammar;
}

bool GrammarReader::tokenize() {
    const char* p = m_text.data();
    const char* end = m_text.data() + m_text.size();
    bool ok = true;
    while (p < end) {
        char c = *p;
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++p;
        } else if (c == '/' && p + 1 < end && *(p + 1) == '/') {
            while (p < end && *p != '\n') { ++p; }
        } else if (c == ':') {
            m_tokens.emplace_back(Token{Token::kColon, std::string(), p});
            ++p;
        } else if (c == '|') {
            m_tokens.emplace_back(Token{Token::kPipe, std::string(), p});
            ++p;
        } else if (c == '"') {
            const char* start = p;
            std::string value;
            if (!readString(p, value)) {
                ok = false;
                // Skip to the next line to keep reporting errors.
                while (p < end && *p != '\n') { ++p; }
                continue;
            }
            m_tokens.emplace_back(Token{Token::kString, std::move(value), start});
        } else if (isIdentifierStart(c)) {
            const char* start = p;
            while (p < end && isIdentifierChar(*p)) { ++p; }
            m_tokens.emplace_back(Token{Token::kIdentifier, std::string(start, p), start});
        } else {
            addError(p, fmt::format("Unexpected character '{}'.", c));
            ok = false;
            ++p;
        }
    }
    return ok;
}

bool GrammarReader::readString(const char*& p, std::string& value) {
    const char* start = p;
    const char* end = m_text.data() + m_text.size();
    ++p;
    while (p < end && *p != '"') {
        if (*p == '\n') {
            addError(start, "Unterminated string literal.");
            return false;
        }
        if (*p != '\\') {
            value += *p;
            ++p;
            continue;
        }
        ++p;
        if (p >= end) { break; }
        switch (*p) {
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'x': {
            int high = p + 1 < end ? hexValue(*(p + 1)) : -1;
            int low = p + 2 < end ? hexValue(*(p + 2)) : -1;
            if (high < 0 || low < 0) {
                addError(p, "Malformed \\x escape, expected two hex digits.");
                return false;
            }
            value += static_cast<char>((high << 4) | low);
            p += 2;
        } break;
        default:
            addError(p, fmt::format("Unknown escape sequence '\\{}'.", *p));
            return false;
        }
        ++p;
    }
    if (p >= end) {
        addError(start, "Unterminated string literal.");
        return false;
    }
    // Consume closing quote.
    ++p;
    return true;
}

void GrammarReader::addError(const char* location, const std::string& message) {
    m_errorReporter->addError(fmt::format("line {}: {}", m_errorReporter->getLineNumber(location), message));
}

} // namespace branta
