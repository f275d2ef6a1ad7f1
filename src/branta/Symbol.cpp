#include "branta/Symbol.hpp"

#include "fmt/format.h"

#include <cctype>

namespace branta {

std::string Symbol::toString() const {
    if (kind == kTerminal) {
        return quoteTerminal(text);
    }
    return text;
}

std::string quoteTerminal(const std::string& literal) {
    std::string quoted("\"");
    for (char c : literal) {
        switch (c) {
        case '"':
            quoted += "\\\"";
            break;
        case '\\':
            quoted += "\\\\";
            break;
        case '\n':
            quoted += "\\n";
            break;
        case '\r':
            quoted += "\\r";
            break;
        case '\t':
            quoted += "\\t";
            break;
        default:
            if (std::isprint(static_cast<unsigned char>(c))) {
                quoted += c;
            } else {
                quoted += fmt::format("\\x{:02X}", static_cast<unsigned>(static_cast<unsigned char>(c)));
            }
            break;
        }
    }
    quoted += '"';
    return quoted;
}

std::string bodyToString(const Body& body) {
    if (body.empty()) {
        return "\"\"";
    }
    std::string out;
    for (const auto& symbol : body) {
        if (!out.empty()) {
            out += ' ';
        }
        out += symbol.toString();
    }
    return out;
}

} // namespace branta
