#include "ontology/term_id.hpp"

#include <cctype>
#include <climits>
#include <cstdio>
#include <stdexcept>

namespace ontograph {

std::optional<TermID> TermID::tryParse(const std::string& text) {
    size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) return std::nullopt;

    long long value = 0;
    for (size_t i = colon + 1; i < text.size(); i++) {
        char c = text[i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + (c - '0');
        if (value > INT_MAX) return std::nullopt;
    }
    return TermID(text.substr(0, colon), static_cast<int>(value));
}

TermID TermID::parse(const std::string& text) {
    auto parsed = tryParse(text);
    if (!parsed) throw std::invalid_argument("Malformed term id: '" + text + "'");
    return *parsed;
}

std::string TermID::toString() const {
    char digits[16];
    std::snprintf(digits, sizeof(digits), "%07d", id);
    return prefix + ":" + digits;
}

std::ostream& operator<<(std::ostream& os, const TermID& term_id) {
    return os << term_id.toString();
}

} // namespace ontograph
