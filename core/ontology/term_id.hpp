#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace ontograph {

// ─── TermID ────────────────────────────────────────────────────
// Identifier of an ontology term: a prefix naming the ontology and a
// numeric id. The text form is PREFIX:NNNNNNN (id zero padded to 7 digits).

struct TermID {
    std::string prefix;
    int id = 0;

    TermID() = default;
    TermID(std::string prefix, int id) : prefix(std::move(prefix)), id(id) {}

    /// Parses "PREFIX:digits". Throws std::invalid_argument when malformed.
    static TermID parse(const std::string& text);
    static std::optional<TermID> tryParse(const std::string& text);

    std::string toString() const;

    bool operator==(const TermID& other) const { return id == other.id && prefix == other.prefix; }
    bool operator!=(const TermID& other) const { return !(*this == other); }
    bool operator<(const TermID& other) const {
        if (prefix != other.prefix) return prefix < other.prefix;
        return id < other.id;
    }
};

std::ostream& operator<<(std::ostream& os, const TermID& term_id);

} // namespace ontograph

namespace std {
template <>
struct hash<ontograph::TermID> {
    size_t operator()(const ontograph::TermID& t) const noexcept {
        size_t h = hash<string>{}(t.prefix);
        return h ^ (hash<int>{}(t.id) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};
} // namespace std
