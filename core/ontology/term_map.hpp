#pragma once

#include "ontology/term.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ontograph {

// ─── TermMap ───────────────────────────────────────────────────
// The term catalog an ontology is built from. Terms keep their insertion
// order and get a stable catalog index. The catalog may hold more terms
// than any one ontology graph built on top of it.

class TermMap {
public:
    TermMap() = default;

    /// Throws std::invalid_argument on a duplicate term id.
    explicit TermMap(std::vector<Term> terms);

    /// Appends a term. Throws std::invalid_argument if its id is taken.
    /// Pointers handed out earlier may be invalidated.
    void add(Term term);

    const Term* get(const TermID& id) const;

    /// Looks up "PREFIX:digits"; nullptr when unknown or malformed.
    const Term* get(const std::string& id) const;

    std::optional<size_t> indexOf(const TermID& id) const;
    const Term& at(size_t index) const { return terms_.at(index); }
    bool contains(const TermID& id) const { return index_.count(id) > 0; }
    size_t size() const { return terms_.size(); }

    std::vector<Term>::const_iterator begin() const { return terms_.begin(); }
    std::vector<Term>::const_iterator end() const { return terms_.end(); }

    /// Records alternative as an alternate id of term unless already present.
    /// Returns whether it was added. Throws std::runtime_error if term is unknown.
    bool addAlternativeId(const TermID& term, const TermID& alternative);

    /// Every subset used by some term, in first-seen order.
    std::vector<Subset> availableSubsets() const;

private:
    std::vector<Term> terms_;
    std::unordered_map<TermID, size_t> index_;
};

} // namespace ontograph
