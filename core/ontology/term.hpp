#pragma once

#include "ontology/relation.hpp"
#include "ontology/term_id.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace ontograph {

/// A named subset of an ontology (a "slim"). Two subsets are equal when
/// their names are.
struct Subset {
    std::string name;
    std::string description;

    bool operator==(const Subset& other) const { return name == other.name; }
    bool operator!=(const Subset& other) const { return name != other.name; }
};

/// A declared parent relation: the term is related to `related` by `relation`.
struct ParentTermID {
    TermID related;
    RelationType relation = RelationType::IS_A;
};

// ─── Term ──────────────────────────────────────────────────────

struct Term {
    TermID id;
    std::string name;
    std::string name_space;
    std::string definition;
    std::vector<ParentTermID> parents;
    std::vector<Subset> subsets;
    std::vector<TermID> alternatives;
    bool obsolete = false;

    bool hasSubset(const Subset& subset) const;
    bool hasAlternative(const TermID& alternative) const;
};

std::ostream& operator<<(std::ostream& os, const Term& term);

} // namespace ontograph
