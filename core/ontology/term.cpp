#include "ontology/term.hpp"

#include <algorithm>

namespace ontograph {

bool Term::hasSubset(const Subset& subset) const {
    return std::find(subsets.begin(), subsets.end(), subset) != subsets.end();
}

bool Term::hasAlternative(const TermID& alternative) const {
    return std::find(alternatives.begin(), alternatives.end(), alternative) != alternatives.end();
}

std::ostream& operator<<(std::ostream& os, const Term& term) {
    os << term.id;
    if (!term.name.empty()) os << " (" << term.name << ")";
    return os;
}

} // namespace ontograph
