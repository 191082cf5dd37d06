#include "ontology/term_levels.hpp"

#include <algorithm>

namespace ontograph {

void TermLevels::putLevel(const TermID& term, int level) {
    auto existing = terms2level_.find(term);
    if (existing != terms2level_.end()) {
        if (existing->second == level) return;
        auto& old_set = level2terms_[existing->second];
        old_set.erase(std::remove(old_set.begin(), old_set.end(), term), old_set.end());
        existing->second = level;
    } else {
        terms2level_.emplace(term, level);
    }
    level2terms_[level].push_back(term);
    max_level_ = std::max(max_level_, level);
}

std::optional<int> TermLevels::getTermLevel(const TermID& term) const {
    auto it = terms2level_.find(term);
    if (it == terms2level_.end()) return std::nullopt;
    return it->second;
}

const std::vector<TermID>& TermLevels::getLevelTermSet(int level) const {
    static const std::vector<TermID> empty;
    auto it = level2terms_.find(level);
    return it != level2terms_.end() ? it->second : empty;
}

} // namespace ontograph
