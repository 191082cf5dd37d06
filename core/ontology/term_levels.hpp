#pragma once

#include "ontology/term_id.hpp"

#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace ontograph {

/// Level (longest distance from the root) of a set of terms.
class TermLevels {
public:
    void putLevel(const TermID& term, int level);

    std::optional<int> getTermLevel(const TermID& term) const;

    /// Terms on the given level, in insertion order. Empty for an unused level.
    const std::vector<TermID>& getLevelTermSet(int level) const;

    /// Highest level seen, -1 when empty.
    int getMaxLevel() const { return max_level_; }
    size_t size() const { return terms2level_.size(); }

private:
    std::map<int, std::vector<TermID>> level2terms_;
    std::unordered_map<TermID, int> terms2level_;
    int max_level_ = -1;
};

} // namespace ontograph
