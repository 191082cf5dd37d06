#include "ontology/term_map.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace ontograph {

TermMap::TermMap(std::vector<Term> terms) {
    terms_.reserve(terms.size());
    for (auto& term : terms) add(std::move(term));
}

void TermMap::add(Term term) {
    if (index_.count(term.id))
        throw std::invalid_argument("Duplicate term id: " + term.id.toString());
    index_.emplace(term.id, terms_.size());
    terms_.push_back(std::move(term));
}

const Term* TermMap::get(const TermID& id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &terms_[it->second] : nullptr;
}

const Term* TermMap::get(const std::string& id) const {
    auto parsed = TermID::tryParse(id);
    return parsed ? get(*parsed) : nullptr;
}

std::optional<size_t> TermMap::indexOf(const TermID& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

bool TermMap::addAlternativeId(const TermID& term, const TermID& alternative) {
    auto it = index_.find(term);
    if (it == index_.end())
        throw std::runtime_error("Term not found: " + term.toString());

    Term& target = terms_[it->second];
    if (target.hasAlternative(alternative)) return false;
    target.alternatives.push_back(alternative);
    return true;
}

std::vector<Subset> TermMap::availableSubsets() const {
    std::vector<Subset> subsets;
    for (const auto& term : terms_) {
        for (const auto& s : term.subsets) {
            if (std::find(subsets.begin(), subsets.end(), s) == subsets.end()) subsets.push_back(s);
        }
    }
    return subsets;
}

} // namespace ontograph
