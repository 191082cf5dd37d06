#pragma once

#include "ontology/term_map.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace ontograph {

// ─── TermPropertyMap ───────────────────────────────────────────
// Index from a per-term key (e.g. an alternate id) to the term's catalog
// index. The first term that yields a key keeps it; other terms yielding
// the same key only bump ambiguities().

template <typename K, typename Hash = std::hash<K>>
class TermPropertyMap {
public:
    using Extractor = std::function<std::vector<K>(const Term&)>;

    /// The map refers to terms; it must not outlive the catalog.
    TermPropertyMap(const TermMap& terms, const Extractor& extract) : terms_(&terms) {
        for (size_t i = 0; i < terms.size(); i++) {
            for (const K& key : extract(terms.at(i))) {
                auto [it, added] = index_.emplace(key, i);
                if (!added && it->second != i) ambiguities_++;
            }
        }
    }

    std::optional<size_t> getIndex(const K& key) const {
        auto it = index_.find(key);
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }

    /// The term registered for key, or nullptr.
    const Term* get(const K& key) const {
        auto index = getIndex(key);
        return index ? &terms_->at(*index) : nullptr;
    }

    size_t size() const { return index_.size(); }
    size_t ambiguities() const { return ambiguities_; }

private:
    const TermMap* terms_;
    std::unordered_map<K, size_t, Hash> index_;
    size_t ambiguities_ = 0;
};

/// Extractor for alternate term ids.
inline std::vector<TermID> alternativeIdsOf(const Term& term) {
    return term.alternatives;
}

} // namespace ontograph
