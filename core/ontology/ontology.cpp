#include "ontology/ontology.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>
#include <utility>

namespace ontograph {

namespace {

const std::set<std::string> kGeneOntologyLevel1Names = {
    "molecular_function", "biological_process", "cellular_component"};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

RelationType mergeRelations(const std::vector<RelationType>& relations) {
    std::optional<RelationType> other;
    for (RelationType r : relations) {
        if (r == RelationType::IS_A) continue;
        if (other && *other != r) return RelationType::UNKNOWN;
        other = r;
    }
    return other.value_or(RelationType::IS_A);
}

// ─── Construction ──────────────────────────────────────────────

Ontology::Ontology() : alternatives_(std::make_unique<OnceCell<TermPropertyMap<TermID>>>()) {}

Ontology Ontology::create(std::shared_ptr<TermMap> terms, const OntologyConfig& config) {
    if (!terms) throw std::invalid_argument("Ontology requires a term catalog");

    Ontology o;
    o.terms_ = std::move(terms);
    const TermMap& catalog = *o.terms_;

    for (const auto& term : catalog) o.graph_.addVertex(term.id);
    o.available_subsets_ = catalog.availableSubsets();

    OntologyBuildReport& report = o.report_;
    std::unordered_set<TermID> missing;

    for (const auto& term : catalog) {
        for (const auto& parent : term.parents) {
            if (parent.related == term.id) {
                report.self_loops++;
                continue;
            }
            if (!catalog.contains(parent.related)) {
                report.skipped_edges++;
                if (missing.insert(parent.related).second) report.missing_parents.push_back(parent.related);
                continue;
            }
            // One edge per ordered pair; the first declared relation wins
            if (o.graph_.hasEdge(parent.related, term.id)) continue;
            o.graph_.addEdge(parent.related, term.id, parent.relation);
        }
    }

    o.assignLevel1TermsAndFixRoot(config.log_build_report);

    report.terms = catalog.size();
    report.edges = o.graph_.edgeCount();
    report.level1_terms = o.level1_terms_.size();
    report.artificial_root = o.artificial_root_ != nullptr;

    if (config.log_build_report) {
        auto log = logging::get();
        if (report.self_loops > 0 || report.skipped_edges > 0) {
            log->info("Ignored {} self-loops; skipped {} edges to {} undefined parent terms",
                      report.self_loops, report.skipped_edges, report.missing_parents.size());
        }
        log->debug("Built ontology: {} terms, {} edges, {} level-1 terms", report.terms,
                   report.edges, report.level1_terms);
    }

    if (!config.relevant_subset.empty()) o.setRelevantSubset(config.relevant_subset);
    if (!config.relevant_subontology.empty()) o.setRelevantSubontology(config.relevant_subontology);
    return o;
}

Ontology Ontology::derive(Graph graph) const {
    Ontology o;
    o.terms_ = terms_;
    o.graph_ = std::move(graph);
    o.available_subsets_ = available_subsets_;
    if (root_ && o.graph_.containsVertex(*root_)) {
        o.root_ = root_;
        o.artificial_root_ = artificial_root_;
    }

    o.assignLevel1TermsAndFixRoot(false);

    o.report_.terms = o.graph_.vertexCount();
    o.report_.edges = o.graph_.edgeCount();
    o.report_.level1_terms = o.level1_terms_.size();
    o.report_.artificial_root = o.artificial_root_ != nullptr;
    return o;
}

void Ontology::assignLevel1TermsAndFixRoot(bool log_summary) {
    level1_terms_.clear();

    for (const TermID& id : graph_.getVertices()) {
        if (graph_.inDegree(id) != 0) continue;
        // An artificial root inherited from the source ontology is never level 1
        if (artificial_root_ && artificial_root_->id == id) continue;
        const Term* t = terms_->get(id);
        if (t && t->obsolete) continue;
        level1_terms_.push_back(id);
    }

    if (level1_terms_.size() > 1) {
        std::set<std::string> names;
        std::string listing;
        for (const TermID& id : level1_terms_) {
            const Term* t = terms_->get(id);
            std::string name = t ? t->name : id.toString();
            names.insert(toLower(name));
            if (!listing.empty()) listing += ", ";
            listing += "\"" + name + "\"";
        }

        auto root = std::make_shared<Term>();
        root->id = TermID(level1_terms_.front().prefix, 0);
        root->name = level1_terms_.size() == 3 && names == kGeneOntologyLevel1Names ? "Gene Ontology" : "root";
        root->subsets = available_subsets_;

        if (graph_.containsVertex(root->id))
            throw std::runtime_error("Cannot add artificial root: " + root->id.toString() + " is already a term");

        graph_.addVertex(root->id);
        for (const TermID& id : level1_terms_) graph_.addEdge(root->id, id, RelationType::UNKNOWN);

        if (log_summary) {
            logging::get()->info("Ontology contains multiple level-one terms: {}. Adding artificial root term \"{}\"",
                                 listing, root->id.toString());
        }

        root_ = root->id;
        artificial_root_ = std::move(root);
    } else if (!root_ && level1_terms_.size() == 1) {
        root_ = level1_terms_.front();
        if (log_summary) logging::get()->debug("Ontology contains a single level-one term ({})", root_->toString());
    }
}

// ─── Term lookup ───────────────────────────────────────────────

const Term* Ontology::getTerm(const TermID& id) const {
    if (!graph_.containsVertex(id)) return nullptr;
    if (artificial_root_ && artificial_root_->id == id) return artificial_root_.get();
    return terms_->get(id);
}

const Term* Ontology::getTerm(const std::string& id) const {
    auto parsed = TermID::tryParse(id);
    return parsed ? getTerm(*parsed) : nullptr;
}

const Term* Ontology::getTermIncludingAlternatives(const std::string& id) const {
    if (const Term* term = getTerm(id)) return term;

    auto parsed = TermID::tryParse(id);
    if (!parsed) return nullptr;

    const auto& index = alternatives_->getOrInit(
        [this] { return TermPropertyMap<TermID>(*terms_, alternativeIdsOf); });
    return index.get(*parsed);
}

int Ontology::maximumTermID() const {
    int max_id = 0;
    for (const auto& term : *terms_) max_id = std::max(max_id, term.id.id);
    return max_id;
}

// ─── Root ──────────────────────────────────────────────────────

bool Ontology::isArtificialRootTerm(const TermID& id) const {
    return isRootTerm(id) &&
           std::find(level1_terms_.begin(), level1_terms_.end(), id) == level1_terms_.end();
}

const Term& Ontology::getRootTerm() const {
    if (!root_) throw std::logic_error("Ontology has no root term");
    if (artificial_root_ && artificial_root_->id == *root_) return *artificial_root_;
    const Term* term = terms_->get(*root_);
    if (!term) throw std::logic_error("Root term not in catalog: " + root_->toString());
    return *term;
}

std::vector<const Term*> Ontology::getLevel1Terms() const {
    std::vector<const Term*> result;
    for (const TermID& id : level1_terms_) result.push_back(getTerm(id));
    return result;
}

// ─── Structure ─────────────────────────────────────────────────

std::vector<TermID> Ontology::getTermChildren(const TermID& id) const {
    return graph_.getChildNodes(id);
}

std::vector<TermID> Ontology::getTermParents(const TermID& id) const {
    if (isRootTerm(id)) return {};
    return graph_.getParentNodes(id);
}

std::vector<ParentTermID> Ontology::getTermParentsWithRelation(const TermID& id) const {
    std::vector<ParentTermID> result;
    if (isRootTerm(id)) return result;
    for (const auto& e : graph_.getInEdges(id)) result.push_back(ParentTermID{e.source, e.data});
    return result;
}

std::optional<RelationType> Ontology::getDirectRelation(const TermID& parent, const TermID& term) const {
    for (const auto& p : getTermParentsWithRelation(term)) {
        if (p.related == parent) return p.relation;
    }
    return std::nullopt;
}

std::vector<TermID> Ontology::getTermsSiblings(const TermID& id) const {
    std::vector<TermID> siblings;
    std::unordered_set<TermID> seen{id};
    for (const TermID& p : getTermParents(id)) {
        for (const TermID& c : getTermChildren(p)) {
            if (seen.insert(c).second) siblings.push_back(c);
        }
    }
    return siblings;
}

std::vector<TermID> Ontology::getLeafTermIDs() const {
    std::vector<TermID> leaves;
    for (const TermID& id : graph_.getVertices()) {
        if (graph_.outDegree(id) == 0) leaves.push_back(id);
    }
    return leaves;
}

std::vector<TermID> Ontology::getTermsInTopologicalOrder() const {
    return graph_.topologicalOrder();
}

bool Ontology::existsPath(const TermID& source, const TermID& dest) const {
    if (isRootTerm(dest)) return isRootTerm(source);
    return graph_.existsPath(source, dest);
}

void Ontology::walk(const std::vector<TermID>& ids, bool to_source, const TermIDVisitor& visitor,
                    const std::optional<RelationSet>& relations_to_follow) const {
    Graph::EdgeFilter follow;
    if (relations_to_follow) {
        follow = [&relations_to_follow](const Graph::EdgeType& e) {
            return relations_to_follow->count(meaning(e.data)) > 0;
        };
    }
    graph_.bfs(ids, to_source, visitor, follow);
}

void Ontology::walkToSource(const TermID& id, const TermIDVisitor& visitor) const {
    walk({id}, true, visitor, std::nullopt);
}

void Ontology::walkToSource(const std::vector<TermID>& ids, const TermIDVisitor& visitor,
                            const std::optional<RelationSet>& relations_to_follow) const {
    walk(ids, true, visitor, relations_to_follow);
}

void Ontology::walkToSinks(const TermID& id, const TermIDVisitor& visitor) const {
    walk({id}, false, visitor, std::nullopt);
}

void Ontology::walkToSinks(const std::vector<TermID>& ids, const TermIDVisitor& visitor,
                           const std::optional<RelationSet>& relations_to_follow) const {
    walk(ids, false, visitor, relations_to_follow);
}

std::unordered_set<TermID> Ontology::getTermsOfInducedGraph(const std::optional<TermID>& root,
                                                            const TermID& id) const {
    std::unordered_set<TermID> nodes;
    bool restricted = root && !isRootTerm(*root);

    walkToSource(id, [&](const TermID& t) {
        if (!restricted || t == *root || existsPath(*root, t)) nodes.insert(t);
        return true;
    });
    return nodes;
}

std::vector<TermID> Ontology::getSharedParents(const TermID& t1, const TermID& t2) const {
    std::unordered_set<TermID> p1 = getTermsOfInducedGraph(std::nullopt, t1);
    std::vector<TermID> shared;
    walkToSource(t2, [&](const TermID& t) {
        if (p1.count(t)) shared.push_back(t);
        return true;
    });
    return shared;
}

Ontology Ontology::getInducedGraph(const std::vector<TermID>& ids) const {
    Graph::VertexSet all;
    for (const TermID& id : ids) {
        auto induced = getTermsOfInducedGraph(std::nullopt, id);
        all.insert(induced.begin(), induced.end());
    }
    return derive(graph_.subGraph(all));
}

TermLevels Ontology::getTermLevels(const std::unordered_set<TermID>& ids) const {
    TermLevels levels;
    auto sweep = [&](const Ontology& o) {
        if (!o.root_) return;
        o.graph_.singleSourceLongestPath(*o.root_,
            [&](const TermID& vertex, const std::vector<TermID>&, int distance) {
                if (ids.count(vertex)) levels.putLevel(vertex, distance);
                return true;
            });
    };

    if ((relevant_subontology_ && !isRootTerm(*relevant_subontology_)) || relevant_subset_) {
        Ontology relevant = getOntologyOfRelevantTerms();
        sweep(relevant);
    } else {
        sweep(*this);
    }
    return levels;
}

// ─── Relevance ─────────────────────────────────────────────────

void Ontology::setRelevantSubset(const std::string& name) {
    for (const auto& s : available_subsets_) {
        if (s.name == name) {
            relevant_subset_ = s;
            return;
        }
    }
    relevant_subset_.reset();
    throw std::invalid_argument("Subset \"" + name + "\" couldn't be found");
}

void Ontology::setRelevantSubontology(const std::string& name) {
    for (const auto& term : *terms_) {
        if (term.name == name) {
            relevant_subontology_ = term.id;
            return;
        }
    }
    if (artificial_root_ && artificial_root_->name == name) {
        relevant_subontology_ = artificial_root_->id;
        return;
    }
    throw std::invalid_argument("Subontology \"" + name + "\" couldn't be found");
}

TermID Ontology::getRelevantSubontology() const {
    if (relevant_subontology_) return *relevant_subontology_;
    return getRootTerm().id;
}

bool Ontology::isRelevantTerm(const Term& term) const {
    return isRelevantTerm(term, relevant_subset_, relevant_subontology_);
}

bool Ontology::isRelevantTerm(const Term& term, const std::optional<Subset>& subset,
                              const std::optional<TermID>& subontology) const {
    if (subset && !term.hasSubset(*subset)) return false;

    if (subontology && term.id != *subontology) {
        if (!termExists(term.id) || !existsPath(*subontology, term.id)) return false;
    }
    return true;
}

bool Ontology::isRelevantTermID(const TermID& id) const {
    const Term* term = getTerm(id);
    return term && isRelevantTerm(*term);
}

std::vector<TermID> Ontology::filterRelevant(const std::vector<TermID>& ids) const {
    std::vector<TermID> relevant;
    for (const TermID& id : ids) {
        if (isRelevantTermID(id)) relevant.push_back(id);
    }
    return relevant;
}

Ontology Ontology::getOntologyOfRelevantTerms() const {
    return getOntologyOfRelevantTerms(relevant_subset_, relevant_subontology_);
}

Ontology Ontology::getOntologyOfRelevantTerms(const std::optional<Subset>& subset,
                                              const std::optional<TermID>& subontology) const {
    Graph::VertexSet relevant;
    for (const TermID& id : graph_.getVertices()) {
        const Term* term = getTerm(id);
        if (term && isRelevantTerm(*term, subset, subontology)) relevant.insert(id);
    }
    return derive(graph_.pathMaintainingSubGraph(relevant, mergeRelations));
}

// ─── Redundancy ────────────────────────────────────────────────

std::optional<TermID> Ontology::findARedundantISARelation(const TermID& id) const {
    std::vector<TermID> parents = getTermParents(id);
    size_t induced_size = getTermsOfInducedGraph(std::nullopt, id).size();

    // p is redundant if the other parents alone reach everything above id
    for (const TermID& p : parents) {
        std::unordered_set<TermID> without_p;
        for (const TermID& p2 : parents) {
            if (p2 == p) continue;
            auto induced = getTermsOfInducedGraph(std::nullopt, p2);
            without_p.insert(induced.begin(), induced.end());
        }
        if (without_p.size() + 1 == induced_size) return p;
    }
    return std::nullopt;
}

std::vector<RedundantRelation> Ontology::findRedundantISARelations() const {
    std::vector<RedundantRelation> found;
    auto log = logging::get();

    for (const TermID& id : graph_.getVertices()) {
        auto redundant = findARedundantISARelation(id);
        if (!redundant) continue;

        found.push_back(RedundantRelation{id, *redundant});
        const Term* term = getTerm(id);
        const Term* parent = getTerm(*redundant);
        log->info("{} ({}) -> {} ({})", term ? term->name : "", id.toString(),
                  parent ? parent->name : "", redundant->toString());
    }
    return found;
}

// ─── Mutation ──────────────────────────────────────────────────

void Ontology::mergeTerms(const TermID& representative, const std::vector<TermID>& equivalents) {
    if (!graph_.containsVertex(representative))
        throw std::runtime_error("Term not in ontology: " + representative.toString());
    if (isArtificialRootTerm(representative))
        throw std::invalid_argument("Cannot merge into the artificial root " + representative.toString());

    std::vector<TermID> merged;
    std::unordered_set<TermID> seen;
    for (const TermID& eq : equivalents) {
        if (!graph_.containsVertex(eq))
            throw std::runtime_error("Term not in ontology: " + eq.toString());
        if (eq == representative || !seen.insert(eq).second) continue;
        if (isRootTerm(eq))
            throw std::invalid_argument("Cannot merge away the root term " + eq.toString());
        merged.push_back(eq);
    }
    if (merged.empty()) return;

    // Alternates change from here on; rebuild the index on next use
    try {
        for (const TermID& eq : merged) terms_->addAlternativeId(representative, eq);
        graph_.mergeVertices(representative, merged);
    } catch (const std::exception&) {
        alternatives_->reset();
        throw;
    }
    alternatives_->reset();
}

// ─── Views ─────────────────────────────────────────────────────

SlimDirectedGraphView<const Term*> Ontology::getSlimGraphView() const {
    return SlimDirectedGraphView<const Term*>::create(graph_, [this](const TermID& id) { return getTerm(id); });
}

SlimDirectedGraphView<TermID> Ontology::getTermIDSlimGraphView() const {
    return SlimDirectedGraphView<TermID>::create(graph_);
}

} // namespace ontograph
