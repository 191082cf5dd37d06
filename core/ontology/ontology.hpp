#pragma once

#include "graph/directed_graph.hpp"
#include "graph/slim_graph_view.hpp"
#include "ontology/relation.hpp"
#include "ontology/term.hpp"
#include "ontology/term_levels.hpp"
#include "ontology/term_map.hpp"
#include "ontology/term_property_map.hpp"
#include "util/once_cell.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace ontograph {

struct OntologyConfig {
    std::string relevant_subset;        // empty: no subset filter
    std::string relevant_subontology;   // empty: whole ontology
    bool log_build_report = true;
};

/// Diagnostics collected while building an ontology from a term catalog.
struct OntologyBuildReport {
    size_t terms = 0;
    size_t edges = 0;
    size_t skipped_edges = 0;               // parent relations to unknown terms
    size_t self_loops = 0;                  // terms declaring themselves as parent
    std::vector<TermID> missing_parents;    // distinct unknown parent ids
    size_t level1_terms = 0;
    bool artificial_root = false;
};

/// A parent relation that is implied by another path to the term.
struct RedundantRelation {
    TermID term;
    TermID parent;
};

// ─── Ontology ──────────────────────────────────────────────────
// Term DAG built from a term catalog. Edges point from parent to child
// and carry the relation type. After construction the graph has a single
// root, either a real top-level term or a synthesized artificial root.
//
// Derived ontologies (induced, relevant-terms) share the catalog with
// the ontology they came from.

class Ontology {
public:
    using Graph = DirectedGraph<TermID, RelationType>;
    using TermIDVisitor = std::function<bool(const TermID&)>;
    using RelationSet = std::unordered_set<RelationMeaning>;

    /// Builds the term graph from the catalog and fixes the root.
    static Ontology create(std::shared_ptr<TermMap> terms, const OntologyConfig& config = {});

    Ontology(Ontology&&) = default;
    Ontology& operator=(Ontology&&) = default;

    const Graph& graph() const { return graph_; }
    const TermMap& termMap() const { return *terms_; }
    const OntologyBuildReport& buildReport() const { return report_; }
    const std::vector<Subset>& getAvailableSubsets() const { return available_subsets_; }

    // ── Term lookup ──

    /// The term if it is a vertex of this ontology (or the artificial
    /// root), nullptr otherwise.
    const Term* getTerm(const TermID& id) const;
    const Term* getTerm(const std::string& id) const;

    /// Like getTerm(), but falls back to alternate ids. The alternate index
    /// is built on the first fallback.
    const Term* getTermIncludingAlternatives(const std::string& id) const;
    bool alternativeIndexBuilt() const { return alternatives_->initialized(); }

    bool termExists(const TermID& id) const { return graph_.containsVertex(id); }
    size_t getNumberOfTerms() const { return graph_.vertexCount(); }
    std::vector<TermID> termIDs() const { return graph_.getVertices(); }

    /// Highest numeric id used in the catalog.
    int maximumTermID() const;

    // ── Root ──
    bool isRootTerm(const TermID& id) const { return root_ && *root_ == id; }
    bool isArtificialRootTerm(const TermID& id) const;

    /// Throws std::logic_error if the ontology has no root (empty graph).
    const Term& getRootTerm() const;

    std::vector<const Term*> getLevel1Terms() const;
    const std::vector<TermID>& getLevel1TermIDs() const { return level1_terms_; }

    // ── Structure ──
    std::vector<TermID> getTermChildren(const TermID& id) const;

    /// Direct parents; always empty for the root.
    std::vector<TermID> getTermParents(const TermID& id) const;
    std::vector<ParentTermID> getTermParentsWithRelation(const TermID& id) const;
    std::optional<RelationType> getDirectRelation(const TermID& parent, const TermID& term) const;

    /// Children of the parents of id, without id itself.
    std::vector<TermID> getTermsSiblings(const TermID& id) const;

    std::vector<TermID> getLeafTermIDs() const;
    std::vector<TermID> getTermsInTopologicalOrder() const;

    /// True if a path leads from source to dest. The root is only
    /// reachable from itself.
    bool existsPath(const TermID& source, const TermID& dest) const;

    /// Walks towards the root starting with (and visiting) the given terms.
    void walkToSource(const TermID& id, const TermIDVisitor& visitor) const;
    void walkToSource(const std::vector<TermID>& ids, const TermIDVisitor& visitor,
                      const std::optional<RelationSet>& relations_to_follow = std::nullopt) const;

    /// Walks away from the root starting with (and visiting) the given terms.
    void walkToSinks(const TermID& id, const TermIDVisitor& visitor) const;
    void walkToSinks(const std::vector<TermID>& ids, const TermIDVisitor& visitor,
                     const std::optional<RelationSet>& relations_to_follow = std::nullopt) const;

    /// Ancestors of id (inclusive). With a root other than the ontology
    /// root, only ancestors reachable from that root are kept.
    std::unordered_set<TermID> getTermsOfInducedGraph(const std::optional<TermID>& root,
                                                      const TermID& id) const;

    /// Ancestors shared by t1 and t2.
    std::vector<TermID> getSharedParents(const TermID& t1, const TermID& t2) const;

    /// Ontology over the union of the ancestor sets of the given terms.
    Ontology getInducedGraph(const std::vector<TermID>& ids) const;

    /// Longest-path distance from the root for the given terms. Uses the
    /// ontology of relevant terms when a relevance filter is set.
    TermLevels getTermLevels(const std::unordered_set<TermID>& ids) const;

    // ── Relevance ──

    /// Throws std::invalid_argument if no such subset exists.
    void setRelevantSubset(const std::string& name);
    void clearRelevantSubset() { relevant_subset_.reset(); }
    const std::optional<Subset>& getRelevantSubset() const { return relevant_subset_; }

    /// Selects the term with the given name. Throws std::invalid_argument
    /// if there is none.
    void setRelevantSubontology(const std::string& name);
    void clearRelevantSubontology() { relevant_subontology_.reset(); }

    /// The relevant subontology term, the root if none is set.
    TermID getRelevantSubontology() const;

    bool isRelevantTerm(const Term& term) const;
    bool isRelevantTerm(const Term& term, const std::optional<Subset>& subset,
                        const std::optional<TermID>& subontology) const;
    bool isRelevantTermID(const TermID& id) const;
    std::vector<TermID> filterRelevant(const std::vector<TermID>& ids) const;

    /// Reduced ontology over the relevant terms that keeps their
    /// reachability.
    Ontology getOntologyOfRelevantTerms() const;
    Ontology getOntologyOfRelevantTerms(const std::optional<Subset>& subset,
                                        const std::optional<TermID>& subontology) const;

    // ── Redundancy ──
    std::optional<TermID> findARedundantISARelation(const TermID& id) const;
    std::vector<RedundantRelation> findRedundantISARelations() const;

    // ── Mutation ──

    /// Merges the equivalent terms into representative. Their ids become
    /// alternate ids of the representative. Throws std::invalid_argument
    /// before any change if the root would be merged away or the
    /// representative is the artificial root.
    void mergeTerms(const TermID& representative, const std::vector<TermID>& equivalents);

    // ── Views ──
    SlimDirectedGraphView<const Term*> getSlimGraphView() const;
    SlimDirectedGraphView<TermID> getTermIDSlimGraphView() const;

private:
    Ontology();

    /// Empty ontology sharing catalog, subsets and artificial root.
    Ontology derive(Graph graph) const;

    void assignLevel1TermsAndFixRoot(bool log_summary);
    void walk(const std::vector<TermID>& ids, bool to_source, const TermIDVisitor& visitor,
              const std::optional<RelationSet>& relations_to_follow) const;

    std::shared_ptr<TermMap> terms_;
    Graph graph_;
    std::optional<TermID> root_;
    std::shared_ptr<const Term> artificial_root_;
    std::vector<TermID> level1_terms_;
    std::vector<Subset> available_subsets_;
    std::optional<Subset> relevant_subset_;
    std::optional<TermID> relevant_subontology_;
    OntologyBuildReport report_;
    std::unique_ptr<OnceCell<TermPropertyMap<TermID>>> alternatives_;
};

/// Combines the relations of collapsed edges: IS_A if all are IS_A, the
/// single other relation type if there is exactly one, UNKNOWN otherwise.
RelationType mergeRelations(const std::vector<RelationType>& relations);

} // namespace ontograph
