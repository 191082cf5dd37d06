#include <gtest/gtest.h>
#include "ontology/ontology.hpp"

#include <algorithm>
#include <memory>

using namespace ontograph;

namespace {

TermID go(int id) { return TermID("GO", id); }

ParentTermID isA(int id) { return ParentTermID{go(id), RelationType::IS_A}; }
ParentTermID partOf(int id) { return ParentTermID{go(id), RelationType::PART_OF}; }

Term makeTerm(int id, const std::string& name, std::vector<ParentTermID> parents = {},
              std::vector<Subset> subsets = {}) {
    Term t;
    t.id = go(id);
    t.name = name;
    t.parents = std::move(parents);
    t.subsets = std::move(subsets);
    return t;
}

const Subset kSlim{"goslim", ""};

// 1 biological_process ─ 10 ─ 12 ─(part_of)─ 13, 1 ─ 11 ─ 12, 10 ─ 13
// 2 molecular_function ─ 20
// 3 cellular_component ─(part_of)─ 30 ─ 31
// goslim: 1, 10, 13
std::shared_ptr<TermMap> catalog() {
    return std::make_shared<TermMap>(std::vector<Term>{
        makeTerm(1, "biological_process", {}, {kSlim}),
        makeTerm(2, "molecular_function"),
        makeTerm(3, "cellular_component"),
        makeTerm(10, "ten", {isA(1)}, {kSlim}),
        makeTerm(11, "eleven", {isA(1)}),
        makeTerm(12, "twelve", {isA(10), isA(11)}),
        makeTerm(13, "thirteen", {partOf(12), isA(10)}, {kSlim}),
        makeTerm(20, "twenty", {isA(2)}),
        makeTerm(30, "thirty", {partOf(3)}),
        makeTerm(31, "thirty-one", {isA(30)}),
    });
}

OntologyConfig quiet() {
    OntologyConfig config;
    config.log_build_report = false;
    return config;
}

} // namespace

// ─── Subset ────────────────────────────────────────────────────

TEST(OntologyRelevanceTest, NothingSelectedMeansEverythingRelevant) {
    Ontology o = Ontology::create(catalog(), quiet());
    EXPECT_FALSE(o.getRelevantSubset().has_value());
    EXPECT_EQ(o.getRelevantSubontology(), go(0));
    EXPECT_TRUE(o.isRelevantTermID(go(11)));
    EXPECT_TRUE(o.isRelevantTermID(go(0)));
    EXPECT_FALSE(o.isRelevantTermID(go(4242)));
}

TEST(OntologyRelevanceTest, SubsetFiltersTerms) {
    Ontology o = Ontology::create(catalog(), quiet());
    o.setRelevantSubset("goslim");
    ASSERT_TRUE(o.getRelevantSubset().has_value());
    EXPECT_EQ(o.getRelevantSubset()->name, "goslim");

    EXPECT_TRUE(o.isRelevantTermID(go(10)));
    EXPECT_FALSE(o.isRelevantTermID(go(11)));
    // The artificial root carries every subset
    EXPECT_TRUE(o.isRelevantTermID(go(0)));
    EXPECT_EQ(o.filterRelevant({go(1), go(11), go(13), go(20)}), (std::vector<TermID>{go(1), go(13)}));

    o.clearRelevantSubset();
    EXPECT_TRUE(o.isRelevantTermID(go(11)));
}

TEST(OntologyRelevanceTest, UnknownNamesAreRejected) {
    Ontology o = Ontology::create(catalog(), quiet());
    EXPECT_THROW(o.setRelevantSubset("no_such_slim"), std::invalid_argument);
    EXPECT_FALSE(o.getRelevantSubset().has_value());
    EXPECT_THROW(o.setRelevantSubontology("no_such_term"), std::invalid_argument);

    OntologyConfig config = quiet();
    config.relevant_subset = "no_such_slim";
    EXPECT_THROW(Ontology::create(catalog(), config), std::invalid_argument);
}

TEST(OntologyRelevanceTest, OntologyOfSubsetTermsKeepsReachability) {
    Ontology o = Ontology::create(catalog(), quiet());
    o.setRelevantSubset("goslim");

    Ontology relevant = o.getOntologyOfRelevantTerms();
    std::vector<TermID> ids = relevant.termIDs();
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<TermID>{go(0), go(1), go(10), go(13)}));

    // root → 1 → 10 → 13; the direct 1 → 13 shortcut from compaction is reduced away
    EXPECT_EQ(relevant.graph().edgeCount(), 3u);
    EXPECT_TRUE(relevant.graph().hasEdge(go(10), go(13)));
    EXPECT_FALSE(relevant.graph().hasEdge(go(1), go(13)));
    EXPECT_TRUE(relevant.isRootTerm(go(0)));
    EXPECT_TRUE(relevant.isArtificialRootTerm(go(0)));
}

TEST(OntologyRelevanceTest, LevelsUseRelevantOntology) {
    Ontology o = Ontology::create(catalog(), quiet());
    EXPECT_EQ(o.getTermLevels({go(13)}).getTermLevel(go(13)), 4);

    o.setRelevantSubset("goslim");
    TermLevels levels = o.getTermLevels({go(10), go(13), go(11)});
    EXPECT_EQ(levels.getTermLevel(go(10)), 2);
    EXPECT_EQ(levels.getTermLevel(go(13)), 3);
    EXPECT_FALSE(levels.getTermLevel(go(11)).has_value());
}

// ─── Subontology ───────────────────────────────────────────────

TEST(OntologyRelevanceTest, SubontologyFiltersByReachability) {
    Ontology o = Ontology::create(catalog(), quiet());
    o.setRelevantSubontology("cellular_component");

    EXPECT_EQ(o.getRelevantSubontology(), go(3));
    EXPECT_TRUE(o.isRelevantTermID(go(3)));
    EXPECT_TRUE(o.isRelevantTermID(go(31)));
    EXPECT_FALSE(o.isRelevantTermID(go(12)));
    EXPECT_FALSE(o.isRelevantTermID(go(0)));

    o.clearRelevantSubontology();
    EXPECT_EQ(o.getRelevantSubontology(), go(0));
}

TEST(OntologyRelevanceTest, SubontologyBecomesRootOfRelevantOntology) {
    OntologyConfig config = quiet();
    config.relevant_subontology = "cellular_component";
    Ontology o = Ontology::create(catalog(), config);

    Ontology relevant = o.getOntologyOfRelevantTerms();
    EXPECT_EQ(relevant.getNumberOfTerms(), 3u);
    EXPECT_TRUE(relevant.isRootTerm(go(3)));
    EXPECT_FALSE(relevant.isArtificialRootTerm(go(3)));
    EXPECT_EQ(relevant.getDirectRelation(go(3), go(30)), RelationType::PART_OF);

    TermLevels levels = o.getTermLevels({go(3), go(30), go(31)});
    EXPECT_EQ(levels.getTermLevel(go(3)), 0);
    EXPECT_EQ(levels.getTermLevel(go(30)), 1);
    EXPECT_EQ(levels.getTermLevel(go(31)), 2);
    EXPECT_EQ(levels.getMaxLevel(), 2);
}

TEST(OntologyRelevanceTest, ExplicitFilterOverload) {
    Ontology o = Ontology::create(catalog(), quiet());
    Ontology relevant = o.getOntologyOfRelevantTerms(std::nullopt, go(10));
    std::vector<TermID> ids = relevant.termIDs();
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<TermID>{go(10), go(12), go(13)}));
    EXPECT_TRUE(relevant.isRootTerm(go(10)));
    // 10 → 13 is implied by 10 → 12 → 13
    EXPECT_FALSE(relevant.graph().hasEdge(go(10), go(13)));
}

// ─── Relation merging ──────────────────────────────────────────

TEST(OntologyRelevanceTest, MergeRelations) {
    EXPECT_EQ(mergeRelations({RelationType::IS_A, RelationType::IS_A}), RelationType::IS_A);
    EXPECT_EQ(mergeRelations({RelationType::IS_A, RelationType::PART_OF}), RelationType::PART_OF);
    EXPECT_EQ(mergeRelations({RelationType::PART_OF, RelationType::REGULATES}), RelationType::UNKNOWN);
}
