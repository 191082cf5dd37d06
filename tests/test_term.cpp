#include <gtest/gtest.h>
#include "ontology/relation.hpp"
#include "ontology/term_levels.hpp"
#include "ontology/term_map.hpp"
#include "ontology/term_property_map.hpp"

#include <unordered_set>

using namespace ontograph;

namespace {

Term makeTerm(int id, const std::string& name, std::vector<TermID> alternatives = {}) {
    Term t;
    t.id = TermID("GO", id);
    t.name = name;
    t.alternatives = std::move(alternatives);
    return t;
}

} // namespace

// ─── TermID ────────────────────────────────────────────────────

TEST(TermIDTest, FormatsWithSevenDigits) {
    EXPECT_EQ(TermID("GO", 8150).toString(), "GO:0008150");
    EXPECT_EQ(TermID("HP", 0).toString(), "HP:0000000");
}

TEST(TermIDTest, ParseRoundTrip) {
    TermID id = TermID::parse("GO:0008150");
    EXPECT_EQ(id.prefix, "GO");
    EXPECT_EQ(id.id, 8150);
    EXPECT_EQ(TermID::parse(id.toString()), id);
}

TEST(TermIDTest, MalformedIdentifiers) {
    EXPECT_FALSE(TermID::tryParse("GO0008150").has_value());
    EXPECT_FALSE(TermID::tryParse(":123").has_value());
    EXPECT_FALSE(TermID::tryParse("GO:").has_value());
    EXPECT_FALSE(TermID::tryParse("GO:12a").has_value());
    EXPECT_FALSE(TermID::tryParse("GO:99999999999").has_value());
    EXPECT_THROW(TermID::parse("nonsense"), std::invalid_argument);
}

TEST(TermIDTest, OrderingAndHashing) {
    EXPECT_LT(TermID("GO", 5), TermID("GO", 6));
    EXPECT_LT(TermID("GO", 9), TermID("HP", 1));
    EXPECT_NE(TermID("GO", 1), TermID("HP", 1));

    std::unordered_set<TermID> ids{TermID("GO", 1), TermID("GO", 1), TermID("HP", 1)};
    EXPECT_EQ(ids.size(), 2u);
}

// ─── Relations ─────────────────────────────────────────────────

TEST(RelationTest, MeaningOfRelationTypes) {
    EXPECT_EQ(meaning(RelationType::IS_A), RelationMeaning::IS_A);
    EXPECT_EQ(meaning(RelationType::PART_OF), RelationMeaning::PART_OF_A);
    EXPECT_EQ(meaning(RelationType::REGULATES), RelationMeaning::REGULATES);
    EXPECT_EQ(meaning(RelationType::UNKNOWN), RelationMeaning::UNKNOWN);
}

TEST(RelationTest, NamesRoundTrip) {
    EXPECT_EQ(relationTypeFromString("part_of"), RelationType::PART_OF);
    EXPECT_EQ(relationTypeFromString("regulates"), RelationType::REGULATES);
    EXPECT_EQ(relationTypeFromString("has_part"), RelationType::UNKNOWN);
    EXPECT_EQ(relationTypeFromString(toString(RelationType::NEGATIVELY_REGULATES)),
              RelationType::NEGATIVELY_REGULATES);
    EXPECT_EQ(toString(RelationMeaning::PART_OF_A), "PART_OF_A");
}

// ─── TermMap ───────────────────────────────────────────────────

TEST(TermMapTest, LookupByIdStringAndIndex) {
    TermMap map({makeTerm(1, "one"), makeTerm(2, "two")});
    ASSERT_EQ(map.size(), 2u);
    ASSERT_NE(map.get(TermID("GO", 2)), nullptr);
    EXPECT_EQ(map.get(TermID("GO", 2))->name, "two");
    EXPECT_EQ(map.get("GO:0000001")->name, "one");
    EXPECT_EQ(map.get("GO:0000003"), nullptr);
    EXPECT_EQ(map.get("garbage"), nullptr);
    EXPECT_EQ(map.indexOf(TermID("GO", 2)), 1u);
    EXPECT_EQ(map.at(0).name, "one");
}

TEST(TermMapTest, RejectsDuplicateIds) {
    TermMap map;
    map.add(makeTerm(1, "one"));
    EXPECT_THROW(map.add(makeTerm(1, "again")), std::invalid_argument);
}

TEST(TermMapTest, AddAlternativeIdSkipsExisting) {
    TermMap map({makeTerm(1, "one", {TermID("GO", 100)})});
    EXPECT_FALSE(map.addAlternativeId(TermID("GO", 1), TermID("GO", 100)));
    EXPECT_TRUE(map.addAlternativeId(TermID("GO", 1), TermID("GO", 101)));
    EXPECT_EQ(map.get(TermID("GO", 1))->alternatives.size(), 2u);
    EXPECT_THROW(map.addAlternativeId(TermID("GO", 9), TermID("GO", 1)), std::runtime_error);
}

TEST(TermMapTest, AvailableSubsetsInFirstSeenOrder) {
    Term a = makeTerm(1, "a");
    a.subsets = {Subset{"slim_b", ""}, Subset{"slim_a", ""}};
    Term b = makeTerm(2, "b");
    b.subsets = {Subset{"slim_a", "other description"}, Subset{"slim_c", ""}};
    TermMap map({a, b});

    auto subsets = map.availableSubsets();
    ASSERT_EQ(subsets.size(), 3u);
    EXPECT_EQ(subsets[0].name, "slim_b");
    EXPECT_EQ(subsets[1].name, "slim_a");
    EXPECT_EQ(subsets[2].name, "slim_c");
}

// ─── TermPropertyMap ───────────────────────────────────────────

TEST(TermPropertyMapTest, FirstKeyWinsAndAmbiguitiesAreCounted) {
    TermMap map({
        makeTerm(1, "one", {TermID("GO", 100), TermID("GO", 101)}),
        makeTerm(2, "two", {TermID("GO", 101), TermID("GO", 102)}),
    });
    TermPropertyMap<TermID> alternatives(map, alternativeIdsOf);

    EXPECT_EQ(alternatives.size(), 3u);
    EXPECT_EQ(alternatives.ambiguities(), 1u);
    EXPECT_EQ(alternatives.getIndex(TermID("GO", 101)), 0u);
    EXPECT_EQ(alternatives.get(TermID("GO", 102))->name, "two");
    EXPECT_FALSE(alternatives.getIndex(TermID("GO", 1)).has_value());
    EXPECT_EQ(alternatives.get(TermID("GO", 999)), nullptr);
}

TEST(TermPropertyMapTest, RepeatedKeyOfSameTermIsNotAmbiguous) {
    TermMap map({makeTerm(1, "one", {TermID("GO", 9), TermID("GO", 9)})});
    TermPropertyMap<TermID> alternatives(map, alternativeIdsOf);
    EXPECT_EQ(alternatives.size(), 1u);
    EXPECT_EQ(alternatives.ambiguities(), 0u);
    EXPECT_EQ(alternatives.getIndex(TermID("GO", 9)), 0u);
}

TEST(TermPropertyMapTest, ArbitraryKeys) {
    TermMap map({makeTerm(1, "nucleus"), makeTerm(2, "membrane"), makeTerm(3, "nucleus")});
    TermPropertyMap<std::string> by_name(map, [](const Term& t) { return std::vector<std::string>{t.name}; });
    EXPECT_EQ(by_name.get("nucleus")->id, TermID("GO", 1));
    EXPECT_EQ(by_name.ambiguities(), 1u);
}

// ─── TermLevels ────────────────────────────────────────────────

TEST(TermLevelsTest, TracksLevelsAndMaximum) {
    TermLevels levels;
    EXPECT_EQ(levels.getMaxLevel(), -1);
    levels.putLevel(TermID("GO", 1), 0);
    levels.putLevel(TermID("GO", 2), 2);
    levels.putLevel(TermID("GO", 3), 2);

    EXPECT_EQ(levels.getTermLevel(TermID("GO", 2)), 2);
    EXPECT_FALSE(levels.getTermLevel(TermID("GO", 4)).has_value());
    EXPECT_EQ(levels.getLevelTermSet(2).size(), 2u);
    EXPECT_TRUE(levels.getLevelTermSet(1).empty());
    EXPECT_EQ(levels.getMaxLevel(), 2);

    levels.putLevel(TermID("GO", 3), 1);
    EXPECT_EQ(levels.getLevelTermSet(2).size(), 1u);
    EXPECT_EQ(levels.getLevelTermSet(1).size(), 1u);
    EXPECT_EQ(levels.size(), 3u);
}
