#include "ontology/relation.hpp"

namespace ontograph {

RelationMeaning meaning(RelationType type) {
    switch (type) {
        case RelationType::IS_A: return RelationMeaning::IS_A;
        case RelationType::PART_OF: return RelationMeaning::PART_OF_A;
        case RelationType::REGULATES: return RelationMeaning::REGULATES;
        case RelationType::POSITIVELY_REGULATES: return RelationMeaning::POSITIVELY_REGULATES;
        case RelationType::NEGATIVELY_REGULATES: return RelationMeaning::NEGATIVELY_REGULATES;
        case RelationType::UNKNOWN: break;
    }
    return RelationMeaning::UNKNOWN;
}

std::string toString(RelationType type) {
    switch (type) {
        case RelationType::IS_A: return "is_a";
        case RelationType::PART_OF: return "part_of";
        case RelationType::REGULATES: return "regulates";
        case RelationType::POSITIVELY_REGULATES: return "positively_regulates";
        case RelationType::NEGATIVELY_REGULATES: return "negatively_regulates";
        case RelationType::UNKNOWN: break;
    }
    return "unknown";
}

std::string toString(RelationMeaning meaning) {
    switch (meaning) {
        case RelationMeaning::IS_A: return "IS_A";
        case RelationMeaning::PART_OF_A: return "PART_OF_A";
        case RelationMeaning::REGULATES: return "REGULATES";
        case RelationMeaning::POSITIVELY_REGULATES: return "POSITIVELY_REGULATES";
        case RelationMeaning::NEGATIVELY_REGULATES: return "NEGATIVELY_REGULATES";
        case RelationMeaning::UNKNOWN: break;
    }
    return "UNKNOWN";
}

RelationType relationTypeFromString(const std::string& name) {
    if (name == "is_a") return RelationType::IS_A;
    if (name == "part_of") return RelationType::PART_OF;
    if (name == "regulates") return RelationType::REGULATES;
    if (name == "positively_regulates") return RelationType::POSITIVELY_REGULATES;
    if (name == "negatively_regulates") return RelationType::NEGATIVELY_REGULATES;
    return RelationType::UNKNOWN;
}

} // namespace ontograph
