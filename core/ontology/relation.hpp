#pragma once

#include <string>

namespace ontograph {

/// Kind of a declared parent relation.
enum class RelationType {
    UNKNOWN,
    IS_A,
    PART_OF,
    REGULATES,
    POSITIVELY_REGULATES,
    NEGATIVELY_REGULATES
};

/// Coarse meaning of a relation, used to pick the edges a filtered walk follows.
enum class RelationMeaning {
    UNKNOWN,
    IS_A,
    PART_OF_A,
    REGULATES,
    POSITIVELY_REGULATES,
    NEGATIVELY_REGULATES
};

RelationMeaning meaning(RelationType type);

/// The relation name as written in ontology files, e.g. "part_of".
std::string toString(RelationType type);
std::string toString(RelationMeaning meaning);

/// Inverse of toString(RelationType). Unrecognised names map to UNKNOWN.
RelationType relationTypeFromString(const std::string& name);

} // namespace ontograph
