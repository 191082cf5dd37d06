// PyBind11 bindings for the ontograph core.
// Exposes the term model, term catalog and ontology queries to Python
// enrichment code.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "ontology/ontology.hpp"
#include "ontology/relation.hpp"
#include "ontology/term.hpp"
#include "ontology/term_id.hpp"
#include "ontology/term_levels.hpp"
#include "ontology/term_map.hpp"
#include "util/log.hpp"

namespace py = pybind11;
using namespace ontograph;

PYBIND11_MODULE(ontograph_bindings, m) {
    m.doc() = "ontograph C++ core bindings";

    // ── Relations ──
    py::enum_<RelationType>(m, "RelationType")
        .value("UNKNOWN", RelationType::UNKNOWN)
        .value("IS_A", RelationType::IS_A)
        .value("PART_OF", RelationType::PART_OF)
        .value("REGULATES", RelationType::REGULATES)
        .value("POSITIVELY_REGULATES", RelationType::POSITIVELY_REGULATES)
        .value("NEGATIVELY_REGULATES", RelationType::NEGATIVELY_REGULATES);

    py::enum_<RelationMeaning>(m, "RelationMeaning")
        .value("UNKNOWN", RelationMeaning::UNKNOWN)
        .value("IS_A", RelationMeaning::IS_A)
        .value("PART_OF_A", RelationMeaning::PART_OF_A)
        .value("REGULATES", RelationMeaning::REGULATES)
        .value("POSITIVELY_REGULATES", RelationMeaning::POSITIVELY_REGULATES)
        .value("NEGATIVELY_REGULATES", RelationMeaning::NEGATIVELY_REGULATES);

    m.def("meaning", &meaning);
    m.def("relation_type_from_string", &relationTypeFromString);

    // ── TermID ──
    py::class_<TermID>(m, "TermID")
        .def(py::init<>())
        .def(py::init<std::string, int>(), py::arg("prefix"), py::arg("id"))
        .def_static("parse", &TermID::parse)
        .def_readwrite("prefix", &TermID::prefix)
        .def_readwrite("id", &TermID::id)
        .def("__str__", &TermID::toString)
        .def("__repr__", [](const TermID& t) { return "TermID('" + t.toString() + "')"; })
        .def("__eq__", [](const TermID& a, const TermID& b) { return a == b; })
        .def("__lt__", [](const TermID& a, const TermID& b) { return a < b; })
        .def("__hash__", [](const TermID& t) { return std::hash<TermID>{}(t); });

    // ── Term model ──
    py::class_<Subset>(m, "Subset")
        .def(py::init<>())
        .def_readwrite("name", &Subset::name)
        .def_readwrite("description", &Subset::description);

    py::class_<ParentTermID>(m, "ParentTermID")
        .def(py::init<>())
        .def(py::init([](TermID related, RelationType relation) {
                 return ParentTermID{std::move(related), relation};
             }),
             py::arg("related"), py::arg("relation") = RelationType::IS_A)
        .def_readwrite("related", &ParentTermID::related)
        .def_readwrite("relation", &ParentTermID::relation);

    py::class_<Term>(m, "Term")
        .def(py::init<>())
        .def_readwrite("id", &Term::id)
        .def_readwrite("name", &Term::name)
        .def_readwrite("name_space", &Term::name_space)
        .def_readwrite("definition", &Term::definition)
        .def_readwrite("parents", &Term::parents)
        .def_readwrite("subsets", &Term::subsets)
        .def_readwrite("alternatives", &Term::alternatives)
        .def_readwrite("obsolete", &Term::obsolete);

    // ── TermMap ──
    py::class_<TermMap, std::shared_ptr<TermMap>>(m, "TermMap")
        .def(py::init<>())
        .def(py::init<std::vector<Term>>())
        .def("add", &TermMap::add)
        .def("get", py::overload_cast<const std::string&>(&TermMap::get, py::const_),
             py::return_value_policy::reference_internal)
        .def("contains", &TermMap::contains)
        .def("available_subsets", &TermMap::availableSubsets)
        .def("__len__", &TermMap::size);

    // ── Ontology ──
    py::class_<OntologyConfig>(m, "OntologyConfig")
        .def(py::init<>())
        .def_readwrite("relevant_subset", &OntologyConfig::relevant_subset)
        .def_readwrite("relevant_subontology", &OntologyConfig::relevant_subontology)
        .def_readwrite("log_build_report", &OntologyConfig::log_build_report);

    py::class_<OntologyBuildReport>(m, "OntologyBuildReport")
        .def_readonly("terms", &OntologyBuildReport::terms)
        .def_readonly("edges", &OntologyBuildReport::edges)
        .def_readonly("skipped_edges", &OntologyBuildReport::skipped_edges)
        .def_readonly("self_loops", &OntologyBuildReport::self_loops)
        .def_readonly("missing_parents", &OntologyBuildReport::missing_parents)
        .def_readonly("level1_terms", &OntologyBuildReport::level1_terms)
        .def_readonly("artificial_root", &OntologyBuildReport::artificial_root);

    py::class_<TermLevels>(m, "TermLevels")
        .def("get_term_level", &TermLevels::getTermLevel)
        .def("get_level_term_set", &TermLevels::getLevelTermSet)
        .def("get_max_level", &TermLevels::getMaxLevel);

    py::class_<RedundantRelation>(m, "RedundantRelation")
        .def_readonly("term", &RedundantRelation::term)
        .def_readonly("parent", &RedundantRelation::parent);

    using SlimTermIDView = SlimDirectedGraphView<TermID>;
    py::class_<SlimTermIDView>(m, "SlimTermIDGraphView")
        .def("number_of_vertices", &SlimTermIDView::getNumberOfVertices)
        .def("vertex", &SlimTermIDView::getVertex)
        .def("vertex_index", &SlimTermIDView::getVertexIndex)
        .def("parents", &SlimTermIDView::getParents)
        .def("children", &SlimTermIDView::getChildren)
        .def("ancestors", &SlimTermIDView::getAncestors)
        .def("descendants", &SlimTermIDView::getDescendants)
        .def("is_ancestor", &SlimTermIDView::isAncestor);

    py::class_<Ontology>(m, "Ontology")
        .def_static("create", &Ontology::create,
                    py::arg("terms"), py::arg("config") = OntologyConfig{})
        .def("build_report", &Ontology::buildReport, py::return_value_policy::reference_internal)
        .def("get_term", py::overload_cast<const std::string&>(&Ontology::getTerm, py::const_),
             py::return_value_policy::reference_internal)
        .def("get_term_including_alternatives", &Ontology::getTermIncludingAlternatives,
             py::return_value_policy::reference_internal)
        .def("term_exists", &Ontology::termExists)
        .def("term_ids", &Ontology::termIDs)
        .def("number_of_terms", &Ontology::getNumberOfTerms)
        .def("root_term", &Ontology::getRootTerm, py::return_value_policy::reference_internal)
        .def("is_root_term", &Ontology::isRootTerm)
        .def("is_artificial_root_term", &Ontology::isArtificialRootTerm)
        .def("level1_term_ids", &Ontology::getLevel1TermIDs)
        .def("children", &Ontology::getTermChildren)
        .def("parents", &Ontology::getTermParents)
        .def("siblings", &Ontology::getTermsSiblings)
        .def("exists_path", &Ontology::existsPath)
        .def("walk_to_source",
             py::overload_cast<const std::vector<TermID>&, const Ontology::TermIDVisitor&,
                               const std::optional<Ontology::RelationSet>&>(
                 &Ontology::walkToSource, py::const_),
             py::arg("ids"), py::arg("visitor"), py::arg("relations_to_follow") = py::none())
        .def("induced_terms", &Ontology::getTermsOfInducedGraph,
             py::arg("root"), py::arg("id"))
        .def("shared_parents", &Ontology::getSharedParents)
        .def("term_levels", &Ontology::getTermLevels)
        .def("set_relevant_subset", &Ontology::setRelevantSubset)
        .def("set_relevant_subontology", &Ontology::setRelevantSubontology)
        .def("is_relevant_term_id", &Ontology::isRelevantTermID)
        .def("filter_relevant", &Ontology::filterRelevant)
        .def("ontology_of_relevant_terms",
             py::overload_cast<>(&Ontology::getOntologyOfRelevantTerms, py::const_))
        .def("induced_graph", &Ontology::getInducedGraph)
        .def("find_redundant_is_a_relations", &Ontology::findRedundantISARelations)
        .def("merge_terms", &Ontology::mergeTerms)
        .def("slim_graph_view", &Ontology::getTermIDSlimGraphView);

    // ── Logging ──
    m.def("set_log_level", [](const std::string& level) {
        LoggingConfig config;
        config.level = spdlog::level::from_str(level);
        logging::configure(config);
    });
}
