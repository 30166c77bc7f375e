// PyBind11 bindings for the malgraph core.
// Exposes the language/model collaborators, the attack graph store, graph
// generation, reachability and pattern search to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DMALGRAPH_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "attackgraph/attack_graph.hpp"
#include "attackgraph/graph_builder.hpp"
#include "attackgraph/graph_serializer.hpp"
#include "attackgraph/reachability.hpp"
#include "common/errors.hpp"
#include "language/language_spec.hpp"
#include "model/model.hpp"
#include "patterns/search_pattern.hpp"

namespace py = pybind11;

PYBIND11_MODULE(malgraph_bindings, m) {
    m.doc() = "malgraph attack graph engine bindings";

    py::register_exception<malgraph::MalGraphError>(m, "MalGraphError");
    py::register_exception<malgraph::StepExpressionError>(m, "StepExpressionError");

    // ── StepType ──
    py::enum_<malgraph::StepType>(m, "StepType")
        .value("OR", malgraph::StepType::Or)
        .value("AND", malgraph::StepType::And)
        .value("DEFENSE", malgraph::StepType::Defense)
        .value("EXIST", malgraph::StepType::Exist)
        .value("NOT_EXIST", malgraph::StepType::NotExist);

    // ── LanguageSpec ──
    py::class_<malgraph::LanguageQuery>(m, "LanguageQuery");

    py::class_<malgraph::LanguageSpec, malgraph::LanguageQuery>(m, "LanguageSpec")
        .def_static("load_from_file", &malgraph::LanguageSpec::loadFromFile)
        .def("has_asset_type", &malgraph::LanguageSpec::hasAssetType)
        .def("extends_asset", &malgraph::LanguageSpec::extendsAsset);

    // ── Asset / Model ──
    py::class_<malgraph::Asset>(m, "Asset")
        .def_readonly("id", &malgraph::Asset::id)
        .def_readonly("name", &malgraph::Asset::name)
        .def_readonly("type", &malgraph::Asset::type)
        .def_readonly("properties", &malgraph::Asset::properties);

    py::class_<malgraph::ModelQuery>(m, "ModelQuery");

    py::class_<malgraph::Model, malgraph::ModelQuery>(m, "Model")
        .def(py::init<std::string>(), py::arg("name") = "")
        .def_static("load_from_file", &malgraph::Model::loadFromFile)
        .def("add_asset", &malgraph::Model::addAsset, py::return_value_policy::reference_internal)
        .def("set_property", &malgraph::Model::setProperty)
        .def("add_association", &malgraph::Model::addAssociation)
        .def("add_attacker", &malgraph::Model::addAttacker)
        .def("asset_by_name", &malgraph::Model::assetByName, py::return_value_policy::reference_internal)
        .def("asset_count", &malgraph::Model::assetCount);

    // ── AttackGraphNode ──
    py::class_<malgraph::AttackGraphNode>(m, "AttackGraphNode")
        .def_readonly("id", &malgraph::AttackGraphNode::id)
        .def_readonly("name", &malgraph::AttackGraphNode::name)
        .def_readonly("full_name", &malgraph::AttackGraphNode::full_name)
        .def_readonly("type", &malgraph::AttackGraphNode::type)
        .def_readonly("children", &malgraph::AttackGraphNode::children)
        .def_readonly("parents", &malgraph::AttackGraphNode::parents)
        .def_readonly("defense_status", &malgraph::AttackGraphNode::defense_status)
        .def_readonly("existence_status", &malgraph::AttackGraphNode::existence_status)
        .def_readwrite("is_viable", &malgraph::AttackGraphNode::is_viable)
        .def_readwrite("is_necessary", &malgraph::AttackGraphNode::is_necessary)
        .def_readonly("tags", &malgraph::AttackGraphNode::tags)
        .def_readonly("compromised_by", &malgraph::AttackGraphNode::compromised_by)
        .def_readonly("reachable_by", &malgraph::AttackGraphNode::reachable_by)
        .def_readonly("mitre_info", &malgraph::AttackGraphNode::mitre_info)
        .def_property_readonly("ttc", [](const malgraph::AttackGraphNode& n) { return n.ttc.dump(); })
        .def_property("extras",
            [](const malgraph::AttackGraphNode& n) { return n.extras.dump(); },
            [](malgraph::AttackGraphNode& n, const std::string& s) { n.extras = nlohmann::json::parse(s); })
        .def("is_compromised", &malgraph::AttackGraphNode::isCompromised)
        .def("is_reachable", &malgraph::AttackGraphNode::isReachable)
        .def("is_enabled_defense", &malgraph::AttackGraphNode::isEnabledDefense)
        .def("is_available_defense", &malgraph::AttackGraphNode::isAvailableDefense);

    // ── Attacker ──
    py::class_<malgraph::Attacker>(m, "Attacker")
        .def(py::init<std::string>())
        .def_readonly("id", &malgraph::Attacker::id)
        .def_readonly("name", &malgraph::Attacker::name)
        .def_readwrite("entry_points", &malgraph::Attacker::entry_points)
        .def_readwrite("reached_attack_steps", &malgraph::Attacker::reached_attack_steps)
        .def_readonly("reachable_attack_steps", &malgraph::Attacker::reachable_attack_steps);

    // ── AttackGraph ──
    py::class_<malgraph::AttackGraph>(m, "AttackGraph")
        .def(py::init<>())
        .def("remove_node", &malgraph::AttackGraph::removeNode)
        .def("get_node", py::overload_cast<uint64_t>(&malgraph::AttackGraph::getNode),
             py::return_value_policy::reference_internal)
        .def("get_node_by_full_name",
             py::overload_cast<const std::string&>(&malgraph::AttackGraph::getNodeByFullName),
             py::return_value_policy::reference_internal)
        .def("get_node_ids", &malgraph::AttackGraph::getNodeIds)
        .def("node_count", &malgraph::AttackGraph::nodeCount)
        .def("link", &malgraph::AttackGraph::link)
        .def("unlink", &malgraph::AttackGraph::unlink)
        .def("add_attacker", &malgraph::AttackGraph::addAttacker,
             py::arg("attacker"), py::arg("reached_steps") = std::vector<uint64_t>{},
             py::arg("id") = std::nullopt)
        .def("remove_attacker", &malgraph::AttackGraph::removeAttacker)
        .def("get_attacker", py::overload_cast<uint64_t>(&malgraph::AttackGraph::getAttacker),
             py::return_value_policy::reference_internal)
        .def("get_attacker_by_name",
             py::overload_cast<const std::string&>(&malgraph::AttackGraph::getAttackerByName),
             py::return_value_policy::reference_internal)
        .def("get_attacker_ids", &malgraph::AttackGraph::getAttackerIds)
        .def("compromise", &malgraph::AttackGraph::compromise)
        .def("undo_compromise", &malgraph::AttackGraph::undoCompromise)
        .def("calculate_reachability", &malgraph::ReachabilityCalculator::calculate)
        .def("save_to_file", [](const malgraph::AttackGraph& g, const std::string& path) {
            malgraph::GraphSerializer::saveToFile(g, path);
        })
        .def_static("load_from_file", [](const std::string& path, const malgraph::Model* model) {
            return malgraph::GraphSerializer::loadFromFile(path, model);
        }, py::arg("path"), py::arg("model") = nullptr);

    // ── GraphBuilder ──
    py::class_<malgraph::GraphBuilder>(m, "GraphBuilder")
        .def(py::init<const malgraph::LanguageQuery&, const malgraph::ModelQuery&>(),
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("build", &malgraph::GraphBuilder::build)
        .def("regenerate", &malgraph::GraphBuilder::regenerate)
        .def("attach_attackers", &malgraph::GraphBuilder::attachAttackers);

    // ── Pattern search ──
    py::class_<malgraph::SearchCondition>(m, "SearchCondition")
        .def(py::init<std::function<bool(const malgraph::AttackGraphNode&)>, int, int>(),
             py::arg("matches"), py::arg("min_repeated") = 1, py::arg("max_repeated") = 1)
        .def_readwrite("min_repeated", &malgraph::SearchCondition::min_repeated)
        .def_readwrite("max_repeated", &malgraph::SearchCondition::max_repeated)
        .def_readonly_static("UNBOUNDED", &malgraph::SearchCondition::kUnbounded);

    py::class_<malgraph::SearchPattern>(m, "SearchPattern")
        .def(py::init<std::vector<malgraph::SearchCondition>>())
        .def("find_matches", &malgraph::SearchPattern::findMatches);
}
