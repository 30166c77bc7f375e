#pragma once

#include "attackgraph/attack_graph.hpp"
#include "model/model.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace malgraph {

/// Conversion between AttackGraph and its persisted form:
///   {"attack_steps": [...], "attackers": [...]}
/// Node records hold id, type, name, ttc, children, parents and
/// compromised_by, plus asset, defense_status, existence_status,
/// is_viable, is_necessary, mitre_info, tags and extras only when set.
/// Steps are referenced by full name, attackers by name.
class GraphSerializer {
public:
    static nlohmann::json toJson(const AttackGraph& graph);
    static nlohmann::json nodeToJson(const AttackGraph& graph, const AttackGraphNode& node);
    static nlohmann::json attackerToJson(const AttackGraph& graph, const Attacker& attacker);

    /// Rebuild a graph. With a model, nodes get their assets back (looked up
    /// by name) and full names are derived from them.
    /// Throws MalGraphError(InvalidDocument / UnknownAsset) on bad input.
    static AttackGraph fromJson(const nlohmann::json& document, const ModelQuery* model = nullptr);

    /// Save as JSON or YAML by file extension.
    static void saveToFile(const AttackGraph& graph, const std::string& path);
    static AttackGraph loadFromFile(const std::string& path, const ModelQuery* model = nullptr);
};

} // namespace malgraph
