#include "attackgraph/graph_serializer.hpp"
#include "common/document_io.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>

namespace malgraph {

// ─── Serialization ─────────────────────────────────────────────

nlohmann::json GraphSerializer::nodeToJson(const AttackGraph& graph, const AttackGraphNode& node) {
    auto full_names = [&](const std::vector<uint64_t>& ids) {
        nlohmann::json names = nlohmann::json::array();
        for (uint64_t id : ids) {
            if (const AttackGraphNode* other = graph.getNode(id)) names.push_back(other->full_name);
        }
        return names;
    };

    nlohmann::json j;
    j["id"] = node.id;
    j["type"] = toString(node.type);
    j["name"] = node.name;
    j["ttc"] = node.ttc;
    j["children"] = full_names(node.children);
    j["parents"] = full_names(node.parents);

    nlohmann::json compromised_by = nlohmann::json::array();
    for (uint64_t attacker_id : node.compromised_by) {
        if (const Attacker* attacker = graph.getAttacker(attacker_id)) {
            compromised_by.push_back(attacker->name);
        }
    }
    j["compromised_by"] = compromised_by;

    if (node.asset) j["asset"] = node.asset->name;
    if (node.defense_status) j["defense_status"] = *node.defense_status;
    if (node.existence_status) j["existence_status"] = *node.existence_status;
    j["is_viable"] = node.is_viable;
    j["is_necessary"] = node.is_necessary;
    if (node.mitre_info) j["mitre_info"] = *node.mitre_info;
    if (!node.tags.empty()) j["tags"] = node.tags;
    if (node.extras.is_object() && !node.extras.empty()) j["extras"] = node.extras;
    return j;
}

nlohmann::json GraphSerializer::attackerToJson(const AttackGraph& graph, const Attacker& attacker) {
    auto full_names = [&](const std::set<uint64_t>& ids) {
        nlohmann::json names = nlohmann::json::array();
        for (uint64_t id : ids) {
            if (const AttackGraphNode* node = graph.getNode(id)) names.push_back(node->full_name);
        }
        return names;
    };

    return {
        {"id", attacker.id},
        {"name", attacker.name},
        {"entry_points", full_names(attacker.entry_points)},
        {"reached_attack_steps", full_names(attacker.reached_attack_steps)},
    };
}

nlohmann::json GraphSerializer::toJson(const AttackGraph& graph) {
    nlohmann::json steps = nlohmann::json::array();
    graph.forEachNode([&](const AttackGraphNode& node) { steps.push_back(nodeToJson(graph, node)); });

    nlohmann::json attackers = nlohmann::json::array();
    graph.forEachAttacker([&](const Attacker& attacker) {
        attackers.push_back(attackerToJson(graph, attacker));
    });

    return {{"attack_steps", steps}, {"attackers", attackers}};
}

// ─── Deserialization ───────────────────────────────────────────

namespace {

// Older files store booleans and floats as Python-style strings.
bool readBool(const nlohmann::json& value, const std::string& field) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (s == "True" || s == "true") return true;
        if (s == "False" || s == "false") return false;
    }
    throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                        "Field " + field + " is not a boolean: " + value.dump());
}

double readDouble(const nlohmann::json& value, const std::string& field) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        try {
            return std::stod(value.get<std::string>());
        } catch (const std::logic_error&) {
            // Reported below.
        }
    }
    throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                        "Field " + field + " is not a number: " + value.dump());
}

uint64_t resolveStep(const std::unordered_map<std::string, uint64_t>& saved_names,
                     const std::string& full_name, const std::string& context) {
    auto it = saved_names.find(full_name);
    if (it == saved_names.end()) {
        spdlog::error("Failed to find node {} when loading {} from attack graph dict",
                      full_name, context);
        throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                            "Unknown attack step " + full_name + " referenced by " + context);
    }
    return it->second;
}

} // namespace

AttackGraph GraphSerializer::fromJson(const nlohmann::json& document, const ModelQuery* model) {
    AttackGraph graph;
    try {
        const nlohmann::json& steps = document.at("attack_steps");
        // Full names as written in the document, which may differ from the
        // names derived here when no model is supplied.
        std::unordered_map<std::string, uint64_t> saved_names;

        // Create all of the nodes in the imported attack graph.
        for (const nlohmann::json& record : steps) {
            AttackGraphNode node(record.at("name").get<std::string>(),
                                 stepTypeFromString(record.at("type").get<std::string>()));
            node.ttc = record.value("ttc", nlohmann::json());

            if (record.contains("defense_status")) {
                node.defense_status = readDouble(record["defense_status"], "defense_status");
            }
            if (record.contains("existence_status")) {
                node.existence_status = readBool(record["existence_status"], "existence_status");
            }
            if (record.contains("is_viable")) {
                node.is_viable = readBool(record["is_viable"], "is_viable");
            }
            if (record.contains("is_necessary")) {
                node.is_necessary = readBool(record["is_necessary"], "is_necessary");
            }
            if (record.contains("mitre_info")) {
                node.mitre_info = record["mitre_info"].get<std::string>();
            }
            if (record.contains("tags")) {
                for (const auto& tag : record["tags"]) node.tags.insert(tag.get<std::string>());
            }
            if (record.contains("extras")) {
                node.extras = record["extras"];
            } else if (record.contains("extra")) {
                node.extras = record["extra"];
            }

            uint64_t id = record.at("id").get<uint64_t>();
            std::string saved_name = std::to_string(id) + ":" + node.name;
            if (record.contains("asset")) {
                const std::string asset_name = record["asset"].get<std::string>();
                saved_name = asset_name + ":" + node.name;
                if (model) {
                    node.asset = model->assetByName(asset_name);
                    if (!node.asset) {
                        throw MalGraphError(MalGraphErrorCode::UnknownAsset,
                                            "Failed to find asset " + asset_name +
                                            " when loading attack graph dict");
                    }
                }
            }

            graph.addNodeWithId(id, std::move(node));
            if (!saved_names.emplace(saved_name, id).second) {
                throw MalGraphError(MalGraphErrorCode::DuplicateNodeName,
                                    "Duplicate attack step " + saved_name + " in attack graph dict");
            }
        }

        // Re-establish links between nodes.
        for (const nlohmann::json& record : steps) {
            uint64_t id = record.at("id").get<uint64_t>();
            const std::string context = "node " + graph.getNode(id)->full_name;
            for (const auto& child : record.value("children", nlohmann::json::array())) {
                graph.link(id, resolveStep(saved_names, child.get<std::string>(), context));
            }
            for (const auto& parent : record.value("parents", nlohmann::json::array())) {
                graph.link(resolveStep(saved_names, parent.get<std::string>(), context), id);
            }
        }

        // Attackers rebuild compromised_by on the nodes.
        for (const nlohmann::json& record : document.value("attackers", nlohmann::json::array())) {
            Attacker attacker(record.value("name", ""));
            const std::string context = "attacker " + attacker.name;
            for (const auto& step : record.value("entry_points", nlohmann::json::array())) {
                attacker.entry_points.insert(resolveStep(saved_names, step.get<std::string>(), context));
            }
            std::vector<uint64_t> reached;
            for (const auto& step : record.value("reached_attack_steps", nlohmann::json::array())) {
                reached.push_back(resolveStep(saved_names, step.get<std::string>(), context));
            }
            graph.addAttacker(std::move(attacker), reached, record.at("id").get<uint64_t>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                            std::string("Malformed attack graph document: ") + e.what());
    }
    return graph;
}

// ─── Files ─────────────────────────────────────────────────────

void GraphSerializer::saveToFile(const AttackGraph& graph, const std::string& path) {
    spdlog::info("Saving attack graph with {} nodes to {}", graph.nodeCount(), path);
    saveDocument(path, toJson(graph));
}

AttackGraph GraphSerializer::loadFromFile(const std::string& path, const ModelQuery* model) {
    spdlog::info("Loading attack graph from {}", path);
    return fromJson(loadDocument(path), model);
}

} // namespace malgraph
