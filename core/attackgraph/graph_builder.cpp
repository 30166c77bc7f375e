#include "attackgraph/graph_builder.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>

namespace malgraph {

// Value a defense takes when the model does not set it: Enabled, Disabled,
// or the probability of a Bernoulli TTC.
double GraphBuilder::defaultDefenseStatus(const AttackStepSpec& step) const {
    if (!step.ttc.is_object()) return 0.0;
    const std::string name = step.ttc.value("name", "");
    if (name == "Enabled") return 1.0;
    if (name == "Bernoulli") {
        auto args = step.ttc.value("arguments", nlohmann::json::array());
        if (!args.empty() && args[0].is_number()) return args[0].get<double>();
    }
    return 0.0;
}

AttackGraph GraphBuilder::build() const {
    AttackGraph graph;
    std::unordered_map<uint64_t, std::vector<StepExpressionPtr>> reaches;

    // First, generate all of the nodes of the attack graph.
    for (const Asset* asset : model_.assets()) {
        spdlog::debug("Generating attack steps for asset {} which is of class {}",
                      asset->name, asset->type);

        for (const AttackStepSpec& step : language_.attackStepsForAssetType(asset->type)) {
            AttackGraphNode node(step.name, step.type);
            node.asset = asset;
            node.ttc = step.ttc;
            node.tags.insert(step.tags.begin(), step.tags.end());
            node.mitre_info = step.mitreInfo();

            switch (step.type) {
                case StepType::Defense: {
                    auto value = model_.property(*asset, step.name);
                    node.defense_status = value ? *value : defaultDefenseStatus(step);
                    spdlog::debug("Setting the defense status of {}:{} to {}",
                                  asset->name, step.name, *node.defense_status);
                    break;
                }
                case StepType::Exist:
                case StepType::NotExist: {
                    if (step.requires_exprs.empty()) {
                        spdlog::warn("Existence step {}:{} has no requires expression",
                                     asset->name, step.name);
                        node.existence_status = false;
                        break;
                    }
                    StepExpressionResult required = evaluator_.evaluate(*step.requires_exprs.front(), {asset});
                    node.existence_status = !required.assets.empty();
                    break;
                }
                case StepType::Or:
                case StepType::And:
                    break;
            }

            uint64_t id = graph.addNode(std::move(node));
            reaches[id] = step.reaches_exprs;
        }
    }

    // Then, link all of the nodes according to their associations.
    for (uint64_t id : graph.getNodeIds()) {
        const AttackGraphNode* node = graph.getNode(id);
        spdlog::debug("Determining children for attack step {}", node->full_name);

        for (const StepExpressionPtr& expr : reaches[id]) {
            StepExpressionResult result = evaluator_.evaluate(*expr, {node->asset});
            if (!result.attack_step) {
                if (result.assets.empty()) continue;
                std::string msg = "Step expression of " + node->full_name +
                                  " does not end in an attack step";
                spdlog::error("{}", msg);
                throw StepExpressionError(msg);
            }
            for (const Asset* target : result.assets) {
                std::string target_name = target->name + ":" + *result.attack_step;
                const AttackGraphNode* target_node = graph.getNodeByFullName(target_name);
                if (!target_node) {
                    std::string msg = "Failed to find target node " + target_name +
                                      " to link with for attack step " + node->full_name + "!";
                    spdlog::error("{}", msg);
                    throw StepExpressionError(msg);
                }
                graph.link(id, target_node->id);
            }
        }
    }

    spdlog::info("Generated attack graph with {} nodes from model '{}'",
                 graph.nodeCount(), model_.name());
    return graph;
}

void GraphBuilder::regenerate(AttackGraph& graph) const {
    graph = build();
}

void GraphBuilder::attachAttackers(AttackGraph& graph) const {
    spdlog::info("Attach attackers from \"{}\" model to the graph", model_.name());

    for (const AttackerDefinition& definition : model_.attackers()) {
        uint64_t attacker_id = graph.addAttacker(Attacker(definition.name), {}, definition.id);

        for (const auto& [asset, steps] : definition.entry_points) {
            for (const std::string& step : steps) {
                std::string full_name = asset->name + ":" + step;
                const AttackGraphNode* node = graph.getNodeByFullName(full_name);
                if (!node) {
                    spdlog::warn("Failed to find attacker entry point {} for Attacker:{}",
                                 full_name, attacker_id);
                    continue;
                }
                graph.compromise(attacker_id, node->id);
            }
        }

        Attacker* attacker = graph.getAttacker(attacker_id);
        attacker->entry_points = attacker->reached_attack_steps;
    }
}

} // namespace malgraph
