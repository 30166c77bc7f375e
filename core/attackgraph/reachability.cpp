#include "attackgraph/reachability.hpp"

#include <spdlog/spdlog.h>

#include <deque>

namespace malgraph {

void ReachabilityCalculator::calculate(AttackGraph& graph) {
    graph.forEachNode([](AttackGraphNode& node) { node.reachable_by.clear(); });
    graph.forEachAttacker([](Attacker& attacker) { attacker.reachable_attack_steps.clear(); });

    for (uint64_t attacker_id : graph.getAttackerIds()) {
        Attacker* attacker = graph.getAttacker(attacker_id);
        attacker->reachable_attack_steps = reachableFrom(graph, *attacker);
        for (uint64_t node_id : attacker->reachable_attack_steps) {
            graph.getNode(node_id)->reachable_by.insert(attacker_id);
        }
        spdlog::debug("Attacker {} can reach {} attack steps",
                      attacker->name, attacker->reachable_attack_steps.size());
    }
}

std::set<uint64_t> ReachabilityCalculator::reachableFrom(const AttackGraph& graph,
                                                         const Attacker& attacker) {
    std::set<uint64_t> reachable;
    std::deque<uint64_t> queue;
    for (uint64_t node_id : attacker.reached_attack_steps) {
        if (!graph.getNode(node_id)) continue;
        if (reachable.insert(node_id).second) queue.push_back(node_id);
    }

    // An and-node is re-examined each time one of its parents becomes
    // reachable, so it is added once the last parent arrives.
    while (!queue.empty()) {
        const AttackGraphNode* node = graph.getNode(queue.front());
        queue.pop_front();

        for (uint64_t child_id : node->children) {
            if (reachable.count(child_id)) continue;
            const AttackGraphNode* child = graph.getNode(child_id);
            if (!child || !child->is_viable) continue;

            bool ready = true;
            if (child->type == StepType::And) {
                for (uint64_t parent_id : child->parents) {
                    if (!reachable.count(parent_id)) {
                        ready = false;
                        break;
                    }
                }
            }
            if (ready) {
                reachable.insert(child_id);
                queue.push_back(child_id);
            }
        }
    }
    return reachable;
}

} // namespace malgraph
