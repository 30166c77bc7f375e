#include "attackgraph/attacker.hpp"

#include <spdlog/spdlog.h>

namespace malgraph {

void Attacker::compromise(AttackGraphNode& node) {
    spdlog::debug("Attacker \"{}\" is compromising node \"{}\"", id, node.full_name);
    if (node.isCompromisedBy(id)) {
        spdlog::info("Attacker \"{}\" had already compromised node \"{}\". Do nothing.",
                     id, node.full_name);
        return;
    }
    node.compromised_by.insert(id);
    reached_attack_steps.insert(node.id);
}

void Attacker::undoCompromise(AttackGraphNode& node) {
    spdlog::debug("Attacker \"{}\" is being removed from the compromised_by of node \"{}\"",
                  id, node.full_name);
    if (!node.isCompromisedBy(id)) {
        spdlog::info("Attacker \"{}\" had not compromised node \"{}\". Do nothing.",
                     id, node.full_name);
        return;
    }
    node.compromised_by.erase(id);
    reached_attack_steps.erase(node.id);
}

} // namespace malgraph
