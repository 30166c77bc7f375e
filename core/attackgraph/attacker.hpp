#pragma once

#include "attackgraph/node.hpp"

#include <cstdint>
#include <set>
#include <string>

namespace malgraph {

/// An attacker attached to an attack graph. Step references are node ids.
struct Attacker {
    uint64_t id = 0;
    std::string name;
    std::set<uint64_t> entry_points;
    std::set<uint64_t> reached_attack_steps;     // always includes entry_points
    std::set<uint64_t> reachable_attack_steps;   // derived, not persisted

    Attacker() = default;
    explicit Attacker(std::string name) : name(std::move(name)) {}

    /// Mark `node` as compromised by this attacker. No-op if it already is.
    void compromise(AttackGraphNode& node);

    /// Reverse of compromise(). No-op if the node was not compromised.
    void undoCompromise(AttackGraphNode& node);

    bool hasReached(uint64_t node_id) const { return reached_attack_steps.count(node_id) > 0; }
};

} // namespace malgraph
