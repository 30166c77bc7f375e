#pragma once

#include "attackgraph/attack_graph.hpp"

#include <set>

namespace malgraph {

/// Computes which attack steps each attacker can reach from the steps it has
/// already compromised.
///
/// Recomputed from scratch on every call: all reachable_by and
/// reachable_attack_steps sets are cleared first. A step is reachable by an
/// attacker when it is one of the attacker's reached steps, or when it is
/// viable and
///   - (or, defense, exist, notExist) any parent is reachable, or
///   - (and) every parent is reachable.
/// Only the derived reachability sets are modified, never edges.
class ReachabilityCalculator {
public:
    static void calculate(AttackGraph& graph);

private:
    static std::set<uint64_t> reachableFrom(const AttackGraph& graph, const Attacker& attacker);
};

} // namespace malgraph
