#pragma once

#include "language/language_spec.hpp"
#include "model/model.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace malgraph {

/// An attack step node. Nodes live in an AttackGraph arena and refer to
/// each other (and to attackers) by id only.
struct AttackGraphNode {
    uint64_t id = 0;
    std::string name;
    std::string full_name;          // maintained by AttackGraph
    StepType type = StepType::Or;
    nlohmann::json ttc;
    const Asset* asset = nullptr;   // non-owning, absent without a model

    std::vector<uint64_t> children;
    std::vector<uint64_t> parents;

    std::optional<double> defense_status;
    std::optional<bool> existence_status;
    bool is_viable = true;
    bool is_necessary = true;

    std::set<std::string> tags;
    std::set<uint64_t> compromised_by;  // attacker ids
    std::set<uint64_t> reachable_by;    // attacker ids, derived

    std::optional<std::string> mitre_info;
    nlohmann::json extras = nlohmann::json::object();

    AttackGraphNode() = default;
    AttackGraphNode(std::string name, StepType type)
        : name(std::move(name)), type(type) {}

    /// "<asset name>:<step name>", or "<id>:<step name>" without an asset.
    std::string deriveFullName() const {
        if (asset) return asset->name + ":" + name;
        return std::to_string(id) + ":" + name;
    }

    bool isCompromised() const { return !compromised_by.empty(); }
    bool isCompromisedBy(uint64_t attacker_id) const { return compromised_by.count(attacker_id) > 0; }
    bool isReachable() const { return !reachable_by.empty(); }
    bool isReachableBy(uint64_t attacker_id) const { return reachable_by.count(attacker_id) > 0; }

    /// Defense that is switched on and not suppressed via tags.
    bool isEnabledDefense() const {
        return type == StepType::Defense && !tags.count("suppress") &&
               defense_status.has_value() && *defense_status == 1.0;
    }

    /// Defense that could still be switched on and is not suppressed.
    bool isAvailableDefense() const {
        return type == StepType::Defense && !tags.count("suppress") &&
               !(defense_status.has_value() && *defense_status == 1.0);
    }
};

} // namespace malgraph
