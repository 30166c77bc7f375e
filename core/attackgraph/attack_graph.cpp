#include "attackgraph/attack_graph.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace malgraph {

namespace {

bool eraseValue(std::vector<uint64_t>& ids, uint64_t value) {
    auto it = std::find(ids.begin(), ids.end(), value);
    if (it == ids.end()) return false;
    ids.erase(it);
    return true;
}

} // namespace

// ─── Node operations ───────────────────────────────────────────

uint64_t AttackGraph::addNode(AttackGraphNode node) {
    return addNodeWithId(next_node_id_, std::move(node));
}

uint64_t AttackGraph::addNodeWithId(uint64_t id, AttackGraphNode node) {
    if (nodes_.count(id)) {
        throw MalGraphError(MalGraphErrorCode::DuplicateNodeId,
                            "Node ID already exists: " + std::to_string(id));
    }
    node.id = id;
    node.full_name = node.deriveFullName();
    if (nodes_by_full_name_.count(node.full_name)) {
        throw MalGraphError(MalGraphErrorCode::DuplicateNodeName,
                            "Node full name already exists: " + node.full_name);
    }

    // Edges are only created through link() so both sides stay in sync.
    node.children.clear();
    node.parents.clear();

    nodes_by_full_name_[node.full_name] = id;
    nodes_.emplace(id, std::move(node));
    if (id >= next_node_id_) {
        next_node_id_ = id + 1;
    }
    return id;
}

bool AttackGraph::removeNode(uint64_t id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;
    AttackGraphNode& node = it->second;

    for (uint64_t child_id : node.children) {
        auto child = nodes_.find(child_id);
        if (child != nodes_.end()) eraseValue(child->second.parents, id);
    }
    for (uint64_t parent_id : node.parents) {
        auto parent = nodes_.find(parent_id);
        if (parent != nodes_.end()) eraseValue(parent->second.children, id);
    }
    for (auto& [_, attacker] : attackers_) {
        attacker.entry_points.erase(id);
        attacker.reached_attack_steps.erase(id);
        attacker.reachable_attack_steps.erase(id);
    }

    nodes_by_full_name_.erase(node.full_name);
    nodes_.erase(it);
    return true;
}

AttackGraphNode* AttackGraph::getNode(uint64_t id) {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const AttackGraphNode* AttackGraph::getNode(uint64_t id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

AttackGraphNode* AttackGraph::getNodeByFullName(const std::string& full_name) {
    auto it = nodes_by_full_name_.find(full_name);
    return it != nodes_by_full_name_.end() ? getNode(it->second) : nullptr;
}

const AttackGraphNode* AttackGraph::getNodeByFullName(const std::string& full_name) const {
    auto it = nodes_by_full_name_.find(full_name);
    return it != nodes_by_full_name_.end() ? getNode(it->second) : nullptr;
}

std::vector<uint64_t> AttackGraph::getNodeIds() const {
    std::vector<uint64_t> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

AttackGraphNode& AttackGraph::requireNode(uint64_t id) {
    AttackGraphNode* node = getNode(id);
    if (!node) {
        throw MalGraphError(MalGraphErrorCode::UnknownNode, "Node not found: " + std::to_string(id));
    }
    return *node;
}

void AttackGraph::attachAsset(uint64_t node_id, const Asset* asset) {
    AttackGraphNode& node = requireNode(node_id);
    const Asset* previous = node.asset;
    node.asset = asset;
    std::string full_name = node.deriveFullName();
    if (full_name == node.full_name) return;

    auto clash = nodes_by_full_name_.find(full_name);
    if (clash != nodes_by_full_name_.end()) {
        node.asset = previous;
        throw MalGraphError(MalGraphErrorCode::DuplicateNodeName,
                            "Node full name already exists: " + full_name);
    }
    nodes_by_full_name_.erase(node.full_name);
    node.full_name = std::move(full_name);
    nodes_by_full_name_[node.full_name] = node_id;
}

// ─── Edge operations ───────────────────────────────────────────

bool AttackGraph::link(uint64_t parent_id, uint64_t child_id) {
    AttackGraphNode& parent = requireNode(parent_id);
    AttackGraphNode& child = requireNode(child_id);
    if (std::find(parent.children.begin(), parent.children.end(), child_id) != parent.children.end()) {
        return false;
    }
    parent.children.push_back(child_id);
    child.parents.push_back(parent_id);
    return true;
}

bool AttackGraph::unlink(uint64_t parent_id, uint64_t child_id) {
    AttackGraphNode& parent = requireNode(parent_id);
    AttackGraphNode& child = requireNode(child_id);
    bool removed = eraseValue(parent.children, child_id);
    eraseValue(child.parents, parent_id);
    return removed;
}

// ─── Attacker operations ───────────────────────────────────────

uint64_t AttackGraph::addAttacker(Attacker attacker,
                                  const std::vector<uint64_t>& reached_steps,
                                  std::optional<uint64_t> id) {
    uint64_t attacker_id = id.value_or(next_attacker_id_);
    if (attackers_.count(attacker_id)) {
        throw MalGraphError(MalGraphErrorCode::DuplicateAttackerId,
                            "Attacker ID already exists: " + std::to_string(attacker_id));
    }
    attacker.id = attacker_id;
    if (attacker.name.empty()) {
        attacker.name = "Attacker:" + std::to_string(attacker_id);
    }
    if (attackers_by_name_.count(attacker.name)) {
        throw MalGraphError(MalGraphErrorCode::DuplicateAttackerName,
                            "Attacker name already exists: " + attacker.name);
    }

    // Compromise bookkeeping is rebuilt from the node side. Resolve every
    // node first so a bad id leaves the graph untouched.
    std::vector<uint64_t> to_compromise(attacker.reached_attack_steps.begin(),
                                        attacker.reached_attack_steps.end());
    to_compromise.insert(to_compromise.end(), reached_steps.begin(), reached_steps.end());
    to_compromise.insert(to_compromise.end(), attacker.entry_points.begin(), attacker.entry_points.end());
    std::vector<AttackGraphNode*> nodes;
    nodes.reserve(to_compromise.size());
    for (uint64_t node_id : to_compromise) {
        nodes.push_back(&requireNode(node_id));
    }
    attacker.reached_attack_steps.clear();
    attacker.reachable_attack_steps.clear();

    auto [it, _] = attackers_.emplace(attacker_id, std::move(attacker));
    Attacker& stored = it->second;
    attackers_by_name_[stored.name] = attacker_id;
    if (attacker_id >= next_attacker_id_) {
        next_attacker_id_ = attacker_id + 1;
    }

    for (AttackGraphNode* node : nodes) {
        stored.compromise(*node);
    }
    return attacker_id;
}

bool AttackGraph::removeAttacker(uint64_t id) {
    auto it = attackers_.find(id);
    if (it == attackers_.end()) return false;
    Attacker& attacker = it->second;

    std::vector<uint64_t> reached(attacker.reached_attack_steps.begin(),
                                  attacker.reached_attack_steps.end());
    for (uint64_t node_id : reached) {
        if (AttackGraphNode* node = getNode(node_id)) {
            attacker.undoCompromise(*node);
        }
    }
    for (uint64_t node_id : attacker.reachable_attack_steps) {
        if (AttackGraphNode* node = getNode(node_id)) {
            node->reachable_by.erase(id);
        }
    }

    auto by_name = attackers_by_name_.find(attacker.name);
    if (by_name != attackers_by_name_.end() && by_name->second == id) {
        attackers_by_name_.erase(by_name);
    }
    attackers_.erase(it);
    return true;
}

Attacker* AttackGraph::getAttacker(uint64_t id) {
    auto it = attackers_.find(id);
    return it != attackers_.end() ? &it->second : nullptr;
}

const Attacker* AttackGraph::getAttacker(uint64_t id) const {
    auto it = attackers_.find(id);
    return it != attackers_.end() ? &it->second : nullptr;
}

Attacker* AttackGraph::getAttackerByName(const std::string& name) {
    auto it = attackers_by_name_.find(name);
    return it != attackers_by_name_.end() ? getAttacker(it->second) : nullptr;
}

const Attacker* AttackGraph::getAttackerByName(const std::string& name) const {
    auto it = attackers_by_name_.find(name);
    return it != attackers_by_name_.end() ? getAttacker(it->second) : nullptr;
}

std::vector<uint64_t> AttackGraph::getAttackerIds() const {
    std::vector<uint64_t> ids;
    ids.reserve(attackers_.size());
    for (const auto& [id, _] : attackers_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

Attacker& AttackGraph::requireAttacker(uint64_t id) {
    Attacker* attacker = getAttacker(id);
    if (!attacker) {
        throw MalGraphError(MalGraphErrorCode::UnknownAttacker,
                            "Attacker not found: " + std::to_string(id));
    }
    return *attacker;
}

void AttackGraph::compromise(uint64_t attacker_id, uint64_t node_id) {
    requireAttacker(attacker_id).compromise(requireNode(node_id));
}

void AttackGraph::undoCompromise(uint64_t attacker_id, uint64_t node_id) {
    requireAttacker(attacker_id).undoCompromise(requireNode(node_id));
}

// ─── Iteration ─────────────────────────────────────────────────

// The id maps are unordered; walk them through a sorted id snapshot.

void AttackGraph::forEachNode(const std::function<void(const AttackGraphNode&)>& fn) const {
    for (uint64_t id : getNodeIds()) {
        if (const AttackGraphNode* node = getNode(id)) fn(*node);
    }
}

void AttackGraph::forEachNode(const std::function<void(AttackGraphNode&)>& fn) {
    for (uint64_t id : getNodeIds()) {
        if (AttackGraphNode* node = getNode(id)) fn(*node);
    }
}

void AttackGraph::forEachAttacker(const std::function<void(const Attacker&)>& fn) const {
    for (uint64_t id : getAttackerIds()) {
        if (const Attacker* attacker = getAttacker(id)) fn(*attacker);
    }
}

void AttackGraph::forEachAttacker(const std::function<void(Attacker&)>& fn) {
    for (uint64_t id : getAttackerIds()) {
        if (Attacker* attacker = getAttacker(id)) fn(*attacker);
    }
}

void AttackGraph::clear() {
    nodes_.clear();
    nodes_by_full_name_.clear();
    attackers_.clear();
    attackers_by_name_.clear();
    next_node_id_ = 0;
    next_attacker_id_ = 0;
}

} // namespace malgraph
