#pragma once

#include "attackgraph/attacker.hpp"
#include "attackgraph/node.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace malgraph {

// ─── AttackGraph ───────────────────────────────────────────────
// Sole owner of attack step nodes and attackers. Nodes are keyed by id;
// edges are id lists kept symmetric (B in A.children <=> A in B.parents).
// Lookups by id and full name (nodes) or id and name (attackers) are O(1).
// Not safe for concurrent mutation.

class AttackGraph {
public:
    AttackGraph() = default;

    // ── Node operations ──

    /// Insert a node under the next free id. Returns the id.
    uint64_t addNode(AttackGraphNode node);

    /// Insert a node under `id`. Throws MalGraphError(DuplicateNodeId) if
    /// the id is taken, (DuplicateNodeName) if the full name is.
    uint64_t addNodeWithId(uint64_t id, AttackGraphNode node);

    /// Detach the node from all parents, children and attackers and drop it.
    bool removeNode(uint64_t id);

    AttackGraphNode* getNode(uint64_t id);
    const AttackGraphNode* getNode(uint64_t id) const;
    AttackGraphNode* getNodeByFullName(const std::string& full_name);
    const AttackGraphNode* getNodeByFullName(const std::string& full_name) const;
    /// Ids in ascending order.
    std::vector<uint64_t> getNodeIds() const;
    size_t nodeCount() const { return nodes_.size(); }

    /// Attach (or detach, with nullptr) a model asset and re-index the node
    /// under its new full name.
    void attachAsset(uint64_t node_id, const Asset* asset);

    // ── Edge operations ──

    /// Add parent -> child. Returns false if the edge already exists.
    bool link(uint64_t parent_id, uint64_t child_id);
    bool unlink(uint64_t parent_id, uint64_t child_id);

    // ── Attacker operations ──

    /// Insert an attacker and have it compromise `reached_steps`.
    /// A missing id is assigned from the attacker id counter.
    /// Throws MalGraphError(DuplicateAttackerId / DuplicateAttackerName /
    /// UnknownNode) without touching the graph.
    uint64_t addAttacker(Attacker attacker,
                         const std::vector<uint64_t>& reached_steps = {},
                         std::optional<uint64_t> id = std::nullopt);

    /// Undo all compromises and reachability of the attacker and drop it.
    bool removeAttacker(uint64_t id);

    Attacker* getAttacker(uint64_t id);
    const Attacker* getAttacker(uint64_t id) const;
    Attacker* getAttackerByName(const std::string& name);
    const Attacker* getAttackerByName(const std::string& name) const;
    std::vector<uint64_t> getAttackerIds() const;
    size_t attackerCount() const { return attackers_.size(); }

    void compromise(uint64_t attacker_id, uint64_t node_id);
    void undoCompromise(uint64_t attacker_id, uint64_t node_id);

    // ── Iteration, in id order ──
    void forEachNode(const std::function<void(const AttackGraphNode&)>& fn) const;
    void forEachNode(const std::function<void(AttackGraphNode&)>& fn);
    void forEachAttacker(const std::function<void(const Attacker&)>& fn) const;
    void forEachAttacker(const std::function<void(Attacker&)>& fn);

    void clear();

private:
    AttackGraphNode& requireNode(uint64_t id);
    Attacker& requireAttacker(uint64_t id);

    uint64_t next_node_id_ = 0;
    uint64_t next_attacker_id_ = 0;

    std::unordered_map<uint64_t, AttackGraphNode> nodes_;
    std::unordered_map<std::string, uint64_t> nodes_by_full_name_;

    std::unordered_map<uint64_t, Attacker> attackers_;
    std::unordered_map<std::string, uint64_t> attackers_by_name_;
};

} // namespace malgraph
