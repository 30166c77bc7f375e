#pragma once

#include "attackgraph/attack_graph.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <vector>

namespace malgraph {

/// A condition that a node in a matched chain has to satisfy, possibly
/// several times in a row.
struct SearchCondition {
    static constexpr int kUnbounded = std::numeric_limits<int>::max();

    std::function<bool(const AttackGraphNode&)> matches;
    int min_repeated = 1;
    int max_repeated = 1;

    SearchCondition() = default;
    SearchCondition(std::function<bool(const AttackGraphNode&)> fn,
                    int min_repeated = 1, int max_repeated = 1)
        : matches(std::move(fn)), min_repeated(min_repeated), max_repeated(max_repeated) {}

    bool canMatchAgain(int num_matches) const { return num_matches < max_repeated; }
    bool mustMatchAgain(int num_matches) const { return num_matches < min_repeated; }

    // ── Common predicates ──
    static SearchCondition nameIs(const std::string& name, int min_repeated = 1, int max_repeated = 1);
    static SearchCondition any(int min_repeated = 1, int max_repeated = kUnbounded);
};

/// A matched chain of node ids, in parent -> child order.
using NodePath = std::vector<uint64_t>;

/// An ordered list of conditions matched along child edges.
class SearchPattern {
public:
    explicit SearchPattern(std::vector<SearchCondition> conditions)
        : conditions_(std::move(conditions)) {}

    /// All distinct node paths that satisfy every condition in order.
    /// Starts from each node matching the first condition and follows
    /// children; a node already on the current path ends that branch.
    std::vector<NodePath> findMatches(const AttackGraph& graph) const;

    const std::vector<SearchCondition>& conditions() const { return conditions_; }

private:
    std::vector<SearchCondition> conditions_;
};

} // namespace malgraph
