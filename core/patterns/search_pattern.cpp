#include "patterns/search_pattern.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace malgraph {

SearchCondition SearchCondition::nameIs(const std::string& name, int min_repeated, int max_repeated) {
    return SearchCondition([name](const AttackGraphNode& node) { return node.name == name; },
                           min_repeated, max_repeated);
}

SearchCondition SearchCondition::any(int min_repeated, int max_repeated) {
    return SearchCondition([](const AttackGraphNode&) { return true; },
                           min_repeated, max_repeated);
}

namespace {

// One pending visit: try `node_id` against condition `condition_idx`,
// which has matched `match_count` times along `path` already.
struct Frame {
    uint64_t node_id;
    size_t condition_idx;
    int match_count;
    NodePath path;
};

} // namespace

std::vector<NodePath> SearchPattern::findMatches(const AttackGraph& graph) const {
    std::vector<NodePath> results;
    if (conditions_.empty()) return results;

    std::set<NodePath> seen;
    std::vector<Frame> stack;

    // Reverse pushes keep the discovery order of a depth-first recursion.
    std::vector<uint64_t> starts;
    graph.forEachNode([&](const AttackGraphNode& node) {
        if (conditions_.front().matches(node)) starts.push_back(node.id);
    });
    for (auto it = starts.rbegin(); it != starts.rend(); ++it) {
        stack.push_back({*it, 0, 0, {}});
    }

    while (!stack.empty()) {
        Frame frame = std::move(stack.back());
        stack.pop_back();

        const AttackGraphNode* node = graph.getNode(frame.node_id);
        if (!node) continue;
        if (std::find(frame.path.begin(), frame.path.end(), frame.node_id) != frame.path.end()) {
            continue;  // cycle
        }

        const SearchCondition& condition = conditions_[frame.condition_idx];
        const bool is_last = frame.condition_idx + 1 == conditions_.size();

        std::vector<Frame> next;

        // Current condition fulfilled: the node may belong to the next one.
        if (!is_last && !condition.mustMatchAgain(frame.match_count)) {
            next.push_back({frame.node_id, frame.condition_idx + 1, 0, frame.path});
        }

        if (condition.matches(*node)) {
            NodePath path = frame.path;
            path.push_back(frame.node_id);
            const int count = frame.match_count + 1;

            // A child visited under the same condition moves on to the next
            // one by itself once this condition is fulfilled.
            if (condition.canMatchAgain(count)) {
                for (uint64_t child : node->children) {
                    next.push_back({child, frame.condition_idx, count, path});
                }
            } else if (!is_last) {
                for (uint64_t child : node->children) {
                    next.push_back({child, frame.condition_idx + 1, 0, path});
                }
            }
            if (is_last && !condition.mustMatchAgain(count) && seen.insert(path).second) {
                results.push_back(std::move(path));
            }
        }

        for (auto it = next.rbegin(); it != next.rend(); ++it) {
            stack.push_back(std::move(*it));
        }
    }

    spdlog::debug("Pattern with {} conditions matched {} paths", conditions_.size(), results.size());
    return results;
}

} // namespace malgraph
