#include "attackgraph/step_expression_evaluator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace malgraph {

namespace {

// Order-preserving set algebra over asset identity.

AssetList setUnion(const AssetList& lhs, const AssetList& rhs) {
    AssetList result;
    std::unordered_set<const Asset*> seen;
    for (const Asset* a : lhs) {
        if (seen.insert(a).second) result.push_back(a);
    }
    for (const Asset* a : rhs) {
        if (seen.insert(a).second) result.push_back(a);
    }
    return result;
}

AssetList setIntersection(const AssetList& lhs, const AssetList& rhs) {
    std::unordered_set<const Asset*> right(rhs.begin(), rhs.end());
    std::unordered_set<const Asset*> seen;
    AssetList result;
    for (const Asset* a : lhs) {
        if (right.count(a) && seen.insert(a).second) result.push_back(a);
    }
    return result;
}

AssetList setDifference(const AssetList& lhs, const AssetList& rhs) {
    std::unordered_set<const Asset*> right(rhs.begin(), rhs.end());
    std::unordered_set<const Asset*> seen;
    AssetList result;
    for (const Asset* a : lhs) {
        if (!right.count(a) && seen.insert(a).second) result.push_back(a);
    }
    return result;
}

} // namespace

StepExpressionResult StepExpressionEvaluator::evaluate(const StepExpression& expr,
                                                       const AssetList& targets) const {
    return evaluate(expr, targets, 0);
}

StepExpressionResult StepExpressionEvaluator::evaluate(const StepExpression& expr,
                                                       const AssetList& targets, int depth) const {
    if (depth > kMaxDepth) {
        spdlog::error("Step expression nesting exceeds {} levels at '{}' expression, "
                      "giving up on this branch", kMaxDepth, expr.raw_type);
        return {};
    }

    switch (expr.kind) {
        case StepExpressionKind::AttackStep:
            // Only names the step; the targets stay as they are.
            return {targets, expr.name};

        case StepExpressionKind::Union:
        case StepExpressionKind::Intersection:
        case StepExpressionKind::Difference:
            return evaluateSetOperation(expr, targets, depth);

        case StepExpressionKind::Variable:
            return evaluateVariable(expr, targets, depth);

        case StepExpressionKind::Field:
            return {followField(expr.name, targets), std::nullopt};

        case StepExpressionKind::Transitive:
            return {transitiveClosure(expr, targets), std::nullopt};

        case StepExpressionKind::SubType: {
            if (!expr.inner) return {};
            StepExpressionResult inner = evaluate(*expr.inner, targets, depth + 1);
            AssetList selected;
            for (const Asset* asset : inner.assets) {
                if (language_.extendsAsset(asset->type, expr.sub_type)) {
                    selected.push_back(asset);
                }
            }
            return {std::move(selected), std::nullopt};
        }

        case StepExpressionKind::Collect: {
            if (!expr.lhs || !expr.rhs) return {};
            StepExpressionResult lhs = evaluate(*expr.lhs, targets, depth + 1);
            return evaluate(*expr.rhs, lhs.assets, depth + 1);
        }

        case StepExpressionKind::Unknown:
            break;
    }

    spdlog::error("Unknown attack step type: {}", expr.raw_type);
    return {};
}

StepExpressionResult StepExpressionEvaluator::evaluateSetOperation(const StepExpression& expr,
                                                                   const AssetList& targets,
                                                                   int depth) const {
    if (!expr.lhs || !expr.rhs) return {};
    StepExpressionResult lhs = evaluate(*expr.lhs, targets, depth + 1);
    StepExpressionResult rhs = evaluate(*expr.rhs, targets, depth + 1);

    switch (expr.kind) {
        case StepExpressionKind::Union:
            return {setUnion(lhs.assets, rhs.assets), std::nullopt};
        case StepExpressionKind::Intersection:
            return {setIntersection(lhs.assets, rhs.assets), std::nullopt};
        case StepExpressionKind::Difference:
            return {setDifference(lhs.assets, rhs.assets), std::nullopt};
        default:
            return {};
    }
}

StepExpressionResult StepExpressionEvaluator::evaluateVariable(const StepExpression& expr,
                                                               const AssetList& targets,
                                                               int depth) const {
    // Group targets by type; each type may bind the variable differently.
    std::vector<std::pair<std::string, AssetList>> groups;
    for (const Asset* target : targets) {
        if (target->type.empty()) {
            spdlog::error("Requested variable {} from non-asset target {} which cannot be resolved",
                          expr.name, target->name);
            return {};
        }
        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const auto& g) { return g.first == target->type; });
        if (it == groups.end()) {
            groups.push_back({target->type, {target}});
        } else {
            it->second.push_back(target);
        }
    }

    StepExpressionResult result;
    for (const auto& [type, group] : groups) {
        StepExpressionPtr bound = language_.variableForAssetType(type, expr.name);
        if (!bound) continue;
        StepExpressionResult partial = evaluate(*bound, group, depth + 1);
        result.assets.insert(result.assets.end(), partial.assets.begin(), partial.assets.end());
        if (partial.attack_step) result.attack_step = partial.attack_step;
    }
    return result;
}

AssetList StepExpressionEvaluator::followField(const std::string& field, const AssetList& targets) const {
    AssetList result;
    for (const Asset* target : targets) {
        AssetList associated = model_.associatedAssets(*target, field);
        result.insert(result.end(), associated.begin(), associated.end());
    }
    return result;
}

AssetList StepExpressionEvaluator::transitiveClosure(const StepExpression& expr,
                                                     const AssetList& targets) const {
    if (!expr.inner || expr.inner->kind != StepExpressionKind::Field) {
        spdlog::error("Transitive step expression must wrap a field expression");
        return {};
    }
    const std::string& field = expr.inner->name;

    // Frontier by frontier; every asset is visited once, so cycles end.
    AssetList visited;
    std::unordered_set<const Asset*> seen;
    AssetList frontier = targets;
    while (!frontier.empty()) {
        AssetList next;
        for (const Asset* asset : followField(field, frontier)) {
            if (seen.insert(asset).second) {
                visited.push_back(asset);
                next.push_back(asset);
            }
        }
        frontier = std::move(next);
    }
    return visited;
}

} // namespace malgraph
