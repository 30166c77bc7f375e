#pragma once

#include "language/language_spec.hpp"
#include "language/step_expression.hpp"
#include "model/model.hpp"

#include <optional>
#include <string>
#include <vector>

namespace malgraph {

using AssetList = std::vector<const Asset*>;

/// Outcome of evaluating a step expression: the assets it leads to and, when
/// the expression ends in an attack step, that step's name.
struct StepExpressionResult {
    AssetList assets;
    std::optional<std::string> attack_step;
};

/// Resolves step expressions against an instance model.
/// Evaluation never modifies its inputs. Malformed input (unknown variants,
/// unresolvable variables, untyped targets) is logged and yields an empty
/// result rather than throwing.
class StepExpressionEvaluator {
public:
    /// Nesting limit for expressions and variable indirection.
    static constexpr int kMaxDepth = 256;

    StepExpressionEvaluator(const LanguageQuery& language, const ModelQuery& model)
        : language_(language), model_(model) {}

    StepExpressionResult evaluate(const StepExpression& expr, const AssetList& targets) const;

private:
    StepExpressionResult evaluate(const StepExpression& expr, const AssetList& targets, int depth) const;

    StepExpressionResult evaluateSetOperation(const StepExpression& expr, const AssetList& targets,
                                              int depth) const;
    StepExpressionResult evaluateVariable(const StepExpression& expr, const AssetList& targets,
                                          int depth) const;
    AssetList followField(const std::string& field, const AssetList& targets) const;
    AssetList transitiveClosure(const StepExpression& expr, const AssetList& targets) const;

    const LanguageQuery& language_;
    const ModelQuery& model_;
};

} // namespace malgraph
