#pragma once

#include "attackgraph/attack_graph.hpp"
#include "attackgraph/step_expression_evaluator.hpp"
#include "language/language_spec.hpp"
#include "model/model.hpp"

namespace malgraph {

/// Builds attack graphs from a language specification and an instance model.
class GraphBuilder {
public:
    GraphBuilder(const LanguageQuery& language, const ModelQuery& model)
        : language_(language), model_(model), evaluator_(language, model) {}

    /// One node per (asset, attack step), linked along the "reaches"
    /// expressions. Throws StepExpressionError if a reaches expression
    /// names a step with no node; no partial graph is returned.
    AttackGraph build() const;

    /// Replace the contents of `graph` with a freshly built graph. On error
    /// `graph` is left untouched.
    void regenerate(AttackGraph& graph) const;

    /// Create the model's attackers in `graph` and compromise their entry
    /// points. Entry points without a node are logged and skipped.
    void attachAttackers(AttackGraph& graph) const;

private:
    double defaultDefenseStatus(const AttackStepSpec& step) const;

    const LanguageQuery& language_;
    const ModelQuery& model_;
    StepExpressionEvaluator evaluator_;
};

} // namespace malgraph
