#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace malgraph {

/// Closed set of step-expression variants understood by the evaluator.
enum class StepExpressionKind {
    AttackStep,
    Union,
    Intersection,
    Difference,
    Variable,
    Field,
    Transitive,
    SubType,
    Collect,
    Unknown
};

struct StepExpression;
using StepExpressionPtr = std::shared_ptr<const StepExpression>;

/// A node of a step-expression tree.
///   AttackStep, Variable, Field      -> name
///   Union, Intersection, Difference,
///   Collect                          -> lhs, rhs
///   Transitive                       -> inner (a Field expression)
///   SubType                          -> inner, sub_type
///   Unknown                          -> raw_type holds the unrecognized tag
struct StepExpression {
    StepExpressionKind kind = StepExpressionKind::Unknown;
    std::string name;
    std::string sub_type;
    std::string raw_type;
    StepExpressionPtr lhs;
    StepExpressionPtr rhs;
    StepExpressionPtr inner;

    /// Parse from the compiled-language JSON form, e.g.
    /// {"type": "collect", "lhs": {...}, "rhs": {...}}.
    static StepExpressionPtr fromJson(const nlohmann::json& j);

    // ── Builders, used by tests and hand-written specifications ──
    static StepExpressionPtr attackStep(std::string name);
    static StepExpressionPtr field(std::string name);
    static StepExpressionPtr variable(std::string name);
    static StepExpressionPtr transitive(StepExpressionPtr field_expr);
    static StepExpressionPtr subType(StepExpressionPtr inner, std::string type);
    static StepExpressionPtr binary(StepExpressionKind kind, StepExpressionPtr lhs,
                                    StepExpressionPtr rhs);
    static StepExpressionPtr collect(StepExpressionPtr lhs, StepExpressionPtr rhs);
};

const char* toString(StepExpressionKind kind);

} // namespace malgraph
