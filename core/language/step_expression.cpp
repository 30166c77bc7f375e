#include "language/step_expression.hpp"
#include "common/errors.hpp"

#include <unordered_map>

namespace malgraph {

namespace {

StepExpressionKind kindFromString(const std::string& type) {
    static const std::unordered_map<std::string, StepExpressionKind> kinds = {
        {"attackStep", StepExpressionKind::AttackStep},
        {"union", StepExpressionKind::Union},
        {"intersection", StepExpressionKind::Intersection},
        {"difference", StepExpressionKind::Difference},
        {"variable", StepExpressionKind::Variable},
        {"field", StepExpressionKind::Field},
        {"transitive", StepExpressionKind::Transitive},
        {"subType", StepExpressionKind::SubType},
        {"collect", StepExpressionKind::Collect},
    };
    auto it = kinds.find(type);
    return it != kinds.end() ? it->second : StepExpressionKind::Unknown;
}

const nlohmann::json& member(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                            std::string("Step expression is missing '") + key + "': " + j.dump());
    }
    return *it;
}

} // namespace

StepExpressionPtr StepExpression::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                            "Step expression must be an object: " + j.dump());
    }
    auto expr = std::make_shared<StepExpression>();
    expr->raw_type = member(j, "type").get<std::string>();
    expr->kind = kindFromString(expr->raw_type);

    switch (expr->kind) {
        case StepExpressionKind::AttackStep:
        case StepExpressionKind::Variable:
        case StepExpressionKind::Field:
            expr->name = member(j, "name").get<std::string>();
            break;
        case StepExpressionKind::Union:
        case StepExpressionKind::Intersection:
        case StepExpressionKind::Difference:
        case StepExpressionKind::Collect:
            expr->lhs = fromJson(member(j, "lhs"));
            expr->rhs = fromJson(member(j, "rhs"));
            break;
        case StepExpressionKind::Transitive:
            expr->inner = fromJson(member(j, "stepExpression"));
            break;
        case StepExpressionKind::SubType:
            expr->inner = fromJson(member(j, "stepExpression"));
            expr->sub_type = member(j, "subType").get<std::string>();
            break;
        case StepExpressionKind::Unknown:
            // Reported by the evaluator, not here.
            break;
    }
    return expr;
}

StepExpressionPtr StepExpression::attackStep(std::string name) {
    auto expr = std::make_shared<StepExpression>();
    expr->kind = StepExpressionKind::AttackStep;
    expr->raw_type = "attackStep";
    expr->name = std::move(name);
    return expr;
}

StepExpressionPtr StepExpression::field(std::string name) {
    auto expr = std::make_shared<StepExpression>();
    expr->kind = StepExpressionKind::Field;
    expr->raw_type = "field";
    expr->name = std::move(name);
    return expr;
}

StepExpressionPtr StepExpression::variable(std::string name) {
    auto expr = std::make_shared<StepExpression>();
    expr->kind = StepExpressionKind::Variable;
    expr->raw_type = "variable";
    expr->name = std::move(name);
    return expr;
}

StepExpressionPtr StepExpression::transitive(StepExpressionPtr field_expr) {
    auto expr = std::make_shared<StepExpression>();
    expr->kind = StepExpressionKind::Transitive;
    expr->raw_type = "transitive";
    expr->inner = std::move(field_expr);
    return expr;
}

StepExpressionPtr StepExpression::subType(StepExpressionPtr inner, std::string type) {
    auto expr = std::make_shared<StepExpression>();
    expr->kind = StepExpressionKind::SubType;
    expr->raw_type = "subType";
    expr->inner = std::move(inner);
    expr->sub_type = std::move(type);
    return expr;
}

StepExpressionPtr StepExpression::binary(StepExpressionKind kind, StepExpressionPtr lhs,
                                         StepExpressionPtr rhs) {
    auto expr = std::make_shared<StepExpression>();
    expr->kind = kind;
    expr->raw_type = toString(kind);
    expr->lhs = std::move(lhs);
    expr->rhs = std::move(rhs);
    return expr;
}

StepExpressionPtr StepExpression::collect(StepExpressionPtr lhs, StepExpressionPtr rhs) {
    return binary(StepExpressionKind::Collect, std::move(lhs), std::move(rhs));
}

const char* toString(StepExpressionKind kind) {
    switch (kind) {
        case StepExpressionKind::AttackStep:   return "attackStep";
        case StepExpressionKind::Union:        return "union";
        case StepExpressionKind::Intersection: return "intersection";
        case StepExpressionKind::Difference:   return "difference";
        case StepExpressionKind::Variable:     return "variable";
        case StepExpressionKind::Field:        return "field";
        case StepExpressionKind::Transitive:   return "transitive";
        case StepExpressionKind::SubType:      return "subType";
        case StepExpressionKind::Collect:      return "collect";
        case StepExpressionKind::Unknown:      return "unknown";
    }
    return "unknown";
}

} // namespace malgraph
