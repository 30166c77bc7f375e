#pragma once

#include "language/step_expression.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace malgraph {

/// Kind of an attack step. Defense, Exist and NotExist propagate like Or.
enum class StepType {
    Or,
    And,
    Defense,
    Exist,
    NotExist
};

const char* toString(StepType type);

/// Parse "or", "and", "defense", "exist", "notExist".
/// Throws MalGraphError(InvalidDocument) for anything else.
StepType stepTypeFromString(const std::string& name);

/// An attack step of an asset type, inheritance already applied.
struct AttackStepSpec {
    std::string name;
    StepType type = StepType::Or;
    nlohmann::json ttc;                     // opaque distribution descriptor
    std::vector<std::string> tags;
    nlohmann::json meta = nlohmann::json::object();
    std::vector<StepExpressionPtr> requires_exprs;
    std::vector<StepExpressionPtr> reaches_exprs;
    bool reaches_overrides = false;
    bool has_reaches = false;

    std::optional<std::string> mitreInfo() const;
};

/// Association between two asset types. `left_field` names the left-side
/// assets as seen from the right asset, and vice versa.
struct AssociationSpec {
    std::string name;
    std::string left_asset;
    std::string left_field;
    std::string right_asset;
    std::string right_field;
};

/// What the attack graph engine needs from a compiled language.
class LanguageQuery {
public:
    virtual ~LanguageQuery() = default;

    /// Attack steps for an asset type with inherited steps flattened in.
    /// Parent steps come first, in declaration order.
    virtual std::vector<AttackStepSpec> attackStepsForAssetType(const std::string& asset_type) const = 0;

    /// Associations touching an asset type, including inherited ones.
    virtual std::vector<AssociationSpec> associationsForAssetType(const std::string& asset_type) const = 0;

    /// Step expression bound to a `let` variable, searched up the super chain.
    /// nullptr when the variable does not exist.
    virtual StepExpressionPtr variableForAssetType(const std::string& asset_type,
                                                   const std::string& variable_name) const = 0;

    /// True if asset_type equals super_type or inherits from it.
    virtual bool extendsAsset(const std::string& asset_type, const std::string& super_type) const = 0;
};

/// LanguageQuery over the JSON document emitted by the MAL compiler
/// ({"assets": [...], "associations": [...]}).
class LanguageSpec : public LanguageQuery {
public:
    LanguageSpec() = default;

    static LanguageSpec fromJson(const nlohmann::json& document);
    static LanguageSpec loadFromFile(const std::string& path);

    std::vector<AttackStepSpec> attackStepsForAssetType(const std::string& asset_type) const override;
    std::vector<AssociationSpec> associationsForAssetType(const std::string& asset_type) const override;
    StepExpressionPtr variableForAssetType(const std::string& asset_type,
                                           const std::string& variable_name) const override;
    bool extendsAsset(const std::string& asset_type, const std::string& super_type) const override;

    bool hasAssetType(const std::string& asset_type) const { return assets_.count(asset_type) > 0; }
    size_t assetTypeCount() const { return assets_.size(); }

private:
    struct AssetType {
        std::string name;
        std::string super_asset;            // empty = root
        std::vector<AttackStepSpec> attack_steps;
        std::unordered_map<std::string, StepExpressionPtr> variables;
    };

    const AssetType* findAssetType(const std::string& name) const;
    const AssetType* superOf(const AssetType& asset) const;

    std::unordered_map<std::string, AssetType> assets_;
    std::vector<AssociationSpec> associations_;
};

} // namespace malgraph
