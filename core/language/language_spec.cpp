#include "language/language_spec.hpp"
#include "common/document_io.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace malgraph {

// ─── StepType ──────────────────────────────────────────────────

const char* toString(StepType type) {
    switch (type) {
        case StepType::Or:       return "or";
        case StepType::And:      return "and";
        case StepType::Defense:  return "defense";
        case StepType::Exist:    return "exist";
        case StepType::NotExist: return "notExist";
    }
    return "or";
}

StepType stepTypeFromString(const std::string& name) {
    if (name == "or") return StepType::Or;
    if (name == "and") return StepType::And;
    if (name == "defense") return StepType::Defense;
    if (name == "exist") return StepType::Exist;
    if (name == "notExist") return StepType::NotExist;
    throw MalGraphError(MalGraphErrorCode::InvalidDocument, "Unknown attack step type: " + name);
}

std::optional<std::string> AttackStepSpec::mitreInfo() const {
    auto it = meta.find("mitre");
    if (it == meta.end() || it->is_null()) return std::nullopt;
    return it->is_string() ? it->get<std::string>() : it->dump();
}

// ─── Parsing ───────────────────────────────────────────────────

namespace {

std::vector<StepExpressionPtr> parseExpressionBlock(const nlohmann::json& block,
                                                    bool* overrides) {
    std::vector<StepExpressionPtr> exprs;
    if (block.is_null()) return exprs;
    if (overrides) *overrides = block.value("overrides", false);
    for (const auto& e : block.value("stepExpressions", nlohmann::json::array())) {
        exprs.push_back(StepExpression::fromJson(e));
    }
    return exprs;
}

AttackStepSpec parseAttackStep(const nlohmann::json& j) {
    AttackStepSpec step;
    step.name = j.at("name").get<std::string>();
    step.type = stepTypeFromString(j.at("type").get<std::string>());
    step.ttc = j.value("ttc", nlohmann::json());
    if (j.contains("tags") && j["tags"].is_array()) {
        step.tags = j["tags"].get<std::vector<std::string>>();
    }
    if (j.contains("meta") && j["meta"].is_object()) {
        step.meta = j["meta"];
    }
    if (j.contains("requires")) {
        step.requires_exprs = parseExpressionBlock(j["requires"], nullptr);
    }
    if (j.contains("reaches") && !j["reaches"].is_null()) {
        step.has_reaches = true;
        step.reaches_exprs = parseExpressionBlock(j["reaches"], &step.reaches_overrides);
    }
    return step;
}

} // namespace

LanguageSpec LanguageSpec::fromJson(const nlohmann::json& document) {
    LanguageSpec spec;
    try {
        for (const auto& a : document.at("assets")) {
            AssetType asset;
            asset.name = a.at("name").get<std::string>();
            if (a.contains("superAsset") && a["superAsset"].is_string()) {
                asset.super_asset = a["superAsset"].get<std::string>();
            }
            for (const auto& v : a.value("variables", nlohmann::json::array())) {
                asset.variables[v.at("name").get<std::string>()] =
                    StepExpression::fromJson(v.at("stepExpression"));
            }
            for (const auto& s : a.value("attackSteps", nlohmann::json::array())) {
                asset.attack_steps.push_back(parseAttackStep(s));
            }
            std::string name = asset.name;
            spec.assets_.emplace(name, std::move(asset));
        }

        for (const auto& a : document.value("associations", nlohmann::json::array())) {
            AssociationSpec assoc;
            assoc.name = a.at("name").get<std::string>();
            assoc.left_asset = a.at("leftAsset").get<std::string>();
            assoc.left_field = a.at("leftField").get<std::string>();
            assoc.right_asset = a.at("rightAsset").get<std::string>();
            assoc.right_field = a.at("rightField").get<std::string>();
            spec.associations_.push_back(std::move(assoc));
        }
    } catch (const nlohmann::json::exception& e) {
        throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                            std::string("Malformed language specification: ") + e.what());
    }

    spdlog::info("Loaded language specification with {} asset types and {} associations",
                 spec.assets_.size(), spec.associations_.size());
    return spec;
}

LanguageSpec LanguageSpec::loadFromFile(const std::string& path) {
    spdlog::info("Load language specification from '{}'", path);
    return fromJson(loadDocument(path));
}

// ─── Queries ───────────────────────────────────────────────────

const LanguageSpec::AssetType* LanguageSpec::findAssetType(const std::string& name) const {
    auto it = assets_.find(name);
    return it != assets_.end() ? &it->second : nullptr;
}

const LanguageSpec::AssetType* LanguageSpec::superOf(const AssetType& asset) const {
    if (asset.super_asset.empty()) return nullptr;
    const AssetType* super = findAssetType(asset.super_asset);
    if (!super) {
        spdlog::error("Asset type {} extends unknown asset type {}", asset.name, asset.super_asset);
    }
    return super;
}

std::vector<AttackStepSpec> LanguageSpec::attackStepsForAssetType(const std::string& asset_type) const {
    const AssetType* asset = findAssetType(asset_type);
    if (!asset) {
        spdlog::error("Failed to find asset type {} when looking for attack steps", asset_type);
        return {};
    }

    // Root first, so children can override or extend.
    std::vector<const AssetType*> chain;
    std::unordered_set<std::string> seen;
    for (const AssetType* a = asset; a && seen.insert(a->name).second; a = superOf(*a)) {
        chain.push_back(a);
    }

    std::vector<AttackStepSpec> steps;
    std::unordered_map<std::string, size_t> index;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        for (const AttackStepSpec& step : (*it)->attack_steps) {
            auto found = index.find(step.name);
            if (found == index.end()) {
                index[step.name] = steps.size();
                steps.push_back(step);
                continue;
            }
            if (!step.has_reaches) continue;
            AttackStepSpec& inherited = steps[found->second];
            if (step.reaches_overrides) {
                inherited = step;
            } else {
                inherited.has_reaches = true;
                inherited.reaches_exprs.insert(inherited.reaches_exprs.end(),
                                               step.reaches_exprs.begin(), step.reaches_exprs.end());
            }
        }
    }
    return steps;
}

std::vector<AssociationSpec> LanguageSpec::associationsForAssetType(const std::string& asset_type) const {
    const AssetType* asset = findAssetType(asset_type);
    if (!asset) {
        spdlog::error("Failed to find asset type {} when looking for associations", asset_type);
        return {};
    }

    std::vector<AssociationSpec> result;
    std::unordered_set<std::string> seen;
    for (const AssetType* a = asset; a && seen.insert(a->name).second; a = superOf(*a)) {
        for (const auto& assoc : associations_) {
            if (assoc.left_asset == a->name || assoc.right_asset == a->name) {
                result.push_back(assoc);
            }
        }
    }
    return result;
}

StepExpressionPtr LanguageSpec::variableForAssetType(const std::string& asset_type,
                                                     const std::string& variable_name) const {
    std::unordered_set<std::string> seen;
    for (const AssetType* a = findAssetType(asset_type); a && seen.insert(a->name).second; a = superOf(*a)) {
        auto it = a->variables.find(variable_name);
        if (it != a->variables.end()) return it->second;
    }
    spdlog::error("Failed to find variable {} in {}'s language specification",
                  variable_name, asset_type);
    return nullptr;
}

bool LanguageSpec::extendsAsset(const std::string& asset_type, const std::string& super_type) const {
    std::unordered_set<std::string> seen;
    for (const AssetType* a = findAssetType(asset_type); a && seen.insert(a->name).second; a = superOf(*a)) {
        if (a->name == super_type) return true;
    }
    return false;
}

} // namespace malgraph
