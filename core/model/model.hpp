#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace malgraph {

/// A concrete asset of an instance model. Owned by the model; the attack
/// graph only keeps non-owning pointers to it.
struct Asset {
    uint64_t id = 0;
    std::string name;
    std::string type;                                   // empty = untyped
    std::unordered_map<std::string, double> properties; // defense values etc.
};

/// An attacker as declared by the model: entry points are attack step names
/// per asset.
struct AttackerDefinition {
    uint64_t id = 0;
    std::string name;
    std::vector<std::pair<const Asset*, std::vector<std::string>>> entry_points;
};

/// What the attack graph engine needs from an instance model.
class ModelQuery {
public:
    virtual ~ModelQuery() = default;

    virtual std::string name() const = 0;
    virtual std::vector<const Asset*> assets() const = 0;

    /// Assets reachable from `asset` through the association field `field`.
    /// The same asset may appear several times if several associations
    /// lead to it.
    virtual std::vector<const Asset*> associatedAssets(const Asset& asset,
                                                       const std::string& field) const = 0;

    /// Declared property value (e.g. a defense), nullopt when undeclared.
    virtual std::optional<double> property(const Asset& asset, const std::string& name) const = 0;

    virtual const Asset* assetByName(const std::string& name) const = 0;
    virtual const Asset* assetById(uint64_t id) const = 0;
    virtual std::vector<AttackerDefinition> attackers() const = 0;
};

/// An association instance: two named fields, each holding assets.
/// Assets in `left_assets` see `right_assets` through `right_field`.
struct Association {
    std::string name;
    std::string left_field;
    std::vector<const Asset*> left_assets;
    std::string right_field;
    std::vector<const Asset*> right_assets;
};

/// In-memory instance model.
class Model : public ModelQuery {
public:
    explicit Model(std::string name = "") : name_(std::move(name)) {}

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;
    Model(Model&&) = default;
    Model& operator=(Model&&) = default;

    // ── Construction ──
    const Asset& addAsset(const std::string& name, const std::string& type);
    const Asset& addAssetWithId(uint64_t id, const std::string& name, const std::string& type);
    void setProperty(uint64_t asset_id, const std::string& property, double value);
    void addAssociation(const std::string& name,
                        const std::string& left_field, const std::vector<uint64_t>& left_ids,
                        const std::string& right_field, const std::vector<uint64_t>& right_ids);
    uint64_t addAttacker(const std::string& name,
                         const std::vector<std::pair<uint64_t, std::vector<std::string>>>& entry_points);

    /// Load the toolbox model format from a .json/.yml/.yaml file.
    static Model loadFromFile(const std::string& path);
    static Model fromJson(const nlohmann::json& document);

    // ── ModelQuery ──
    std::string name() const override { return name_; }
    std::vector<const Asset*> assets() const override;
    std::vector<const Asset*> associatedAssets(const Asset& asset,
                                               const std::string& field) const override;
    std::optional<double> property(const Asset& asset, const std::string& name) const override;
    const Asset* assetByName(const std::string& name) const override;
    const Asset* assetById(uint64_t id) const override;
    std::vector<AttackerDefinition> attackers() const override;

    size_t assetCount() const { return assets_.size(); }
    size_t associationCount() const { return associations_.size(); }

private:
    Asset& requireAsset(uint64_t id);

    std::string name_;
    uint64_t next_asset_id_ = 0;
    uint64_t next_attacker_id_ = 0;

    std::vector<std::unique_ptr<Asset>> assets_;
    std::unordered_map<uint64_t, Asset*> by_id_;
    std::unordered_map<std::string, Asset*> by_name_;
    std::vector<Association> associations_;
    std::vector<AttackerDefinition> attackers_;
};

} // namespace malgraph
