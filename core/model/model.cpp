#include "model/model.hpp"
#include "common/document_io.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <optional>

namespace malgraph {

// ─── Construction ──────────────────────────────────────────────

const Asset& Model::addAsset(const std::string& name, const std::string& type) {
    return addAssetWithId(next_asset_id_, name, type);
}

const Asset& Model::addAssetWithId(uint64_t id, const std::string& name, const std::string& type) {
    if (by_id_.count(id)) {
        throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                            "Asset id already exists: " + std::to_string(id));
    }
    if (by_name_.count(name)) {
        throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                            "Asset name already exists: " + name);
    }
    auto asset = std::make_unique<Asset>();
    asset->id = id;
    asset->name = name;
    asset->type = type;
    Asset* raw = asset.get();
    assets_.push_back(std::move(asset));
    by_id_[id] = raw;
    by_name_[name] = raw;
    if (id >= next_asset_id_) {
        next_asset_id_ = id + 1;
    }
    return *raw;
}

Asset& Model::requireAsset(uint64_t id) {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        throw MalGraphError(MalGraphErrorCode::UnknownAsset,
                            "Asset not found: " + std::to_string(id));
    }
    return *it->second;
}

void Model::setProperty(uint64_t asset_id, const std::string& property, double value) {
    requireAsset(asset_id).properties[property] = value;
}

void Model::addAssociation(const std::string& name,
                           const std::string& left_field, const std::vector<uint64_t>& left_ids,
                           const std::string& right_field, const std::vector<uint64_t>& right_ids) {
    Association assoc;
    assoc.name = name;
    assoc.left_field = left_field;
    assoc.right_field = right_field;
    for (uint64_t id : left_ids) assoc.left_assets.push_back(&requireAsset(id));
    for (uint64_t id : right_ids) assoc.right_assets.push_back(&requireAsset(id));
    associations_.push_back(std::move(assoc));
}

uint64_t Model::addAttacker(const std::string& name,
                            const std::vector<std::pair<uint64_t, std::vector<std::string>>>& entry_points) {
    AttackerDefinition attacker;
    attacker.id = next_attacker_id_++;
    attacker.name = name;
    for (const auto& [asset_id, steps] : entry_points) {
        attacker.entry_points.emplace_back(&requireAsset(asset_id), steps);
    }
    attackers_.push_back(std::move(attacker));
    return attackers_.back().id;
}

// ─── Loading ───────────────────────────────────────────────────

namespace {

std::optional<uint64_t> tryParseId(const std::string& key) {
    uint64_t id = 0;
    const char* end = key.data() + key.size();
    auto [ptr, ec] = std::from_chars(key.data(), end, id);
    if (ec != std::errc() || ptr != end || key.empty()) return std::nullopt;
    return id;
}

uint64_t parseId(const std::string& key) {
    auto id = tryParseId(key);
    if (!id) {
        throw MalGraphError(MalGraphErrorCode::InvalidDocument, "Invalid id in model: " + key);
    }
    return *id;
}

// Object keys come back sorted as strings; order entries by numeric id.
std::vector<std::pair<uint64_t, nlohmann::json>> byNumericId(const nlohmann::json& object) {
    std::vector<std::pair<uint64_t, nlohmann::json>> entries;
    for (const auto& [key, value] : object.items()) {
        entries.emplace_back(parseId(key), value);
    }
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return entries;
}

uint64_t idFromJson(const nlohmann::json& j) {
    return j.is_string() ? parseId(j.get<std::string>()) : j.get<uint64_t>();
}

std::vector<uint64_t> idList(const nlohmann::json& targets) {
    std::vector<uint64_t> ids;
    if (targets.is_array()) {
        for (const auto& t : targets) ids.push_back(idFromJson(t));
    } else {
        ids.push_back(idFromJson(targets));
    }
    return ids;
}

} // namespace

Model Model::fromJson(const nlohmann::json& document) {
    try {
        Model model(document.value("metadata", nlohmann::json::object()).value("name", ""));

        for (const auto& [id, info] : byNumericId(document.value("assets", nlohmann::json::object()))) {
            std::string type = info.contains("type") ? info["type"].get<std::string>()
                                                     : info.value("metaconcept", "");
            const Asset& asset = model.addAssetWithId(id, info.at("name").get<std::string>(), type);
            for (const auto& [defense, value] : info.value("defenses", nlohmann::json::object()).items()) {
                double v = value.is_string() ? std::stod(value.get<std::string>()) : value.get<double>();
                model.setProperty(asset.id, defense, v);
            }
        }

        for (const auto& entry : document.value("associations", nlohmann::json::array())) {
            if (!entry.is_object() || entry.size() != 1) {
                throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                                    "Only one key per association allowed: " + entry.dump());
            }
            const std::string assoc_name = entry.begin().key();
            const nlohmann::json& fields = entry.begin().value();
            if (!fields.is_object() || fields.size() != 2) {
                throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                                    "Association " + assoc_name + " must have exactly two fields");
            }
            auto left = fields.begin();
            auto right = std::next(left);
            model.addAssociation(assoc_name.substr(0, assoc_name.find('_')),
                                 left.key(), idList(left.value()),
                                 right.key(), idList(right.value()));
        }

        for (const auto& [id, info] : byNumericId(document.value("attackers", nlohmann::json::object()))) {
            AttackerDefinition attacker;
            attacker.id = id;
            attacker.name = info.value("name", "Attacker:" + std::to_string(id));
            for (const auto& [key, ep] : info.value("entry_points", nlohmann::json::object()).items()) {
                // Keyed by asset name with an asset_id field, or by bare asset id.
                const Asset* asset = nullptr;
                if (ep.contains("asset_id")) {
                    asset = model.assetById(idFromJson(ep["asset_id"]));
                } else {
                    asset = model.assetByName(key);
                    auto asset_id = tryParseId(key);
                    if (!asset && asset_id) asset = model.assetById(*asset_id);
                }
                if (!asset) {
                    throw MalGraphError(MalGraphErrorCode::UnknownAsset,
                                        "Attacker " + attacker.name + " entry point refers to unknown asset " + key);
                }
                attacker.entry_points.emplace_back(
                    asset, ep.at("attack_steps").get<std::vector<std::string>>());
            }
            if (attacker.id >= model.next_attacker_id_) {
                model.next_attacker_id_ = attacker.id + 1;
            }
            model.attackers_.push_back(std::move(attacker));
        }

        spdlog::info("Loaded model '{}' with {} assets, {} associations, {} attackers",
                     model.name_, model.assets_.size(), model.associations_.size(),
                     model.attackers_.size());
        return model;
    } catch (const nlohmann::json::exception& e) {
        throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                            std::string("Malformed model document: ") + e.what());
    }
}

Model Model::loadFromFile(const std::string& path) {
    spdlog::info("Loading model from {} file", path);
    return fromJson(loadDocument(path));
}

// ─── Queries ───────────────────────────────────────────────────

std::vector<const Asset*> Model::assets() const {
    std::vector<const Asset*> result;
    result.reserve(assets_.size());
    for (const auto& a : assets_) result.push_back(a.get());
    return result;
}

std::vector<const Asset*> Model::associatedAssets(const Asset& asset, const std::string& field) const {
    std::vector<const Asset*> result;
    auto contains = [&](const std::vector<const Asset*>& side) {
        for (const Asset* a : side) {
            if (a == &asset) return true;
        }
        return false;
    };
    for (const auto& assoc : associations_) {
        if (assoc.right_field == field && contains(assoc.left_assets)) {
            result.insert(result.end(), assoc.right_assets.begin(), assoc.right_assets.end());
        }
        if (assoc.left_field == field && contains(assoc.right_assets)) {
            result.insert(result.end(), assoc.left_assets.begin(), assoc.left_assets.end());
        }
    }
    return result;
}

std::optional<double> Model::property(const Asset& asset, const std::string& name) const {
    auto it = asset.properties.find(name);
    if (it == asset.properties.end()) return std::nullopt;
    return it->second;
}

const Asset* Model::assetByName(const std::string& name) const {
    auto it = by_name_.find(name);
    return it != by_name_.end() ? it->second : nullptr;
}

const Asset* Model::assetById(uint64_t id) const {
    auto it = by_id_.find(id);
    return it != by_id_.end() ? it->second : nullptr;
}

std::vector<AttackerDefinition> Model::attackers() const {
    return attackers_;
}

} // namespace malgraph
