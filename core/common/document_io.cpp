#include "common/document_io.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace malgraph {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Plain (untagged) scalars are typed the way a YAML 1.2 core schema reader
// would; quoted scalars always stay strings.
nlohmann::json scalarToJson(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() == "!") {
        return text;
    }
    if (text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return nullptr;
    }
    bool b = false;
    if (YAML::convert<bool>::decode(node, b) &&
        (text == "true" || text == "false" || text == "True" || text == "False")) {
        return b;
    }
    int64_t i = 0;
    if (YAML::convert<int64_t>::decode(node, i)) {
        return i;
    }
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) {
        return d;
    }
    return text;
}

nlohmann::json nodeToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalarToJson(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(nodeToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = nodeToJson(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

void emitJson(YAML::Emitter& out, const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
            out << YAML::Null;
            break;
        case nlohmann::json::value_t::boolean:
            out << value.get<bool>();
            break;
        case nlohmann::json::value_t::number_integer:
            out << value.get<int64_t>();
            break;
        case nlohmann::json::value_t::number_unsigned:
            out << value.get<uint64_t>();
            break;
        case nlohmann::json::value_t::number_float:
            out << value.get<double>();
            break;
        case nlohmann::json::value_t::string:
            out << YAML::DoubleQuoted << value.get<std::string>();
            break;
        case nlohmann::json::value_t::array:
            out << YAML::BeginSeq;
            for (const auto& item : value) emitJson(out, item);
            out << YAML::EndSeq;
            break;
        case nlohmann::json::value_t::object:
            out << YAML::BeginMap;
            for (const auto& [key, item] : value.items()) {
                out << YAML::Key << YAML::DoubleQuoted << key << YAML::Value;
                emitJson(out, item);
            }
            out << YAML::EndMap;
            break;
        default:
            out << YAML::Null;
            break;
    }
}

} // namespace

DocumentFormat documentFormatFor(const std::string& path) {
    if (endsWith(path, ".json")) return DocumentFormat::Json;
    if (endsWith(path, ".yml") || endsWith(path, ".yaml")) return DocumentFormat::Yaml;
    throw MalGraphError(MalGraphErrorCode::UnknownFileFormat,
                        "Unknown file extension for " + path + ", expected json/yml/yaml");
}

nlohmann::json loadDocument(const std::string& path) {
    DocumentFormat format = documentFormatFor(path);
    std::ifstream in(path);
    if (!in) {
        throw MalGraphError(MalGraphErrorCode::InvalidDocument, "Cannot open " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    spdlog::debug("Loading document from {}", path);
    try {
        if (format == DocumentFormat::Json) {
            return nlohmann::json::parse(buffer.str());
        }
        return yamlToJson(buffer.str());
    } catch (const nlohmann::json::exception& e) {
        throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                            "Malformed JSON in " + path + ": " + e.what());
    } catch (const YAML::Exception& e) {
        throw MalGraphError(MalGraphErrorCode::InvalidDocument,
                            "Malformed YAML in " + path + ": " + e.what());
    }
}

void saveDocument(const std::string& path, const nlohmann::json& document) {
    DocumentFormat format = documentFormatFor(path);
    std::ofstream out(path);
    if (!out) {
        throw MalGraphError(MalGraphErrorCode::InvalidDocument, "Cannot write " + path);
    }
    spdlog::debug("Saving document to {}", path);
    if (format == DocumentFormat::Json) {
        out << document.dump(2) << "\n";
    } else {
        out << jsonToYaml(document) << "\n";
    }
}

nlohmann::json yamlToJson(const std::string& yaml_text) {
    return nodeToJson(YAML::Load(yaml_text));
}

std::string jsonToYaml(const nlohmann::json& document) {
    YAML::Emitter out;
    emitJson(out, document);
    return out.c_str();
}

} // namespace malgraph
