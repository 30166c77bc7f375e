#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace malgraph {

enum class DocumentFormat {
    Json,
    Yaml
};

/// Format selected from the file extension (.json, .yml, .yaml).
/// Any other extension throws MalGraphError(UnknownFileFormat); the content
/// is never inspected to guess a format.
DocumentFormat documentFormatFor(const std::string& path);

/// Read a JSON or YAML file into a json document.
nlohmann::json loadDocument(const std::string& path);

/// Write a json document as JSON or YAML, by extension.
void saveDocument(const std::string& path, const nlohmann::json& document);

// ── YAML bridge ──

nlohmann::json yamlToJson(const std::string& yaml_text);
std::string jsonToYaml(const nlohmann::json& document);

} // namespace malgraph
