#include "common/config.hpp"
#include "common/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

namespace malgraph {

namespace {

void readString(const YAML::Node& section, const char* key, std::string& out) {
    if (section[key]) {
        out = section[key].as<std::string>();
    }
}

} // namespace

ToolboxConfig ToolboxConfig::loadFromFile(const std::string& path) {
    ToolboxConfig config;
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw MalGraphError(MalGraphErrorCode::InvalidConfig,
                            "Failed to read config " + path + ": " + e.what());
    }

    YAML::Node logging = root["logging"];
    if (!logging) return config;
    if (!logging.IsMap()) {
        throw MalGraphError(MalGraphErrorCode::InvalidConfig,
                            "Config section 'logging' must be a map in " + path);
    }

    try {
        readString(logging, "output_dir", config.output_dir);
        readString(logging, "log_file", config.logging.log_file);
        readString(logging, "level", config.logging.level);
        readString(logging, "attackgraph_file", config.attackgraph_file);
        readString(logging, "model_file", config.model_file);
        readString(logging, "langspec_file", config.langspec_file);
    } catch (const YAML::Exception& e) {
        throw MalGraphError(MalGraphErrorCode::InvalidConfig,
                            "Invalid value in " + path + ": " + e.what());
    }
    return config;
}

void ToolboxConfig::prepareOutputDir() const {
    if (output_dir.empty()) return;
    std::filesystem::create_directories(output_dir);
}

} // namespace malgraph
