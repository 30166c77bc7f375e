#pragma once

#include "common/logging.hpp"

#include <string>

namespace malgraph {

/// Tool configuration. Output file entries left empty are not written.
struct ToolboxConfig {
    std::string output_dir = "tmp";
    std::string attackgraph_file;
    std::string model_file;
    std::string langspec_file;
    LoggingConfig logging;

    /// Load from a YAML file. Keys missing from the file keep their defaults.
    /// Throws MalGraphError(InvalidConfig) on a malformed file.
    static ToolboxConfig loadFromFile(const std::string& path);

    /// Create output_dir if it is set.
    void prepareOutputDir() const;
};

} // namespace malgraph
