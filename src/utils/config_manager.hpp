#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "config_types.hpp"

namespace etfarb {

class ConfigManager {
public:
    // Returns false when the file is missing or not valid JSON. Semantic
    // problems in a parsed file throw ConfigurationError.
    bool load(const std::string& file_path);
    bool load_from_string(const std::string& content);

    // Throws ConfigurationError describing the first violated constraint.
    static void validate(const EngineConfig& config);

    EngineConfig& get_config();
    const EngineConfig& get_config() const;

private:
    bool apply(const nlohmann::json& data);

    nlohmann::json config_data_;
    EngineConfig config_;
};

} // namespace etfarb
