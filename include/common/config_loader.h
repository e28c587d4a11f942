#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "common/types.h"

namespace phonenorm {

/**
 * Configuration loader for JSON config files
 *
 * Layout:
 *   { "normalizer": { "default_country": "VN" }, "logging": { "level": "info" } }
 */
class ConfigLoader {
public:
    ConfigLoader() = default;
    ~ConfigLoader() = default;

    /**
     * Load configuration from file
     * @param config_file Path to config file (JSON format)
     * @param config Output configuration, left untouched on failure
     * @return true on success
     */
    bool loadFromFile(const std::string& config_file, NormalizerConfig& config);

    /**
     * Load configuration from JSON string
     * @param json_str JSON string
     * @param config Output configuration, left untouched on failure
     * @return true on success
     */
    bool loadFromJson(const std::string& json_str, NormalizerConfig& config);

    /**
     * Push the configured log level into the global Logger
     */
    void applyLogLevel(const NormalizerConfig& config);

    /**
     * Save configuration to file
     * @param config_file Path to output file
     * @param config Configuration to save
     * @return true on success
     */
    bool saveToFile(const std::string& config_file, const NormalizerConfig& config);

    /**
     * Get default configuration as JSON string
     * @return JSON string
     */
    static std::string getDefaultConfigJson();

private:
    /**
     * Parse config from JSON object, throws on invalid values
     */
    void parseConfig(const nlohmann::json& j, NormalizerConfig& config);

    /**
     * Convert config to JSON object
     */
    nlohmann::json configToJson(const NormalizerConfig& config);
};

}  // namespace phonenorm
