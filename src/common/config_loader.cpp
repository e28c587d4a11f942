#include "common/config_loader.h"

#include <fstream>
#include <stdexcept>

#include "common/logger.h"
#include "phone/country_hint_resolver.h"

namespace phonenorm {

bool ConfigLoader::loadFromFile(const std::string& config_file, NormalizerConfig& config) {
    try {
        std::ifstream infile(config_file);
        if (!infile) {
            LOG_ERROR("Failed to open config file: " << config_file);
            return false;
        }

        nlohmann::json j;
        infile >> j;

        NormalizerConfig parsed = config;
        parseConfig(j, parsed);
        config = parsed;

        LOG_INFO("Configuration loaded from: " << config_file);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load config: " << e.what());
        return false;
    }
}

bool ConfigLoader::loadFromJson(const std::string& json_str, NormalizerConfig& config) {
    try {
        nlohmann::json j = nlohmann::json::parse(json_str);
        NormalizerConfig parsed = config;
        parseConfig(j, parsed);
        config = parsed;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to parse JSON config: " << e.what());
        return false;
    }
}

void ConfigLoader::applyLogLevel(const NormalizerConfig& config) {
    Logger::getInstance().setLevel(config.log_level);
    LOG_DEBUG("Log level set to {}", logLevelToString(config.log_level));
}

bool ConfigLoader::saveToFile(const std::string& config_file, const NormalizerConfig& config) {
    try {
        nlohmann::json j = configToJson(config);

        std::ofstream outfile(config_file);
        if (!outfile) {
            LOG_ERROR("Failed to open config file for writing: " << config_file);
            return false;
        }

        outfile << j.dump(2);  // Pretty print with 2-space indent

        LOG_INFO("Configuration saved to: " << config_file);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save config: " << e.what());
        return false;
    }
}

std::string ConfigLoader::getDefaultConfigJson() {
    NormalizerConfig default_config;
    ConfigLoader loader;
    return loader.configToJson(default_config).dump(2);
}

void ConfigLoader::parseConfig(const nlohmann::json& j, NormalizerConfig& config) {
    // Normalizer settings
    if (j.contains("normalizer")) {
        const auto& normalizer = j["normalizer"];
        if (normalizer.contains("default_country")) {
            std::string country = normalizer["default_country"].get<std::string>();
            if (!phone::CountryHintResolver::resolve(country)) {
                throw std::invalid_argument("unknown default_country: " + country);
            }
            config.default_country = country;
        }
    }

    // Logging settings
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        if (logging.contains("level")) {
            std::string name = logging["level"].get<std::string>();
            auto level = logLevelFromString(name);
            if (!level) {
                throw std::invalid_argument("unknown log level: " + name);
            }
            config.log_level = *level;
        }
    }
}

nlohmann::json ConfigLoader::configToJson(const NormalizerConfig& config) {
    nlohmann::json j;

    j["normalizer"] = {{"default_country", config.default_country}};
    j["logging"] = {{"level", logLevelToString(config.log_level)}};

    return j;
}

}  // namespace phonenorm
