/**
 * @file ConfigurationManager.hpp
 * @brief Configuration file loading for the terrain derivative pipeline
 */

#pragma once

#include "opendem.hpp"
#include "../core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace opendem {

/**
 * @brief Loads a JSON configuration document into a PipelineConfig
 *
 * Loading is all-or-nothing: type errors and missing required keys raise
 * ConfigurationError, then InputValidator checks the values and every
 * conflict it finds is reported in one ConfigurationError.
 */
class ConfigurationManager {
public:
    ConfigurationManager();

    /**
     * @brief Load and validate a configuration file
     * @param filename Path to the JSON configuration
     * @return Validated configuration
     * @throws ConfigurationError on unreadable, malformed or invalid input
     */
    PipelineConfig load_from_file(const std::string& filename) const;

    /**
     * @brief Parse and validate a JSON document held in memory
     */
    PipelineConfig load_from_string(const std::string& text) const;

    /**
     * @brief Convert a parsed document, checking keys and types only
     * @throws ConfigurationError on missing required keys or wrong types
     */
    static PipelineConfig from_json(const nlohmann::json& document);

    /**
     * @brief Serialize a configuration back to the document format
     */
    static nlohmann::json to_json(const PipelineConfig& config);

    /**
     * @brief Run InputValidator and throw on any conflict
     */
    static void validate(const PipelineConfig& config);

private:
    Logger logger_;
};

} // namespace opendem
