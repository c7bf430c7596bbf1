/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for the terrain derivative pipeline
 */

#include "ConfigurationManager.hpp"
#include "../core/Errors.hpp"
#include "../core/InputValidator.hpp"
#include <fstream>
#include <sstream>
#include <vector>

namespace opendem {

using json = nlohmann::json;

namespace {

const std::vector<std::string> REQUIRED_KEYS = {
    "source", "bounds", "resolution", "process", "output"
};

std::string get_string(const json& document, const std::string& key) {
    const json& value = document.at(key);
    if (!value.is_string()) {
        throw ConfigurationError("'" + key + "' must be a string");
    }
    return value.get<std::string>();
}

double get_number(const json& value, const std::string& key) {
    if (!value.is_number()) {
        throw ConfigurationError("'" + key + "' must be a number");
    }
    return value.get<double>();
}

MaskThresholds parse_mask(const json& value) {
    if (!value.is_object()) {
        throw ConfigurationError("'mask' must be an object with optional 'min' and 'max'");
    }

    MaskThresholds mask;
    if (value.contains("min") && !value["min"].is_null()) {
        mask.min = get_number(value["min"], "mask.min");
    }
    if (value.contains("max") && !value["max"].is_null()) {
        mask.max = get_number(value["max"], "mask.max");
    }
    return mask;
}

} // namespace

ConfigurationManager::ConfigurationManager() : logger_("Configuration") {
}

PipelineConfig ConfigurationManager::load_from_file(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open config file " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    logger_.debug("Loading configuration from " + filename);
    return load_from_string(buffer.str());
}

PipelineConfig ConfigurationManager::load_from_string(const std::string& text) const {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("malformed JSON: ") + e.what());
    }

    PipelineConfig config = from_json(document);
    validate(config);
    return config;
}

PipelineConfig ConfigurationManager::from_json(const json& document) {
    if (!document.is_object()) {
        throw ConfigurationError("top level of the config file must be an object");
    }

    std::string missing;
    for (const auto& key : REQUIRED_KEYS) {
        if (!document.contains(key) || document[key].is_null()) {
            if (!missing.empty()) missing += ", ";
            missing += key;
        }
    }
    if (!missing.empty()) {
        throw ConfigurationError("missing required keys: " + missing);
    }

    PipelineConfig config;

    try {
        config.source = get_string(document, "source");
        config.process = get_string(document, "process");
        config.output = get_string(document, "output");
        config.resolution = get_number(document["resolution"], "resolution");

        const json& bounds = document["bounds"];
        if (!bounds.is_array() || bounds.size() != 4) {
            throw ConfigurationError("'bounds' must be an array [min_lon, min_lat, max_lon, max_lat]");
        }
        config.bounds = BoundingBox(get_number(bounds[0], "bounds[0]"),
                                    get_number(bounds[1], "bounds[1]"),
                                    get_number(bounds[2], "bounds[2]"),
                                    get_number(bounds[3], "bounds[3]"));

        if (document.contains("clipping") && !document["clipping"].is_null()) {
            config.clipping = get_string(document, "clipping");
        }

        if (document.contains("mask") && !document["mask"].is_null()) {
            config.mask = parse_mask(document["mask"]);
        }

        if (document.contains("cache_dir")) {
            config.cache_dir = get_string(document, "cache_dir");
        }

        if (document.contains("log_level")) {
            const json& level = document["log_level"];
            if (level.is_number_integer()) {
                config.log_level = std::to_string(level.get<int>());
            } else if (level.is_string()) {
                config.log_level = level.get<std::string>();
            } else {
                throw ConfigurationError("'log_level' must be an integer or a facility string");
            }
        }

        if (document.contains("log_file") && !document["log_file"].is_null()) {
            config.log_file = get_string(document, "log_file");
        }
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid value: ") + e.what());
    }

    return config;
}

json ConfigurationManager::to_json(const PipelineConfig& config) {
    json document;
    document["source"] = config.source;
    document["bounds"] = {config.bounds.min_x, config.bounds.min_y,
                          config.bounds.max_x, config.bounds.max_y};
    document["resolution"] = config.resolution;
    document["process"] = config.process;
    document["output"] = config.output;
    document["cache_dir"] = config.cache_dir;
    document["log_level"] = config.log_level;

    if (config.clipping) document["clipping"] = *config.clipping;
    if (config.log_file) document["log_file"] = *config.log_file;

    if (config.mask) {
        json mask = json::object();
        if (config.mask->min) mask["min"] = *config.mask->min;
        if (config.mask->max) mask["max"] = *config.mask->max;
        document["mask"] = mask;
    }

    return document;
}

void ConfigurationManager::validate(const PipelineConfig& config) {
    InputValidator validator;
    ValidationResult result = validator.validate(config);
    if (!result.warnings.empty()) {
        Logger logger("Configuration");
        for (const auto& warning : result.warnings) {
            std::string params;
            for (const auto& param : warning.involved_params) {
                params += (params.empty() ? " (" : ", ") + param;
            }
            logger.warning(warning.description + (params.empty() ? "" : params + ")"));
        }
    }
    if (result.has_errors()) {
        throw ConfigurationError(result.format_error_message());
    }
}

} // namespace opendem
