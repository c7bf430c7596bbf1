/**
 * @file InputValidator.cpp
 * @brief Implementation of configuration validation
 */

#include "InputValidator.hpp"
#include <sstream>

namespace opendem {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "invalid parameters detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    return oss.str();
}

ValidationResult InputValidator::validate(const PipelineConfig& config) const {
    ValidationResult result;

    if (auto conflict = check_required_strings(config)) {
        result.add(*conflict);
    }
    if (auto conflict = check_resolution(config)) {
        result.add(*conflict);
    }
    if (auto conflict = check_bounds_order(config)) {
        result.add(*conflict);
    }
    if (auto conflict = check_bounds_range(config)) {
        result.add(*conflict);
    }
    if (auto warning = check_mask_thresholds(config)) {
        result.warn(*warning);
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_required_strings(
    const PipelineConfig& config) const {

    std::vector<std::string> empty_params;
    if (config.source.empty()) empty_params.push_back("source");
    if (config.process.empty()) empty_params.push_back("process");
    if (config.output.empty()) empty_params.push_back("output");
    if (config.cache_dir.empty()) empty_params.push_back("cache_dir");

    if (empty_params.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Required parameters are empty";
    conflict.involved_params = empty_params;
    conflict.suggestions.push_back("Provide a non-empty value for each listed key");
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_resolution(const PipelineConfig& config) const {
    if (config.resolution > 0.0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Resolution must be positive (EPSG:3857 metres per pixel)";
    conflict.involved_params.push_back("resolution = " + std::to_string(config.resolution));
    conflict.suggestions.push_back("Use e.g. 30 for roughly SRTM-like sampling");
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_bounds_order(const PipelineConfig& config) const {
    const auto& b = config.bounds;
    if (b.is_valid()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Bounds must satisfy min_lon < max_lon and min_lat < max_lat";
    conflict.involved_params.push_back("bounds = [" + std::to_string(b.min_x) + ", " +
                                       std::to_string(b.min_y) + ", " +
                                       std::to_string(b.max_x) + ", " +
                                       std::to_string(b.max_y) + "]");
    conflict.suggestions.push_back("Order the array as [min_lon, min_lat, max_lon, max_lat]");
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_bounds_range(const PipelineConfig& config) const {
    const auto& b = config.bounds;
    std::vector<std::string> out_of_range;

    auto check_lon = [&out_of_range](const std::string& name, double value) {
        if (value < -180.0 || value > 180.0) {
            out_of_range.push_back(name + " = " + std::to_string(value));
        }
    };
    auto check_lat = [&out_of_range](const std::string& name, double value) {
        if (value < -90.0 || value > 90.0) {
            out_of_range.push_back(name + " = " + std::to_string(value));
        }
    };

    check_lon("min_lon", b.min_x);
    check_lat("min_lat", b.min_y);
    check_lon("max_lon", b.max_x);
    check_lat("max_lat", b.max_y);

    if (out_of_range.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Bounds lie outside the geographic range";
    conflict.involved_params = out_of_range;
    conflict.suggestions.push_back("Longitudes must be within [-180, 180]");
    conflict.suggestions.push_back("Latitudes must be within [-90, 90]");
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_mask_thresholds(
    const PipelineConfig& config) const {

    if (!config.mask || !config.mask->min || !config.mask->max) {
        return std::nullopt;
    }
    if (*config.mask->min <= *config.mask->max) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Mask minimum exceeds mask maximum; the mask will be all zero";
    conflict.involved_params.push_back("mask.min = " + std::to_string(*config.mask->min));
    conflict.involved_params.push_back("mask.max = " + std::to_string(*config.mask->max));
    conflict.suggestions.push_back("Swap the two values");
    return conflict;
}

} // namespace opendem
