/**
 * @file InputValidator.hpp
 * @brief Semantic validation of a loaded pipeline configuration
 *
 * Collects every conflict in one pass so the user can fix the configuration
 * file at once instead of one error per run.
 */

#pragma once

#include "opendem.hpp"
#include <string>
#include <vector>
#include <optional>

namespace opendem {

/**
 * @brief Represents a parameter conflict detected in the configuration
 */
struct ParameterConflict {
    std::string description;           // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;
    std::vector<ParameterConflict> warnings;  // Suspicious but runnable

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    void add(const ParameterConflict& conflict) {
        conflicts.push_back(conflict);
        is_valid = false;
    }

    void warn(const ParameterConflict& warning) {
        warnings.push_back(warning);
    }

    std::string format_error_message() const;
};

/**
 * @brief Validates configuration values and their combinations
 *
 * The vector-output-without-mask combination is not reported here; it is a
 * processing error raised by the exporter check at pipeline start.
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const PipelineConfig& config) const;

private:
    std::optional<ParameterConflict> check_required_strings(const PipelineConfig& config) const;

    std::optional<ParameterConflict> check_resolution(const PipelineConfig& config) const;

    /**
     * @brief min < max on both axes
     */
    std::optional<ParameterConflict> check_bounds_order(const PipelineConfig& config) const;

    /**
     * @brief Longitudes within [-180, 180], latitudes within [-90, 90]
     */
    std::optional<ParameterConflict> check_bounds_range(const PipelineConfig& config) const;

    /**
     * @brief min above max is allowed and yields an all-zero mask; reported as a warning
     */
    std::optional<ParameterConflict> check_mask_thresholds(const PipelineConfig& config) const;
};

} // namespace opendem
