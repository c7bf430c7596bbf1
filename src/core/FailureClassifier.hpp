/**
 * @file FailureClassifier.hpp
 * @brief Classification of raster engine failures for the retry policy
 */

#pragma once

#include "Errors.hpp"
#include <optional>
#include <string>
#include <vector>

namespace opendem {

/**
 * @brief Failure kinds the acquisition step distinguishes
 */
enum class FailureKind {
    TRANSIENT_NETWORK,  ///< Retried with a fixed delay
    RESOURCE,           ///< Disk or memory exhaustion, never retried
    CONFIGURATION,      ///< Bad input, never retried
    OTHER               ///< Anything else, never retried
};

std::string failure_kind_name(FailureKind kind);

/**
 * @brief Strategy deciding the kind of an engine failure
 */
class FailureClassifier {
public:
    virtual ~FailureClassifier() = default;

    virtual FailureKind classify(const RasterEngineError& error) const = 0;
};

/**
 * @brief One classification rule
 *
 * A rule matches when its error code (if set) equals the failure's code and
 * its message pattern (if set) occurs in the failure's message.
 */
struct ClassificationRule {
    std::optional<int> error_code;
    std::string message_pattern;
    FailureKind kind;
};

/**
 * @brief Ordered rule list, first match wins
 *
 * The default rules check structured GDAL error numbers before message
 * patterns, and resource rules before network rules so that a disk-full
 * failure inside a network read is never retried.
 */
class RuleBasedFailureClassifier : public FailureClassifier {
public:
    RuleBasedFailureClassifier();
    explicit RuleBasedFailureClassifier(std::vector<ClassificationRule> rules);

    FailureKind classify(const RasterEngineError& error) const override;

    void add_rule(const ClassificationRule& rule) { rules_.push_back(rule); }
    const std::vector<ClassificationRule>& get_rules() const { return rules_; }

    static std::vector<ClassificationRule> default_rules();

private:
    std::vector<ClassificationRule> rules_;
};

} // namespace opendem
