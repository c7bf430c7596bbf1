/**
 * @file FailureClassifier.cpp
 * @brief Default failure classification rules
 */

#include "FailureClassifier.hpp"
#include <cpl_error.h>

namespace opendem {

std::string failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::TRANSIENT_NETWORK: return "transient-network";
        case FailureKind::RESOURCE: return "resource";
        case FailureKind::CONFIGURATION: return "configuration";
        case FailureKind::OTHER: return "other";
    }
    return "other";
}

RuleBasedFailureClassifier::RuleBasedFailureClassifier()
    : rules_(default_rules()) {
}

RuleBasedFailureClassifier::RuleBasedFailureClassifier(std::vector<ClassificationRule> rules)
    : rules_(std::move(rules)) {
}

std::vector<ClassificationRule> RuleBasedFailureClassifier::default_rules() {
    return {
        // Structured codes
        {CPLE_OutOfMemory, "", FailureKind::RESOURCE},
        {CPLE_IllegalArg, "", FailureKind::CONFIGURATION},

        // Message patterns, resource first
        {std::nullopt, "No space left on device", FailureKind::RESOURCE},
        {std::nullopt, "Free disk space available", FailureKind::RESOURCE},
        {std::nullopt, "Could not resolve host", FailureKind::TRANSIENT_NETWORK},
        {std::nullopt, "IReadBlock failed", FailureKind::TRANSIENT_NETWORK},
    };
}

FailureKind RuleBasedFailureClassifier::classify(const RasterEngineError& error) const {
    const std::string message = error.what();

    for (const auto& rule : rules_) {
        if (rule.error_code && *rule.error_code != error.get_error_code()) {
            continue;
        }
        if (!rule.message_pattern.empty() &&
            message.find(rule.message_pattern) == std::string::npos) {
            continue;
        }
        if (!rule.error_code && rule.message_pattern.empty()) {
            continue;  // empty rule never matches
        }
        return rule.kind;
    }

    return FailureKind::OTHER;
}

} // namespace opendem
