/**
 * @file Errors.hpp
 * @brief Exception taxonomy for the acquisition and processing pipeline
 */

#pragma once

#include <stdexcept>
#include <string>

namespace opendem {

/**
 * @brief Base class of every error the pipeline raises on purpose
 */
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Missing or invalid configuration value (fatal, never retried)
 */
class ConfigurationError : public PipelineError {
public:
    explicit ConfigurationError(const std::string& message)
        : PipelineError("Configuration error: " + message) {}
};

/**
 * @brief Unsupported derivative or invalid mask/export combination
 */
class ProcessingError : public PipelineError {
public:
    explicit ProcessingError(const std::string& message)
        : PipelineError("Processing error: " + message) {}
};

/**
 * @brief Resource exhaustion reported by the raster engine (disk, memory)
 */
class ResourceError : public PipelineError {
public:
    explicit ResourceError(const std::string& message)
        : PipelineError("Resource error: " + message) {}
};

/**
 * @brief Network failure the acquisition step considers transient
 */
class TransientNetworkError : public PipelineError {
public:
    explicit TransientNetworkError(const std::string& message)
        : PipelineError("Transient network error: " + message) {}
};

/**
 * @brief Acquisition gave up after the configured number of attempts
 */
class MaxRetriesExceeded : public TransientNetworkError {
public:
    MaxRetriesExceeded(int attempts, const std::string& last_message)
        : TransientNetworkError("giving up after " + std::to_string(attempts) +
                                " attempts, last failure: " + last_message),
          attempts_(attempts), last_message_(last_message) {}

    int get_attempts() const { return attempts_; }
    const std::string& get_last_message() const { return last_message_; }

private:
    int attempts_;
    std::string last_message_;
};

/**
 * @brief Run aborted by a user interrupt
 */
class OperationCancelled : public PipelineError {
public:
    explicit OperationCancelled(const std::string& stage)
        : PipelineError("Operation cancelled before stage: " + stage), stage_(stage) {}

    const std::string& get_stage() const { return stage_; }

private:
    std::string stage_;
};

/**
 * @brief Failure raised by a raster engine call
 *
 * Carries the engine's structured error number next to its message so the
 * failure classifier can prefer the code over message matching.
 */
class RasterEngineError : public std::runtime_error {
public:
    RasterEngineError(int error_code, const std::string& message)
        : std::runtime_error(message), error_code_(error_code) {}

    int get_error_code() const { return error_code_; }

private:
    int error_code_;
};

} // namespace opendem
