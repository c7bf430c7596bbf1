/**
 * @file AcquisitionStep.hpp
 * @brief Retry-governed warp of the tiled source into a local RGB raster
 */

#pragma once

#include "opendem.hpp"
#include "FailureClassifier.hpp"
#include "Logger.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace opendem {

class RasterEngine;
class CancellationToken;

/**
 * @brief Bounded retry policy: fixed delay, no backoff, no jitter
 */
struct RetryPolicy {
    int max_retries = 5;
    std::chrono::milliseconds delay{10000};
};

/**
 * @brief Transient state of one acquisition
 */
struct RetryState {
    int attempt = 0;  ///< Transient failures seen so far
    std::optional<FailureKind> last_failure;
    std::string last_message;
};

/**
 * @brief Warps the source descriptor to EPSG:3857 at the configured resolution
 *
 * Transient network failures are retried up to max_retries attempts with a
 * fixed delay between them; every other failure kind aborts immediately.
 */
class AcquisitionStep {
public:
    static constexpr const char* TARGET_SRS = "EPSG:3857";
    static constexpr const char* BOUNDS_SRS = "EPSG:4326";

    /// Blocks for the given delay; returns false when the wait was cancelled
    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    AcquisitionStep(RasterEngine& engine, const FailureClassifier& classifier,
                    RetryPolicy policy = RetryPolicy());

    /**
     * @brief Replace the sleep used between attempts
     */
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    /**
     * @brief Check this token before and during each attempt and wait on it between attempts
     */
    void set_cancellation_token(const CancellationToken* token);

    /**
     * @brief Acquire the byte raster
     * @param descriptor_path Source descriptor written by SourceDescriptorBuilder
     * @param config Pipeline configuration (bounds, resolution)
     * @param destination Path of the 3-band byte raster to write
     * @throws MaxRetriesExceeded after max_retries transient failures
     * @throws ResourceError, ConfigurationError, ProcessingError otherwise
     */
    void acquire(const std::string& descriptor_path, const PipelineConfig& config,
                 const std::string& destination);

    /// Warp calls made by the last acquire()
    int get_attempts_made() const { return attempts_made_; }

    const RetryState& get_retry_state() const { return state_; }

private:
    RasterEngine& engine_;
    const FailureClassifier& classifier_;
    RetryPolicy policy_;
    Sleeper sleeper_;
    const CancellationToken* token_;
    Logger logger_;
    RetryState state_;
    int attempts_made_;

    [[noreturn]] void abort_with(FailureKind kind, const RasterEngineError& error) const;
};

} // namespace opendem
