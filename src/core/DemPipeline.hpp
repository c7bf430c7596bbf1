/**
 * @file DemPipeline.hpp
 * @brief Linear stage orchestration from tile source to exported product
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "opendem.hpp"
#include "FailureClassifier.hpp"
#include "AcquisitionStep.hpp"
#include "Logger.hpp"
#include "StageTracker.hpp"
#include <string>

namespace opendem {

class RasterEngine;
class CancellationToken;

/**
 * @brief Runs descriptor, acquisition, decode, terrain, mask and export in order
 *
 * Each stage consumes the previous stage's artifact by path in the cache
 * directory. A failing stage aborts the run; nothing is resumed and
 * intermediate artifacts are left in place.
 */
class DemPipeline {
public:
    static constexpr const char* RGB_FILENAME = "temp_rgb.tif";
    static constexpr const char* ELEVATION_FILENAME = "base_elevation.tif";

    /**
     * @param config Validated configuration
     * @param engine Raster engine used by every stage
     * @param classifier Acquisition failure classifier
     * @param token Optional cancellation token checked between stages
     */
    DemPipeline(const PipelineConfig& config, RasterEngine& engine,
                const FailureClassifier& classifier,
                const CancellationToken* token = nullptr);

    /**
     * @brief Override the acquisition retry policy
     */
    void set_retry_policy(const RetryPolicy& policy) { retry_policy_ = policy; }

    /**
     * @brief Override the wait between acquisition attempts
     */
    void set_sleeper(AcquisitionStep::Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    /**
     * @brief Execute every stage
     * @return Summary of the run
     * @throws PipelineError subclasses on failure, OperationCancelled on interrupt
     */
    PipelineResult run();

    std::string artifact_path(const std::string& filename) const;

    const StageTracker& get_tracker() const { return tracker_; }

private:
    PipelineConfig config_;
    RasterEngine& engine_;
    const FailureClassifier& classifier_;
    const CancellationToken* token_;
    RetryPolicy retry_policy_;
    AcquisitionStep::Sleeper sleeper_;
    StageTracker tracker_;
    Logger logger_;

    void check_cancelled(const std::string& stage) const;
    void prepare_cache();
};

} // namespace opendem
