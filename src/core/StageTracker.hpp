/**
 * @file StageTracker.hpp
 * @brief Stage timing and artifact tracking for pipeline runs
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "opendem.hpp"
#include "Logger.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace opendem {

/**
 * @brief One named stage of a run
 */
struct TrackedStage {
    std::string stage_name;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;

    explicit TrackedStage(const std::string& name)
        : stage_name(name), start_time(std::chrono::steady_clock::now()) {}

    void complete() {
        end_time = std::chrono::steady_clock::now();
        completed = true;
    }

    std::chrono::milliseconds duration() const {
        if (!completed) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

/**
 * @brief Records stage start/complete events and the files each stage wrote
 *
 * Stages are logged at DETAILED level; the run summary is built from
 * get_timings() and get_artifacts().
 */
class StageTracker {
public:
    StageTracker();

    void startStage(const std::string& stage_name);
    void completeStage(const std::string& stage_name);

    /**
     * @brief Remember an intermediate file written by the current stage
     */
    void trackArtifact(const std::string& path);

    std::string getCurrentStage() const;
    size_t getCompletedStageCount() const;

    std::vector<StageTiming> getTimings() const;
    const std::vector<std::string>& getArtifacts() const { return artifacts_; }

    std::string getTimingReport() const;

    void clear();

private:
    std::vector<TrackedStage> stages_;
    std::vector<std::string> artifacts_;
    std::chrono::steady_clock::time_point tracking_start_time_;
    Logger logger_;

    TrackedStage* findStage(const std::string& stage_name);
};

} // namespace opendem
