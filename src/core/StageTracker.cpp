/**
 * @file StageTracker.cpp
 * @brief Implementation of stage timing and artifact tracking
 */

#include "StageTracker.hpp"
#include <algorithm>
#include <sstream>

namespace opendem {

StageTracker::StageTracker()
    : tracking_start_time_(std::chrono::steady_clock::now()), logger_("StageTracker") {
}

void StageTracker::startStage(const std::string& stage_name) {
    stages_.emplace_back(stage_name);
    logger_.detailed("[STAGE START] " + stage_name);
}

void StageTracker::completeStage(const std::string& stage_name) {
    TrackedStage* stage = findStage(stage_name);
    if (stage) {
        stage->complete();
        logger_.detailed("[STAGE COMPLETE] " + stage_name + " (" +
                         std::to_string(stage->duration().count()) + "ms)");
    }
}

void StageTracker::trackArtifact(const std::string& path) {
    artifacts_.push_back(path);
    logger_.debug("[ARTIFACT] " + path);
}

std::string StageTracker::getCurrentStage() const {
    if (stages_.empty()) {
        return "No stages";
    }

    const auto& current = stages_.back();
    if (current.completed) {
        return "All stages completed";
    }
    return "Current stage: " + current.stage_name;
}

size_t StageTracker::getCompletedStageCount() const {
    return static_cast<size_t>(std::count_if(stages_.begin(), stages_.end(),
                                             [](const TrackedStage& s) { return s.completed; }));
}

std::vector<StageTiming> StageTracker::getTimings() const {
    std::vector<StageTiming> timings;
    for (const auto& stage : stages_) {
        if (stage.completed) {
            timings.push_back({stage.stage_name, stage.duration()});
        }
    }
    return timings;
}

std::string StageTracker::getTimingReport() const {
    std::ostringstream oss;
    auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - tracking_start_time_);

    oss << "Total time: " << total_time.count() << "ms";
    for (const auto& timing : getTimings()) {
        oss << ", " << timing.name << ": " << timing.duration.count() << "ms";
    }
    return oss.str();
}

void StageTracker::clear() {
    stages_.clear();
    artifacts_.clear();
    tracking_start_time_ = std::chrono::steady_clock::now();
}

TrackedStage* StageTracker::findStage(const std::string& stage_name) {
    // Latest stage of that name
    for (auto it = stages_.rbegin(); it != stages_.rend(); ++it) {
        if (it->stage_name == stage_name) {
            return &(*it);
        }
    }
    return nullptr;
}

} // namespace opendem
