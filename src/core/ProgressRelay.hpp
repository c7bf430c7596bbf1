/**
 * @file ProgressRelay.hpp
 * @brief Throttled adapter from raster engine progress to log events
 */

#pragma once

#include "Logger.hpp"
#include <string>

namespace opendem {

/**
 * @brief Translates fractional completion callbacks into 5% log steps
 *
 * The relay remembers the last whole percent it saw and only logs when the
 * percent strictly increases and lands on a multiple of the step. It never
 * asks the engine to cancel.
 */
class ProgressRelay {
public:
    static constexpr int DEFAULT_STEP_PERCENT = 5;

    /**
     * @param label Prefix of each progress line (e.g. "Warp Progress")
     * @param logger Logger receiving the progress lines
     * @param step_percent Logging granularity in percent
     */
    ProgressRelay(const std::string& label, const Logger& logger,
                  int step_percent = DEFAULT_STEP_PERCENT);

    /**
     * @brief Report completion in [0, 1]
     * @return always true (continue)
     */
    bool report(double complete);

    /**
     * @brief Forget the last reported percent, e.g. before a new attempt
     */
    void reset() { last_percent_ = -1; }

    int get_last_percent() const { return last_percent_; }
    int get_reported_count() const { return reported_count_; }

private:
    std::string label_;
    const Logger& logger_;
    int step_percent_;
    int last_percent_;
    int reported_count_;
};

} // namespace opendem
