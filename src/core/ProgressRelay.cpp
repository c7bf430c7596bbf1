/**
 * @file ProgressRelay.cpp
 * @brief Implementation of the throttled progress relay
 */

#include "ProgressRelay.hpp"
#include <algorithm>

namespace opendem {

ProgressRelay::ProgressRelay(const std::string& label, const Logger& logger, int step_percent)
    : label_(label), logger_(logger), step_percent_(std::max(1, step_percent)),
      last_percent_(-1), reported_count_(0) {
}

bool ProgressRelay::report(double complete) {
    int percent = static_cast<int>(complete * 100.0);

    if (percent > last_percent_) {
        last_percent_ = percent;
        if (percent % step_percent_ == 0) {
            logger_.info(label_ + ": " + std::to_string(percent) + "%");
            reported_count_++;
        }
    }

    return true;
}

} // namespace opendem
