/**
 * @file AcquisitionStep.cpp
 * @brief Implementation of the retry-governed acquisition
 */

#include "AcquisitionStep.hpp"
#include "CancellationToken.hpp"
#include "ProgressRelay.hpp"
#include "RasterEngine.hpp"
#include "Errors.hpp"
#include <thread>

namespace opendem {

AcquisitionStep::AcquisitionStep(RasterEngine& engine, const FailureClassifier& classifier,
                                 RetryPolicy policy)
    : engine_(engine), classifier_(classifier), policy_(policy),
      sleeper_([](std::chrono::milliseconds delay) {
          std::this_thread::sleep_for(delay);
          return true;
      }),
      token_(nullptr), logger_("Acquisition"), attempts_made_(0) {
}

void AcquisitionStep::set_cancellation_token(const CancellationToken* token) {
    token_ = token;
    if (token_) {
        sleeper_ = [token](std::chrono::milliseconds delay) {
            return token->wait_for(delay);
        };
    }
}

void AcquisitionStep::acquire(const std::string& descriptor_path, const PipelineConfig& config,
                              const std::string& destination) {
    state_ = RetryState();
    attempts_made_ = 0;

    WarpRequest request;
    request.destination = destination;
    request.source = descriptor_path;
    request.bounds = config.bounds;
    request.bounds_srs = BOUNDS_SRS;
    request.x_res = config.resolution;
    request.y_res = config.resolution;
    request.dst_srs = TARGET_SRS;
    request.cancellation = token_;

    const std::string max_str = std::to_string(policy_.max_retries);

    while (true) {
        if (token_) {
            token_->throw_if_cancelled("acquisition attempt " + std::to_string(attempts_made_ + 1));
        }

        logger_.info("Warp Attempt " + std::to_string(state_.attempt + 1) + "/" + max_str + "...");

        ProgressRelay progress("Warp Progress", logger_);
        request.progress = &progress;

        try {
            attempts_made_++;
            engine_.warp(request);
            logger_.detailed("Acquired RGB raster: " + destination);
            return;
        } catch (const RasterEngineError& e) {
            // An interrupted warp is never retried
            if (token_) {
                token_->throw_if_cancelled("acquisition attempt " + std::to_string(attempts_made_));
            }

            FailureKind kind = classifier_.classify(e);
            state_.last_failure = kind;
            state_.last_message = e.what();

            if (kind != FailureKind::TRANSIENT_NETWORK) {
                logger_.error("Acquisition failed (" + failure_kind_name(kind) + "): " + e.what());
                abort_with(kind, e);
            }

            state_.attempt++;
            logger_.warning("Network glitch detected: " + std::string(e.what()));

            if (state_.attempt >= policy_.max_retries) {
                logger_.error("Max retries reached. Check your internet connection.");
                throw MaxRetriesExceeded(state_.attempt, state_.last_message);
            }

            const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(policy_.delay);
            logger_.info("Retrying in " + std::to_string(seconds.count()) + " seconds...");
            if (!sleeper_(policy_.delay)) {
                throw OperationCancelled("acquisition retry");
            }
        }
    }
}

void AcquisitionStep::abort_with(FailureKind kind, const RasterEngineError& error) const {
    switch (kind) {
        case FailureKind::RESOURCE:
            throw ResourceError(error.what());
        case FailureKind::CONFIGURATION:
            throw ConfigurationError(error.what());
        default:
            throw ProcessingError(std::string("acquisition failed: ") + error.what());
    }
}

} // namespace opendem
