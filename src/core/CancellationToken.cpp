/**
 * @file CancellationToken.cpp
 * @brief Implementation of the cancellation token and SIGINT handler
 */

#include "CancellationToken.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <thread>

namespace opendem {

namespace {
constexpr std::chrono::milliseconds WAIT_SLICE{100};
}

CancellationToken* InterruptHandler::active_token_ = nullptr;

void CancellationToken::throw_if_cancelled(const std::string& stage) const {
    if (is_cancelled()) {
        throw OperationCancelled(stage);
    }
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    auto remaining = duration;
    while (remaining.count() > 0) {
        if (is_cancelled()) {
            return false;
        }
        auto slice = std::min(remaining, WAIT_SLICE);
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }
    return !is_cancelled();
}

InterruptHandler::InterruptHandler(CancellationToken& token)
    : token_(token), handlers_installed_(false), previous_handler_(SIG_DFL) {
}

InterruptHandler::~InterruptHandler() {
    remove_handlers();
}

void InterruptHandler::install_handlers() {
    if (handlers_installed_) {
        return;
    }

    active_token_ = &token_;
    previous_handler_ = std::signal(SIGINT, signal_handler);
    if (previous_handler_ == SIG_ERR) {
        previous_handler_ = SIG_DFL;
    }
    handlers_installed_ = true;
}

void InterruptHandler::remove_handlers() {
    if (!handlers_installed_) {
        return;
    }

    std::signal(SIGINT, previous_handler_);
    if (active_token_ == &token_) {
        active_token_ = nullptr;
    }
    handlers_installed_ = false;
}

void InterruptHandler::signal_handler(int /*signal*/) {
    // Async-signal-safe: only touch the sig_atomic_t flag
    if (active_token_) {
        active_token_->cancel();
    }
}

} // namespace opendem
