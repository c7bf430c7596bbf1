/**
 * @file CancellationToken.hpp
 * @brief User interrupt handling through a cancellation token
 *
 * SIGINT only flips a flag. The pipeline polls the token between stages and
 * while waiting between acquisition attempts, and the raster engine polls it
 * from its progress callback, so open datasets are closed by their owners
 * before the process exits.
 */

#pragma once

#include <chrono>
#include <csignal>
#include <string>

namespace opendem {

/**
 * @brief Signal-safe cancellation flag
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(0) {}

    void cancel() { cancelled_ = 1; }
    bool is_cancelled() const { return cancelled_ != 0; }

    /**
     * @brief Throw OperationCancelled if the token is set
     * @param stage Stage about to start, reported in the exception
     */
    void throw_if_cancelled(const std::string& stage) const;

    /**
     * @brief Sleep for the given duration, waking early on cancellation
     * @return false if the wait ended because of cancellation
     */
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    volatile std::sig_atomic_t cancelled_;
};

/**
 * @brief Installs a SIGINT handler that cancels a token
 *
 * Only one handler can be active; the previous disposition is restored on
 * destruction.
 */
class InterruptHandler {
public:
    explicit InterruptHandler(CancellationToken& token);
    ~InterruptHandler();

    InterruptHandler(const InterruptHandler&) = delete;
    InterruptHandler& operator=(const InterruptHandler&) = delete;

    void install_handlers();
    void remove_handlers();

private:
    static void signal_handler(int signal);

    // Static instance for the signal handler
    static CancellationToken* active_token_;

    CancellationToken& token_;
    bool handlers_installed_;
    void (*previous_handler_)(int);
};

} // namespace opendem
