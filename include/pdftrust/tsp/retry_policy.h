/**
 * @file retry_policy.h
 * @brief Retry state machine with capped exponential backoff for TSA requests
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace pdftrust::tsp {

/// Backoff before attempt n+1 after attempt n failed: min(1000 * 2^(n-1), 10000) ms
std::chrono::milliseconds backoffDelay(int failedAttempt);

enum class RetryState {
    ATTEMPTING,
    BACKOFF,
    SUCCEEDED,
    FAILED_EXHAUSTED
};

inline std::string retryStateToString(RetryState s) {
    switch (s) {
        case RetryState::ATTEMPTING:       return "ATTEMPTING";
        case RetryState::BACKOFF:          return "BACKOFF";
        case RetryState::SUCCEEDED:        return "SUCCEEDED";
        case RetryState::FAILED_EXHAUSTED: return "FAILED_EXHAUSTED";
    }
    return "UNKNOWN";
}

/// Blocks the calling thread; replaced in tests
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Attempt bookkeeping for one TSA
 *
 * ATTEMPTING --success--> SUCCEEDED
 * ATTEMPTING --failure, attempts left--> BACKOFF --elapsed--> ATTEMPTING
 * ATTEMPTING --failure, none left--> FAILED_EXHAUSTED
 */
class RetryStateMachine {
public:
    /// @throws std::invalid_argument if maxAttempts < 1
    explicit RetryStateMachine(int maxAttempts);

    void onSuccess();
    void onFailure();
    void backoffComplete();

    RetryState state() const { return state_; }
    /// 1-based number of the current (or last) attempt
    int attempt() const { return attempt_; }
    int maxAttempts() const { return maxAttempts_; }
    /// Delay to wait in BACKOFF, zero otherwise
    std::chrono::milliseconds pendingDelay() const;
    bool isTerminal() const {
        return state_ == RetryState::SUCCEEDED || state_ == RetryState::FAILED_EXHAUSTED;
    }

private:
    int maxAttempts_;
    int attempt_ = 1;
    RetryState state_ = RetryState::ATTEMPTING;
};

} // namespace pdftrust::tsp
