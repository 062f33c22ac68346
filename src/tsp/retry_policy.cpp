/**
 * @file retry_policy.cpp
 * @brief Retry state machine implementation
 */

#include "pdftrust/tsp/retry_policy.h"

#include <algorithm>
#include <stdexcept>

namespace pdftrust::tsp {

namespace {
constexpr long long BASE_DELAY_MS = 1000;
constexpr long long MAX_DELAY_MS = 10000;
}

std::chrono::milliseconds backoffDelay(int failedAttempt) {
    if (failedAttempt < 1) return std::chrono::milliseconds(0);
    long long delay = BASE_DELAY_MS;
    for (int i = 1; i < failedAttempt && delay < MAX_DELAY_MS; i++) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min(delay, MAX_DELAY_MS));
}

RetryStateMachine::RetryStateMachine(int maxAttempts) : maxAttempts_(maxAttempts) {
    if (maxAttempts < 1) {
        throw std::invalid_argument("RetryStateMachine: maxAttempts must be at least 1");
    }
}

void RetryStateMachine::onSuccess() {
    if (state_ != RetryState::ATTEMPTING) {
        throw std::logic_error("RetryStateMachine: success reported outside ATTEMPTING");
    }
    state_ = RetryState::SUCCEEDED;
}

void RetryStateMachine::onFailure() {
    if (state_ != RetryState::ATTEMPTING) {
        throw std::logic_error("RetryStateMachine: failure reported outside ATTEMPTING");
    }
    state_ = attempt_ < maxAttempts_ ? RetryState::BACKOFF : RetryState::FAILED_EXHAUSTED;
}

void RetryStateMachine::backoffComplete() {
    if (state_ != RetryState::BACKOFF) {
        throw std::logic_error("RetryStateMachine: backoff completed outside BACKOFF");
    }
    attempt_++;
    state_ = RetryState::ATTEMPTING;
}

std::chrono::milliseconds RetryStateMachine::pendingDelay() const {
    return state_ == RetryState::BACKOFF ? backoffDelay(attempt_) : std::chrono::milliseconds(0);
}

} // namespace pdftrust::tsp
