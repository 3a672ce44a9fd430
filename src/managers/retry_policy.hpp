#pragma once

enum class RetryDecision {
    ALLOWED,
    EXHAUSTED
};

// Bounded retry bookkeeping: `attempts_used` out of `max_attempts`.
class RetryPolicy {
public:
    RetryPolicy(int attempts_used, int max_attempts)
        : attempts_used_(attempts_used), max_attempts_(max_attempts) {}

    int attempts_used() const { return attempts_used_; }
    int max_attempts() const { return max_attempts_; }

    RetryDecision next_attempt() const {
        return attempts_used_ < max_attempts_ ? RetryDecision::ALLOWED : RetryDecision::EXHAUSTED;
    }

    bool exhausted() const { return next_attempt() == RetryDecision::EXHAUSTED; }

private:
    int attempts_used_;
    int max_attempts_;
};
