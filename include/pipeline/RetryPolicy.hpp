#pragma once

#include "config/Config.hpp"

#include <chrono>

namespace lc::pipeline {

// Exponential backoff bounded by both attempt count and total elapsed time
class RetryPolicy {
public:
    explicit RetryPolicy(const config::BackoffConfig& cfg) : cfg_(cfg) {}

    // Delay to wait after the given (1-based) failed attempt
    [[nodiscard]] std::chrono::milliseconds delayAfter(unsigned int attempt) const;

    // Whether another attempt may start after `attemptsMade` failures, given
    // the time already spent
    [[nodiscard]] bool allowsAnother(unsigned int attemptsMade, std::chrono::milliseconds elapsed) const;

    [[nodiscard]] unsigned int maxAttempts() const { return cfg_.max_attempts; }

private:
    config::BackoffConfig cfg_;
};

}
