#include "pipeline/RetryPolicy.hpp"

#include <algorithm>
#include <cmath>

using namespace lc::pipeline;

std::chrono::milliseconds RetryPolicy::delayAfter(const unsigned int attempt) const {
    if (attempt == 0) return std::chrono::milliseconds(0);

    const double base = static_cast<double>(cfg_.initial_backoff.count());
    const double scaled = base * std::pow(cfg_.multiplier, static_cast<double>(attempt - 1));
    const double capped = std::min(scaled, static_cast<double>(cfg_.max_backoff.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

bool RetryPolicy::allowsAnother(const unsigned int attemptsMade, const std::chrono::milliseconds elapsed) const {
    if (attemptsMade >= cfg_.max_attempts) return false;
    return elapsed + delayAfter(attemptsMade) <= cfg_.max_elapsed;
}
