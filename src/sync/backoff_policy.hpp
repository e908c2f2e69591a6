#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <random>

namespace engage {

// Exponential backoff: minimum * 2^(attempt - 1), plus jitter in
// [0, 25%) of that step, never above maximum.
class BackoffPolicy {
public:
    BackoffPolicy(std::chrono::milliseconds minimum, std::chrono::milliseconds maximum);

    // attempt counts consecutive failures, starting at 1.
    std::chrono::milliseconds delayForAttempt(int attempt) const;

    // Step without jitter, already clamped to the maximum.
    std::chrono::milliseconds baseDelay(int attempt) const;

    // A server hint can only lengthen the delay, and never past the maximum.
    std::chrono::milliseconds withHint(std::chrono::milliseconds delay,
                                       std::optional<std::chrono::milliseconds> hint) const;

    std::chrono::milliseconds minimum() const
    {
        return m_minimum;
    }

    std::chrono::milliseconds maximum() const
    {
        return m_maximum;
    }

private:
    std::chrono::milliseconds m_minimum;
    std::chrono::milliseconds m_maximum;

    mutable std::mutex m_rngMutex;
    mutable std::mt19937_64 m_rng;
};

} // namespace engage
