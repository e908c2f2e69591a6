#include "sync/backoff_policy.hpp"

#include <algorithm>

namespace engage {

namespace {

constexpr double kJitterFraction = 0.25;

} // namespace

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds minimum,
                             std::chrono::milliseconds maximum)
    : m_minimum(std::max(minimum, std::chrono::milliseconds(1)))
    , m_maximum(std::max(maximum, m_minimum))
    , m_rng(std::random_device{}())
{
}

std::chrono::milliseconds BackoffPolicy::baseDelay(int attempt) const
{
    std::chrono::milliseconds step = m_minimum;
    for (int i = 1; i < attempt && step < m_maximum; ++i) {
        step *= 2;
    }
    return std::min(step, m_maximum);
}

std::chrono::milliseconds BackoffPolicy::delayForAttempt(int attempt) const
{
    const std::chrono::milliseconds base = baseDelay(attempt);
    if (base >= m_maximum) {
        return m_maximum;
    }

    const auto span = static_cast<int64_t>(base.count() * kJitterFraction);
    int64_t jitter = 0;
    if (span > 0) {
        std::lock_guard<std::mutex> lock(m_rngMutex);
        std::uniform_int_distribution<int64_t> dist(0, span - 1);
        jitter = dist(m_rng);
    }
    return std::min(base + std::chrono::milliseconds(jitter), m_maximum);
}

std::chrono::milliseconds BackoffPolicy::withHint(
    std::chrono::milliseconds delay,
    std::optional<std::chrono::milliseconds> hint) const
{
    if (!hint) {
        return delay;
    }
    return std::max(delay, std::min(*hint, m_maximum));
}

} // namespace engage
