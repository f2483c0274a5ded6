// SPDX-License-Identifier: Apache-2.0
#include "RetryPolicy.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace toolmesh
{

namespace
{

    auto jitterFactor() -> double
    {
        thread_local auto engine = std::mt19937 { std::random_device {}() };
        auto distribution = std::uniform_real_distribution<double>(JitterLowerBound, JitterUpperBound);
        return distribution(engine);
    }

} // namespace

auto fibonacci(int n) -> std::uint64_t
{
    if (n <= 0)
        return 0;

    auto previous = std::uint64_t { 0 };
    auto current = std::uint64_t { 1 };
    for (auto i = 1; i < n; ++i)
    {
        auto const next = previous + current;
        previous = current;
        current = next;
    }
    return current;
}

RetryPolicy::RetryPolicy(const TransportConfig& config):
    RetryPolicy(config.retryStrategy, config.maxRetries, config.retryBaseDelay, config.retryMaxDelay)
{
}

RetryPolicy::RetryPolicy(RetryStrategy strategy,
                         int maxRetries,
                         std::chrono::milliseconds baseDelay,
                         std::chrono::milliseconds maxDelay):
    _strategy(strategy), _maxRetries(std::max(0, maxRetries)), _baseDelay(baseDelay), _maxDelay(maxDelay)
{
}

auto RetryPolicy::maxAttempts() const -> int
{
    if (_strategy == RetryStrategy::None)
        return 1;
    return _maxRetries + 1;
}

auto RetryPolicy::baseDelay(int attempt) const -> RetryDelay
{
    if (attempt < 1)
        return RetryDelay::zero();

    auto const base = RetryDelay(_baseDelay);
    switch (_strategy)
    {
        case RetryStrategy::None: return RetryDelay::zero();
        case RetryStrategy::Linear: return base * static_cast<double>(attempt);
        case RetryStrategy::Exponential: return base * std::pow(2.0, attempt - 1);
        case RetryStrategy::Fibonacci: return base * static_cast<double>(fibonacci(attempt));
    }
    return RetryDelay::zero();
}

auto RetryPolicy::delay(int attempt) const -> RetryDelay
{
    return delayWithJitter(attempt, jitterFactor());
}

auto RetryPolicy::delayWithJitter(int attempt, double jitterFactor) const -> RetryDelay
{
    auto const factor = std::clamp(jitterFactor, JitterLowerBound, JitterUpperBound);
    return std::min(baseDelay(attempt) * factor, RetryDelay(_maxDelay));
}

} // namespace toolmesh
