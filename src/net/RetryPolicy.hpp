// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <net/TransportConfig.hpp>

#include <chrono>
#include <cstdint>

namespace toolmesh
{

/// @brief A retry delay with sub-millisecond precision.
using RetryDelay = std::chrono::duration<double, std::milli>;

/// @brief Lower and upper jitter factors applied to the base delay.
constexpr auto JitterLowerBound = 0.8;
constexpr auto JitterUpperBound = 1.2;

/// @brief Returns the n-th Fibonacci number with fib(1) = fib(2) = 1 (fib(0) = 0).
[[nodiscard]] auto fibonacci(int n) -> std::uint64_t;

/// @brief Computes backoff delays from a transport's retry settings.
///
/// The base delay for retry number @c attempt (1-indexed, counting retries rather than
/// the original attempt) is:
///   - None:        0
///   - Linear:      base * attempt
///   - Exponential: base * 2^(attempt - 1)
///   - Fibonacci:   base * fib(attempt)
///
/// delay() then applies uniform jitter in [0.8, 1.2] and caps the result at the
/// configured maximum delay.
class RetryPolicy
{
  public:
    explicit RetryPolicy(const TransportConfig& config);

    RetryPolicy(RetryStrategy strategy,
                int maxRetries,
                std::chrono::milliseconds baseDelay,
                std::chrono::milliseconds maxDelay);

    /// @brief Total attempts allowed, including the first one.
    [[nodiscard]] auto maxAttempts() const -> int;

    /// @brief Pre-jitter delay before retry number @p attempt.
    [[nodiscard]] auto baseDelay(int attempt) const -> RetryDelay;

    /// @brief Jittered and capped delay before retry number @p attempt.
    [[nodiscard]] auto delay(int attempt) const -> RetryDelay;

    /// @brief Applies a given jitter factor to the base delay and caps it.
    [[nodiscard]] auto delayWithJitter(int attempt, double jitterFactor) const -> RetryDelay;

    [[nodiscard]] auto strategy() const -> RetryStrategy { return _strategy; }

  private:
    RetryStrategy _strategy;
    int _maxRetries;
    std::chrono::milliseconds _baseDelay;
    std::chrono::milliseconds _maxDelay;
};

} // namespace toolmesh
