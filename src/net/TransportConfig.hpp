// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string_view>

namespace toolmesh
{

/// @brief Set of HTTP status codes.
using StatusSet = std::set<int>;

/// @brief Payload compression algorithm applied to request bodies.
enum class CompressionAlgorithm : std::uint8_t
{
    None,
    Gzip,
};

/// @brief Backoff strategy used between retry attempts.
enum class RetryStrategy : std::uint8_t
{
    None,
    Linear,
    Exponential,
    Fibonacci,
};

[[nodiscard]] constexpr auto retryStrategyName(RetryStrategy strategy) -> std::string_view
{
    switch (strategy)
    {
        case RetryStrategy::None: return "none";
        case RetryStrategy::Linear: return "linear";
        case RetryStrategy::Exponential: return "exponential";
        case RetryStrategy::Fibonacci: return "fibonacci";
    }
    return "unknown";
}

/// @brief Parses a retry strategy name, returning RetryStrategy::Exponential for unknown names.
[[nodiscard]] constexpr auto retryStrategyFromString(std::string_view name) -> RetryStrategy
{
    if (name == "none")
        return RetryStrategy::None;
    if (name == "linear")
        return RetryStrategy::Linear;
    if (name == "fibonacci")
        return RetryStrategy::Fibonacci;
    return RetryStrategy::Exponential;
}

/// @brief Statuses retried when a call does not supply its own set.
[[nodiscard]] inline auto defaultRetryableStatuses() -> StatusSet
{
    return { 408, 429, 500, 502, 503, 504 };
}

/// @brief Per-destination transport settings. Immutable once a Transport is constructed.
struct TransportConfig
{
    std::size_t maxConnections = 100;
    std::size_t maxConnectionsPerDestination = 10;
    std::chrono::milliseconds connectTimeout { 10'000 };

    /// @brief Per-attempt timeout used when a call supplies no timeout of its own.
    std::chrono::milliseconds requestTimeout { 30'000 };

    bool keepaliveEnabled = true;

    bool compressionEnabled = true;
    CompressionAlgorithm compressionAlgorithm = CompressionAlgorithm::Gzip;
    std::size_t compressionThresholdBytes = 1024;

    RetryStrategy retryStrategy = RetryStrategy::Exponential;
    int maxRetries = 3;
    std::chrono::milliseconds retryBaseDelay { 100 };
    std::chrono::milliseconds retryMaxDelay { 10'000 };
    StatusSet retryableStatuses = defaultRetryableStatuses();

    std::chrono::seconds dnsCacheTtl { 300 };
};

} // namespace toolmesh
