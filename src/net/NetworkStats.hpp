// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace toolmesh
{

/// @brief Point-in-time copy of a transport's counters.
struct NetworkStatsSnapshot
{
    std::uint64_t bytesSent = 0;
    std::uint64_t bytesReceived = 0;
    std::uint64_t requestsSent = 0;
    std::uint64_t requestsSucceeded = 0;
    std::uint64_t requestsFailed = 0;
    std::uint64_t retriedRequests = 0;
    std::uint64_t connectionErrors = 0;
    std::uint64_t timeoutErrors = 0;

    /// @brief Mean latency of attempts that produced an HTTP response.
    double avgLatencyMs = 0.0;

    /// @brief Uncompressed / compressed bytes over all compressed bodies, 1.0 if none.
    double compressionRatio = 1.0;
};

/// @brief Counters owned by one Transport.
///
/// Every field is updated independently with atomic operations; readers get a consistent
/// value per field but no cross-field snapshot guarantee.
class NetworkStats
{
  public:
    /// @brief Records one attempt put on the wire.
    void recordAttempt(std::size_t wireBytes);

    /// @brief Records an HTTP response and the latency of the attempt that produced it.
    void recordResponse(std::size_t bodyBytes, double latencyMs);

    void recordConnectionError();
    void recordTimeoutError();
    void recordRetry();
    void recordSuccess();
    void recordFailure();

    /// @brief Records the sizes of a body before and after compression.
    void recordCompression(std::size_t originalBytes, std::size_t compressedBytes);

    [[nodiscard]] auto snapshot() const -> NetworkStatsSnapshot;

    void reset();

  private:
    std::atomic<std::uint64_t> _bytesSent = 0;
    std::atomic<std::uint64_t> _bytesReceived = 0;
    std::atomic<std::uint64_t> _requestsSent = 0;
    std::atomic<std::uint64_t> _requestsSucceeded = 0;
    std::atomic<std::uint64_t> _requestsFailed = 0;
    std::atomic<std::uint64_t> _retriedRequests = 0;
    std::atomic<std::uint64_t> _connectionErrors = 0;
    std::atomic<std::uint64_t> _timeoutErrors = 0;
    std::atomic<std::uint64_t> _latencySamples = 0;
    std::atomic<double> _totalLatencyMs = 0.0;
    std::atomic<std::uint64_t> _uncompressedBytes = 0;
    std::atomic<std::uint64_t> _compressedBytes = 0;
};

} // namespace toolmesh
