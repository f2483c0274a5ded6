// SPDX-License-Identifier: Apache-2.0
#include "NetworkStats.hpp"

namespace toolmesh
{

void NetworkStats::recordAttempt(std::size_t wireBytes)
{
    _requestsSent.fetch_add(1, std::memory_order_relaxed);
    _bytesSent.fetch_add(wireBytes, std::memory_order_relaxed);
}

void NetworkStats::recordResponse(std::size_t bodyBytes, double latencyMs)
{
    _bytesReceived.fetch_add(bodyBytes, std::memory_order_relaxed);
    _totalLatencyMs.fetch_add(latencyMs, std::memory_order_relaxed);
    _latencySamples.fetch_add(1, std::memory_order_relaxed);
}

void NetworkStats::recordConnectionError()
{
    _connectionErrors.fetch_add(1, std::memory_order_relaxed);
}

void NetworkStats::recordTimeoutError()
{
    _timeoutErrors.fetch_add(1, std::memory_order_relaxed);
}

void NetworkStats::recordRetry()
{
    _retriedRequests.fetch_add(1, std::memory_order_relaxed);
}

void NetworkStats::recordSuccess()
{
    _requestsSucceeded.fetch_add(1, std::memory_order_relaxed);
}

void NetworkStats::recordFailure()
{
    _requestsFailed.fetch_add(1, std::memory_order_relaxed);
}

void NetworkStats::recordCompression(std::size_t originalBytes, std::size_t compressedBytes)
{
    _uncompressedBytes.fetch_add(originalBytes, std::memory_order_relaxed);
    _compressedBytes.fetch_add(compressedBytes, std::memory_order_relaxed);
}

auto NetworkStats::snapshot() const -> NetworkStatsSnapshot
{
    auto result = NetworkStatsSnapshot {
        .bytesSent = _bytesSent.load(std::memory_order_relaxed),
        .bytesReceived = _bytesReceived.load(std::memory_order_relaxed),
        .requestsSent = _requestsSent.load(std::memory_order_relaxed),
        .requestsSucceeded = _requestsSucceeded.load(std::memory_order_relaxed),
        .requestsFailed = _requestsFailed.load(std::memory_order_relaxed),
        .retriedRequests = _retriedRequests.load(std::memory_order_relaxed),
        .connectionErrors = _connectionErrors.load(std::memory_order_relaxed),
        .timeoutErrors = _timeoutErrors.load(std::memory_order_relaxed),
    };

    auto const samples = _latencySamples.load(std::memory_order_relaxed);
    if (samples > 0)
        result.avgLatencyMs = _totalLatencyMs.load(std::memory_order_relaxed) / static_cast<double>(samples);

    auto const compressed = _compressedBytes.load(std::memory_order_relaxed);
    if (compressed > 0)
        result.compressionRatio =
            static_cast<double>(_uncompressedBytes.load(std::memory_order_relaxed)) / static_cast<double>(compressed);

    return result;
}

void NetworkStats::reset()
{
    _bytesSent = 0;
    _bytesReceived = 0;
    _requestsSent = 0;
    _requestsSucceeded = 0;
    _requestsFailed = 0;
    _retriedRequests = 0;
    _connectionErrors = 0;
    _timeoutErrors = 0;
    _latencySamples = 0;
    _totalLatencyMs = 0.0;
    _uncompressedBytes = 0;
    _compressedBytes = 0;
}

} // namespace toolmesh
