// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <cstdint>

namespace toolmesh
{

/// @brief Point-in-time copy of a client's aggregate call counters.
struct ClientStatsSnapshot
{
    std::uint64_t requestsSent = 0;
    std::uint64_t requestsSucceeded = 0;
    std::uint64_t requestsFailed = 0;
    double totalLatencyMs = 0.0;

    [[nodiscard]] auto averageLatencyMs() const -> double
    {
        auto const completed = requestsSucceeded + requestsFailed;
        return completed > 0 ? totalLatencyMs / static_cast<double>(completed) : 0.0;
    }
};

/// @brief Aggregate invocation counters owned by a ToolClient.
class ClientStats
{
  public:
    void recordSent() { _requestsSent.fetch_add(1, std::memory_order_relaxed); }

    void recordCompletion(bool succeeded, double latencyMs)
    {
        if (succeeded)
            _requestsSucceeded.fetch_add(1, std::memory_order_relaxed);
        else
            _requestsFailed.fetch_add(1, std::memory_order_relaxed);
        _totalLatencyMs.fetch_add(latencyMs, std::memory_order_relaxed);
    }

    [[nodiscard]] auto snapshot() const -> ClientStatsSnapshot
    {
        return ClientStatsSnapshot {
            .requestsSent = _requestsSent.load(std::memory_order_relaxed),
            .requestsSucceeded = _requestsSucceeded.load(std::memory_order_relaxed),
            .requestsFailed = _requestsFailed.load(std::memory_order_relaxed),
            .totalLatencyMs = _totalLatencyMs.load(std::memory_order_relaxed),
        };
    }

    void reset()
    {
        _requestsSent = 0;
        _requestsSucceeded = 0;
        _requestsFailed = 0;
        _totalLatencyMs = 0.0;
    }

  private:
    std::atomic<std::uint64_t> _requestsSent = 0;
    std::atomic<std::uint64_t> _requestsSucceeded = 0;
    std::atomic<std::uint64_t> _requestsFailed = 0;
    std::atomic<double> _totalLatencyMs = 0.0;
};

} // namespace toolmesh
