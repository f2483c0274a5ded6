// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <net/HttpBackend.hpp>
#include <net/HttpTypes.hpp>
#include <net/NetworkStats.hpp>
#include <net/RetryPolicy.hpp>
#include <net/TransportConfig.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace toolmesh
{

/// @brief Reliable delivery of requests to one destination.
///
/// Owns the destination's HttpBackend (and through it the connection pool) and adds
/// request body compression, retry with backoff, response decoding and statistics.
/// All methods are thread-safe; concurrent requests share the backend's pool.
class Transport
{
  public:
    /// @brief Constructs a Transport for one destination.
    /// @param destination The destination name, used in log messages.
    /// @param baseUrl The destination base URL, probed during initialize().
    /// @param config The transport settings.
    /// @param backend The backend that executes single HTTP round trips.
    Transport(std::string destination,
              std::string baseUrl,
              TransportConfig config,
              std::unique_ptr<HttpBackend> backend);
    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    /// @brief Opens the connection pool. Idempotent.
    ///
    /// A destination host that does not resolve is logged as a warning and does not fail
    /// initialization.
    /// @return Success, TransportClosed after shutdown(), or the backend's open error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Waits for in-flight requests to finish and releases the pool. Idempotent.
    ///
    /// Requests sleeping in a retry backoff are woken and fail with TransportClosed.
    void shutdown();

    /// @brief Sends one logical request, retrying according to the retry policy.
    /// @param envelope The request to send.
    /// @param retryableStatuses Overrides the configured retryable statuses for this call.
    /// @return The decoded response, or TransportClosed / RequestTimeout / RequestFailed /
    ///         InvalidResponse / CompressionError.
    [[nodiscard]] auto request(const CallEnvelope& envelope,
                               const std::optional<StatusSet>& retryableStatuses = std::nullopt)
        -> Result<HttpResponse>;

    [[nodiscard]] auto stats() const -> NetworkStatsSnapshot;
    void resetStats();

    [[nodiscard]] auto destination() const -> const std::string&;
    [[nodiscard]] auto config() const -> const TransportConfig&;
    [[nodiscard]] auto isInitialized() const -> bool;
    [[nodiscard]] auto isClosed() const -> bool;

  private:
    using Clock = std::chrono::steady_clock;

    struct PreparedBody
    {
        std::string bytes;
        bool compressed = false;
    };

    [[nodiscard]] auto beginRequest() -> VoidResult;
    void endRequest();

    [[nodiscard]] auto prepareBody(const std::optional<std::string>& body) -> Result<PreparedBody>;
    [[nodiscard]] auto decode(WireResponse response) -> Result<HttpResponse>;

    /// @brief Sleeps for @p delay, bounded by @p deadline and interrupted by shutdown().
    [[nodiscard]] auto backoff(RetryDelay delay, const std::optional<Clock::time_point>& deadline)
        -> VoidResult;

    std::string _destination;
    std::string _baseUrl;
    TransportConfig _config;
    RetryPolicy _retryPolicy;
    std::unique_ptr<HttpBackend> _backend;
    NetworkStats _stats;

    mutable std::mutex _mutex;
    std::condition_variable _stateChanged;
    std::size_t _inFlight = 0;
    bool _initialized = false;
    bool _closed = false;
};

} // namespace toolmesh
