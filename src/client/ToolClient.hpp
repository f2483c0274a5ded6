// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <client/ClientStats.hpp>
#include <client/DestinationRegistry.hpp>
#include <client/OperatingMode.hpp>
#include <client/RequestGate.hpp>
#include <core/Error.hpp>
#include <net/HttpBackend.hpp>
#include <net/NetworkStats.hpp>
#include <net/Transport.hpp>
#include <net/TransportConfig.hpp>
#include <toolmesh/Config.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolmesh
{

/// @brief Outcome of one item of a batch or fan-out.
using ItemResult = Result<nlohmann::json>;

/// @brief Renders an item result as JSON: the value itself, or {"error": message}.
[[nodiscard]] auto toJson(const ItemResult& result) -> nlohmann::json;

/// @brief One (destination, operation, payload) triple of a fan-out.
struct InvocationCall
{
    std::string destination;
    std::string operation;
    nlohmann::json payload;
};

/// @brief Result of probing a destination's health endpoint.
struct HealthStatus
{
    std::string destination;
    bool healthy = false;
    double responseTimeMs = 0.0;
    std::vector<std::string> capabilities;

    /// @brief Reason the destination is unhealthy; empty when healthy.
    std::string error;
};

/// @brief Creates the HttpBackend used for a destination's Transport.
using BackendFactory = std::function<std::unique_ptr<HttpBackend>(const Destination& destination)>;

/// @brief Factory producing libcurl backends.
[[nodiscard]] auto curlBackendFactory() -> BackendFactory;

/// @brief Factory producing NullBackends that answer every request with 200 and "{}".
[[nodiscard]] auto nullBackendFactory() -> BackendFactory;

/// @brief Invokes named operations on destinations of a DestinationRegistry.
///
/// Owns one Transport per destination, created on first use. Concurrent dispatches are
/// bounded by ClientConfig::maxParallelRequests and optionally rate-limited. All methods
/// are thread-safe.
class ToolClient
{
  public:
    /// @brief Constructs a client using the presets of an operating mode.
    ToolClient(DestinationRegistry registry,
               OperatingMode mode,
               BackendFactory backendFactory = curlBackendFactory());

    /// @brief Constructs a client with explicit transport and client settings.
    ToolClient(DestinationRegistry registry,
               TransportConfig transportConfig,
               ClientConfig clientConfig,
               BackendFactory backendFactory = curlBackendFactory());

    /// @brief Constructs a client from a loaded configuration.
    explicit ToolClient(ToolmeshConfig config, BackendFactory backendFactory = curlBackendFactory());

    ~ToolClient();

    ToolClient(const ToolClient&) = delete;
    ToolClient& operator=(const ToolClient&) = delete;

    /// @brief Loads a configuration file and constructs a client from it.
    /// @param path The path to the config file.
    /// @param backendFactory The backend factory.
    /// @return The client or a ConfigLoadError naming the path.
    [[nodiscard]] static auto fromConfigFile(std::string_view path,
                                             BackendFactory backendFactory = curlBackendFactory())
        -> Result<std::unique_ptr<ToolClient>>;

    /// @brief Invokes one operation on a destination.
    ///
    /// Sends POST {baseUrl}/invoke/{operation} with body {"operation": ..., "arguments": payload}.
    /// @param destination The destination name.
    /// @param operation The operation name.
    /// @param payload The operation arguments.
    /// @param timeout Overall time budget; falls back to the destination's timeout if empty.
    /// @return The decoded response body, or InvocationFailed wrapping the cause.
    [[nodiscard]] auto invoke(std::string_view destination,
                              std::string_view operation,
                              const nlohmann::json& payload,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> Result<nlohmann::json>;

    /// @brief Invokes one operation once per payload.
    ///
    /// Payloads are processed in consecutive chunks of ClientConfig::batchSize; a chunk is
    /// dispatched concurrently and completes before the next one starts.
    /// @return One result per payload, in input order.
    [[nodiscard]] auto batchInvoke(std::string_view destination,
                                   std::string_view operation,
                                   const std::vector<nlohmann::json>& payloads) -> std::vector<ItemResult>;

    /// @brief Dispatches heterogeneous calls concurrently.
    /// @return Results keyed by the index of the call in @p calls.
    [[nodiscard]] auto fanOut(const std::vector<InvocationCall>& calls) -> std::map<std::size_t, ItemResult>;

    /// @brief Probes GET {baseUrl}/health of one destination without retries.
    [[nodiscard]] auto healthCheck(std::string_view destination) -> HealthStatus;

    /// @brief Probes all registered destinations concurrently, ordered by name.
    [[nodiscard]] auto healthCheckAll() -> std::vector<HealthStatus>;

    [[nodiscard]] auto stats() const -> ClientStatsSnapshot;
    void resetStats();

    /// @brief Returns the network statistics of a destination's transport.
    /// @return The snapshot (all zero if the destination was never used) or DestinationNotFound.
    [[nodiscard]] auto networkStats(std::string_view destination) const -> Result<NetworkStatsSnapshot>;

    /// @brief Shuts down all transports. Idempotent.
    ///
    /// Later invocations fail with InvocationFailed caused by TransportClosed.
    void shutdown();

    [[nodiscard]] auto registry() const -> const DestinationRegistry& { return _registry; }
    [[nodiscard]] auto transportConfig() const -> const TransportConfig& { return _transportConfig; }
    [[nodiscard]] auto clientConfig() const -> const ClientConfig& { return _clientConfig; }
    [[nodiscard]] auto isShutdown() const -> bool { return _shutdown.load(); }

  private:
    using Clock = std::chrono::steady_clock;

    /// @brief Returns the destination's transport, creating and initializing it on first use.
    [[nodiscard]] auto transportFor(const Destination& destination) -> Result<Transport*>;

    [[nodiscard]] auto dispatch(const Destination& destination,
                                std::string_view operation,
                                const nlohmann::json& payload,
                                std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>;

    [[nodiscard]] auto validate(const nlohmann::json& result) const -> VoidResult;

    DestinationRegistry _registry;
    TransportConfig _transportConfig;
    ClientConfig _clientConfig;
    BackendFactory _backendFactory;
    ParallelGate _gate;
    Throttle _throttle;
    ClientStats _stats;

    mutable std::mutex _transportsMutex;
    std::map<std::string, std::unique_ptr<Transport>, std::less<>> _transports;
    std::atomic<bool> _shutdown = false;
};

} // namespace toolmesh
