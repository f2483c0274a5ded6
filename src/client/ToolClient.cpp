// SPDX-License-Identifier: Apache-2.0
#include "ToolClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <net/CurlBackend.hpp>
#include <net/NullBackend.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <system_error>
#include <thread>

namespace toolmesh
{

namespace
{
    constexpr auto HealthCheckTimeout = std::chrono::milliseconds(5000);

    auto elapsedMs(std::chrono::steady_clock::time_point since) -> double
    {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
    }

    /// Runs task(0) .. task(count - 1) on up to @p workers threads, the calling thread included.
    /// Each index runs exactly once. If the system refuses to start more threads, the ones that
    /// did start (and the caller) work through the remaining indices.
    template <typename Task>
    void runConcurrently(std::size_t count, std::size_t workers, Task const& task)
    {
        auto next = std::atomic<std::size_t> { 0 };
        auto const work = [&] {
            for (auto i = next.fetch_add(1); i < count; i = next.fetch_add(1))
                task(i);
        };

        auto threads = std::vector<std::jthread> {};
        auto const helpers = std::min(count, std::max<std::size_t>(1, workers)) - (count > 0 ? 1 : 0);
        threads.reserve(helpers);
        for (auto i = std::size_t { 0 }; i < helpers; ++i)
        {
            try
            {
                threads.emplace_back(work);
            }
            catch (const std::system_error& e)
            {
                log::warning("Started only {} of {} worker threads: {}", threads.size(), helpers, e.what());
                break;
            }
        }

        work();
    }
} // namespace

auto toJson(const ItemResult& result) -> nlohmann::json
{
    if (result)
        return *result;
    return nlohmann::json { { "error", result.error().message } };
}

auto curlBackendFactory() -> BackendFactory
{
    return [](const Destination&) -> std::unique_ptr<HttpBackend> { return std::make_unique<CurlBackend>(); };
}

auto nullBackendFactory() -> BackendFactory
{
    return [](const Destination&) -> std::unique_ptr<HttpBackend> { return std::make_unique<NullBackend>(); };
}

ToolClient::ToolClient(DestinationRegistry registry, OperatingMode mode, BackendFactory backendFactory):
    ToolClient(std::move(registry),
               operatingModePreset(mode).transport,
               operatingModePreset(mode).client,
               std::move(backendFactory))
{
}

ToolClient::ToolClient(DestinationRegistry registry,
                       TransportConfig transportConfig,
                       ClientConfig clientConfig,
                       BackendFactory backendFactory):
    _registry(std::move(registry)),
    _transportConfig(std::move(transportConfig)),
    _clientConfig(clientConfig),
    _backendFactory(std::move(backendFactory)),
    _gate(clientConfig.maxParallelRequests),
    _throttle(clientConfig.enableThrottling ? clientConfig.requestsPerSecond : 0.0)
{
    log::debug("Tool client created for {} destinations (batch {}, parallel {})",
               _registry.size(),
               _clientConfig.batchSize,
               _gate.capacity());
}

ToolClient::ToolClient(ToolmeshConfig config, BackendFactory backendFactory):
    ToolClient(std::move(config.registry), std::move(config.transport), config.client, std::move(backendFactory))
{
}

ToolClient::~ToolClient()
{
    shutdown();
}

auto ToolClient::fromConfigFile(std::string_view path, BackendFactory backendFactory)
    -> Result<std::unique_ptr<ToolClient>>
{
    auto config = loadConfigFromFile(path);
    if (!config)
        return std::unexpected(config.error());

    log::setLevel(config->logLevel);
    log::info("Loaded {} destinations from {} (mode {})",
              config->registry.size(),
              path,
              operatingModeName(config->mode));
    return std::make_unique<ToolClient>(std::move(*config), std::move(backendFactory));
}

auto ToolClient::invoke(std::string_view destination,
                        std::string_view operation,
                        const nlohmann::json& payload,
                        std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    auto const startedAt = Clock::now();
    _stats.recordSent();

    auto result = _registry.resolve(destination).and_then([&](const Destination& resolved) {
        return dispatch(resolved, operation, payload, timeout ? timeout : resolved.timeout);
    });

    _stats.recordCompletion(result.has_value(), elapsedMs(startedAt));

    if (!result)
    {
        log::debug("{}.{} failed: {}", destination, operation, result.error());
        return wrapError(ErrorCode::InvocationFailed,
                         std::format("{}.{} failed: {}", destination, operation, result.error().message),
                         std::move(result.error()));
    }
    return result;
}

auto ToolClient::batchInvoke(std::string_view destination,
                             std::string_view operation,
                             const std::vector<nlohmann::json>& payloads) -> std::vector<ItemResult>
{
    auto results = std::vector<ItemResult> {};
    results.reserve(payloads.size());

    auto const chunkSize = std::max<std::size_t>(1, _clientConfig.batchSize);
    for (auto offset = std::size_t { 0 }; offset < payloads.size(); offset += chunkSize)
    {
        auto const end = std::min(offset + chunkSize, payloads.size());

        auto chunk = std::vector<std::optional<ItemResult>>(end - offset);
        runConcurrently(chunk.size(), chunk.size(), [&](std::size_t i) {
            chunk[i] = invoke(destination, operation, payloads[offset + i]);
        });

        for (auto& item: chunk)
            results.push_back(std::move(*item));
    }

    log::debug("Batch {}.{}: {} items in chunks of {}", destination, operation, payloads.size(), chunkSize);
    return results;
}

auto ToolClient::fanOut(const std::vector<InvocationCall>& calls) -> std::map<std::size_t, ItemResult>
{
    auto collected = std::vector<std::optional<ItemResult>>(calls.size());
    runConcurrently(calls.size(), _gate.capacity(), [&](std::size_t i) {
        collected[i] = invoke(calls[i].destination, calls[i].operation, calls[i].payload);
    });

    auto results = std::map<std::size_t, ItemResult> {};
    for (auto i = std::size_t { 0 }; i < collected.size(); ++i)
        results.emplace(i, std::move(*collected[i]));
    return results;
}

auto ToolClient::healthCheck(std::string_view destination) -> HealthStatus
{
    auto status = HealthStatus { .destination = std::string(destination) };

    auto resolved = _registry.resolve(destination);
    if (!resolved)
    {
        status.error = resolved.error().message;
        return status;
    }

    auto transport = transportFor(*resolved);
    if (!transport)
    {
        status.error = transport.error().message;
        return status;
    }

    auto const startedAt = Clock::now();
    auto slot = _gate.acquire(startedAt + HealthCheckTimeout);
    if (!slot)
    {
        status.error = slot.error().message;
        return status;
    }

    auto envelope = CallEnvelope {
        .method = "GET",
        .url = std::format("{}/health", resolved->baseUrl),
        .headers = resolved->headers,
        .body = std::nullopt,
        .timeout = HealthCheckTimeout,
    };
    envelope.headers["Accept"] = "application/json";

    auto response = (*transport)->request(envelope, StatusSet {});
    status.responseTimeMs = elapsedMs(startedAt);

    if (!response)
    {
        status.error = response.error().message;
        return status;
    }
    if (response->status != 200)
    {
        status.error = std::format("HTTP {}", response->status);
        return status;
    }

    status.healthy = true;
    auto const body = response->body();
    if (body.is_object() && body.contains("capabilities") && body["capabilities"].is_array())
    {
        for (const auto& capability: body["capabilities"])
        {
            if (capability.is_string())
                status.capabilities.push_back(capability.get<std::string>());
        }
    }

    log::debug("Health of '{}': {:.1f} ms, {} capabilities",
               status.destination,
               status.responseTimeMs,
               status.capabilities.size());
    return status;
}

auto ToolClient::healthCheckAll() -> std::vector<HealthStatus>
{
    auto const names = _registry.names();
    auto results = std::vector<HealthStatus>(names.size());
    runConcurrently(names.size(), _gate.capacity(), [&](std::size_t i) { results[i] = healthCheck(names[i]); });

    auto const healthy = std::ranges::count_if(results, [](const HealthStatus& s) { return s.healthy; });
    log::info("Health check: {}/{} destinations healthy", healthy, results.size());
    return results;
}

auto ToolClient::stats() const -> ClientStatsSnapshot
{
    return _stats.snapshot();
}

void ToolClient::resetStats()
{
    _stats.reset();

    auto lock = std::lock_guard(_transportsMutex);
    for (auto& [name, transport]: _transports)
        transport->resetStats();
}

auto ToolClient::networkStats(std::string_view destination) const -> Result<NetworkStatsSnapshot>
{
    if (!_registry.contains(destination))
        return makeError(ErrorCode::DestinationNotFound, std::format("Unknown destination: {}", destination));

    auto lock = std::lock_guard(_transportsMutex);
    auto const it = _transports.find(destination);
    if (it == _transports.end())
        return NetworkStatsSnapshot {};
    return it->second->stats();
}

void ToolClient::shutdown()
{
    if (_shutdown.exchange(true))
        return;

    auto transports = std::vector<Transport*> {};
    {
        auto lock = std::lock_guard(_transportsMutex);
        for (auto& [name, transport]: _transports)
            transports.push_back(transport.get());
    }

    for (auto* transport: transports)
        transport->shutdown();

    log::info("Tool client shut down ({} transports closed)", transports.size());
}

auto ToolClient::transportFor(const Destination& destination) -> Result<Transport*>
{
    Transport* transport = nullptr;
    {
        auto lock = std::lock_guard(_transportsMutex);
        if (_shutdown.load())
            return makeError(ErrorCode::TransportClosed, "Client has been shut down");

        if (auto const it = _transports.find(destination.name); it != _transports.end())
            transport = it->second.get();
        else
        {
            auto backend = _backendFactory(destination);
            if (!backend)
                return makeError(ErrorCode::TransportInitError,
                                 std::format("No HTTP backend available for '{}'", destination.name));

            auto created = std::make_unique<Transport>(
                destination.name, destination.baseUrl, _transportConfig, std::move(backend));
            transport = _transports.emplace(destination.name, std::move(created)).first->second.get();
            log::debug("Transport for '{}' created ({})", destination.name, destination.baseUrl);
        }
    }

    // Initialization probes DNS, which may block; other destinations must not wait on it.
    if (!transport->isInitialized())
    {
        if (auto initialized = transport->initialize(); !initialized)
            return std::unexpected(initialized.error());
    }
    return transport;
}

auto ToolClient::dispatch(const Destination& destination,
                          std::string_view operation,
                          const nlohmann::json& payload,
                          std::optional<std::chrono::milliseconds> timeout) -> Result<nlohmann::json>
{
    auto body = json::dump(nlohmann::json { { "operation", operation }, { "arguments", payload } });
    if (!body)
        return std::unexpected(body.error());

    auto transport = transportFor(destination);
    if (!transport)
        return std::unexpected(transport.error());

    auto deadline = std::optional<Clock::time_point> {};
    if (timeout)
        deadline = Clock::now() + *timeout;

    if (_clientConfig.enableThrottling)
        _throttle.wait();

    auto slot = _gate.acquire(deadline);
    if (!slot)
        return std::unexpected(slot.error());

    auto remaining = std::optional<std::chrono::milliseconds> {};
    if (deadline)
    {
        remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
        if (remaining->count() <= 0)
            return makeError(ErrorCode::RequestTimeout,
                             std::format("Deadline of {} ms exceeded before dispatch", timeout->count()));
    }

    auto envelope = CallEnvelope {
        .method = "POST",
        .url = std::format("{}/invoke/{}", destination.baseUrl, operation),
        .headers = destination.headers,
        .body = std::move(*body),
        .timeout = remaining,
    };
    envelope.headers["Content-Type"] = "application/json";
    envelope.headers["Accept"] = "application/json";

    auto response = (*transport)->request(envelope);
    if (!response)
        return std::unexpected(response.error());

    if (response->status != 200)
    {
        auto error = Error {
            .code = ErrorCode::InvocationError,
            .message = std::format("{} returned HTTP {}", envelope.url, response->status),
            .status = response->status,
        };
        return std::unexpected(std::move(error));
    }

    auto result = response->body();
    if (_clientConfig.enableResponseValidation)
    {
        if (auto valid = validate(result); !valid)
            return std::unexpected(valid.error());
    }
    return result;
}

auto ToolClient::validate(const nlohmann::json& result) const -> VoidResult
{
    if (result.is_null())
        return makeError(ErrorCode::InvalidResponse, "Response is empty");

    if (result.is_object() && result.contains("error"))
    {
        auto const& error = result["error"];
        return makeError(ErrorCode::InvalidResponse,
                         std::format("Response reports an error: {}",
                                     error.is_string() ? error.get<std::string>() : error.dump()));
    }
    return {};
}

} // namespace toolmesh
