// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace toolmesh
{

namespace
{

    auto milliseconds(const nlohmann::json& obj, std::string_view key, std::chrono::milliseconds fallback)
        -> std::chrono::milliseconds
    {
        return std::chrono::milliseconds(json::getIntOr(obj, key, static_cast<int>(fallback.count())));
    }

    auto applyTransportOverrides(const nlohmann::json& section, TransportConfig& transport) -> VoidResult
    {
        auto const maxConnections = json::getIntOr(section, "maxConnections", static_cast<int>(transport.maxConnections));
        auto const perDestination = json::getIntOr(
            section, "maxConnectionsPerDestination", static_cast<int>(transport.maxConnectionsPerDestination));
        if (maxConnections < 1 || perDestination < 1)
            return makeError(ErrorCode::ConfigLoadError, "transport: connection limits must be at least 1");
        transport.maxConnections = static_cast<std::size_t>(maxConnections);
        transport.maxConnectionsPerDestination = static_cast<std::size_t>(perDestination);

        transport.connectTimeout = milliseconds(section, "connectTimeoutMs", transport.connectTimeout);
        transport.requestTimeout = milliseconds(section, "requestTimeoutMs", transport.requestTimeout);
        if (transport.connectTimeout.count() <= 0 || transport.requestTimeout.count() <= 0)
            return makeError(ErrorCode::ConfigLoadError, "transport: timeouts must be positive");

        transport.keepaliveEnabled = json::getBoolOr(section, "keepaliveEnabled", transport.keepaliveEnabled);
        transport.compressionEnabled = json::getBoolOr(section, "compressionEnabled", transport.compressionEnabled);

        auto const algorithm = json::getStringOr(
            section, "compressionAlgorithm", transport.compressionAlgorithm == CompressionAlgorithm::Gzip ? "gzip" : "none");
        if (algorithm != "gzip" && algorithm != "none")
            return makeError(ErrorCode::ConfigLoadError,
                             std::format("transport: unsupported compression algorithm '{}'", algorithm));
        transport.compressionAlgorithm = algorithm == "gzip" ? CompressionAlgorithm::Gzip : CompressionAlgorithm::None;

        auto const threshold = json::getIntOr(
            section, "compressionThresholdBytes", static_cast<int>(transport.compressionThresholdBytes));
        if (threshold < 0)
            return makeError(ErrorCode::ConfigLoadError, "transport: compressionThresholdBytes must not be negative");
        transport.compressionThresholdBytes = static_cast<std::size_t>(threshold);

        if (section.contains("retryStrategy"))
            transport.retryStrategy =
                retryStrategyFromString(json::getStringOr(section, "retryStrategy", "exponential"));

        transport.maxRetries = json::getIntOr(section, "maxRetries", transport.maxRetries);
        if (transport.maxRetries < 0)
            return makeError(ErrorCode::ConfigLoadError, "transport: maxRetries must not be negative");

        transport.retryBaseDelay = milliseconds(section, "retryBaseDelayMs", transport.retryBaseDelay);
        transport.retryMaxDelay = milliseconds(section, "retryMaxDelayMs", transport.retryMaxDelay);

        if (section.contains("retryableStatuses") && section["retryableStatuses"].is_array())
        {
            transport.retryableStatuses.clear();
            for (const auto& status: section["retryableStatuses"])
            {
                if (status.is_number_integer())
                    transport.retryableStatuses.insert(status.get<int>());
            }
        }

        transport.dnsCacheTtl = std::chrono::seconds(
            json::getIntOr(section, "dnsCacheTtlSeconds", static_cast<int>(transport.dnsCacheTtl.count())));
        return {};
    }

    auto applyClientOverrides(const nlohmann::json& section, ClientConfig& client) -> VoidResult
    {
        auto const batchSize = json::getIntOr(section, "batchSize", static_cast<int>(client.batchSize));
        auto const parallel =
            json::getIntOr(section, "maxParallelRequests", static_cast<int>(client.maxParallelRequests));
        if (batchSize < 1 || parallel < 1)
            return makeError(ErrorCode::ConfigLoadError, "client: batchSize and maxParallelRequests must be at least 1");
        client.batchSize = static_cast<std::size_t>(batchSize);
        client.maxParallelRequests = static_cast<std::size_t>(parallel);

        client.enableResponseValidation =
            json::getBoolOr(section, "enableResponseValidation", client.enableResponseValidation);
        client.enableThrottling = json::getBoolOr(section, "enableThrottling", client.enableThrottling);
        client.requestsPerSecond = json::getDoubleOr(section, "requestsPerSecond", client.requestsPerSecond);
        if (client.enableThrottling && client.requestsPerSecond <= 0.0)
            return makeError(ErrorCode::ConfigLoadError, "client: requestsPerSecond must be positive");
        return {};
    }

} // namespace

auto makeConfig(DestinationRegistry registry, OperatingMode mode) -> ToolmeshConfig
{
    auto const& preset = operatingModePreset(mode);
    return ToolmeshConfig {
        .registry = std::move(registry),
        .mode = mode,
        .transport = preset.transport,
        .client = preset.client,
    };
}

auto configFromJson(const nlohmann::json& root, std::string_view origin) -> Result<ToolmeshConfig>
{
    auto registry = DestinationRegistry::fromJson(root, origin);
    if (!registry)
        return std::unexpected(registry.error());

    auto config = makeConfig(std::move(*registry), parseOperatingMode(json::getStringOr(root, "mode", "standard")));

    auto const withOrigin = [origin](const Error& error) {
        return makeError(ErrorCode::ConfigLoadError, std::format("{}: {}", origin, error.message));
    };

    // Transport section
    if (root.contains("transport"))
    {
        if (auto applied = applyTransportOverrides(root["transport"], config.transport); !applied)
            return withOrigin(applied.error());
    }

    // Client section
    if (root.contains("client"))
    {
        if (auto applied = applyClientOverrides(root["client"], config.client); !applied)
            return withOrigin(applied.error());
    }

    // Log section
    if (root.contains("log"))
        config.logLevel = log::levelFromString(json::getStringOr(root["log"], "level", "info"));

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<ToolmeshConfig>
{
    return json::readFile(path, ErrorCode::ConfigLoadError)
        .and_then([path](const nlohmann::json& root) { return configFromJson(root, path); });
}

} // namespace toolmesh
