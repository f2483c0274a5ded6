// SPDX-License-Identifier: Apache-2.0
#include "OperatingMode.hpp"

#include <core/Log.hpp>

namespace toolmesh
{

namespace
{

    using namespace std::chrono_literals;

    auto makePresets() -> std::array<OperatingModePreset, 4>
    {
        auto standard = OperatingModePreset {
            .mode = OperatingMode::Standard,
            .name = "standard",
            .transport = TransportConfig {},
            .client = ClientConfig {},
        };

        auto highThroughput = OperatingModePreset {
            .mode = OperatingMode::HighThroughput,
            .name = "high_throughput",
            .transport = TransportConfig {},
            .client = ClientConfig {},
        };
        highThroughput.transport.maxConnections = 200;
        highThroughput.transport.maxConnectionsPerDestination = 20;
        highThroughput.transport.retryStrategy = RetryStrategy::Linear;
        highThroughput.transport.maxRetries = 2;
        highThroughput.client.batchSize = 50;
        highThroughput.client.maxParallelRequests = 10;
        highThroughput.client.enableResponseValidation = false;

        auto lowLatency = OperatingModePreset {
            .mode = OperatingMode::LowLatency,
            .name = "low_latency",
            .transport = TransportConfig {},
            .client = ClientConfig {},
        };
        lowLatency.transport.connectTimeout = 2s;
        lowLatency.transport.requestTimeout = 5s;
        lowLatency.transport.compressionEnabled = false;
        lowLatency.transport.compressionAlgorithm = CompressionAlgorithm::None;
        lowLatency.transport.retryStrategy = RetryStrategy::None;
        lowLatency.transport.maxRetries = 0;
        lowLatency.client.batchSize = 5;

        auto resilient = OperatingModePreset {
            .mode = OperatingMode::Resilient,
            .name = "resilient",
            .transport = TransportConfig {},
            .client = ClientConfig {},
        };
        resilient.transport.requestTimeout = 60s;
        resilient.transport.maxRetries = 5;
        resilient.transport.retryBaseDelay = 500ms;
        resilient.transport.retryMaxDelay = 30s;
        resilient.client.maxParallelRequests = 3;

        return { standard, highThroughput, lowLatency, resilient };
    }

} // namespace

auto operatingModePresets() -> const std::array<OperatingModePreset, 4>&
{
    static auto const presets = makePresets();
    return presets;
}

auto operatingModePreset(OperatingMode mode) -> const OperatingModePreset&
{
    return operatingModePresets()[static_cast<std::size_t>(mode)];
}

auto operatingModeName(OperatingMode mode) -> std::string_view
{
    return operatingModePreset(mode).name;
}

auto parseOperatingMode(std::string_view name) -> OperatingMode
{
    for (const auto& preset: operatingModePresets())
    {
        if (preset.name == name)
            return preset.mode;
    }

    log::warning("Unknown operating mode '{}', falling back to 'standard'", name);
    return OperatingMode::Standard;
}

} // namespace toolmesh
