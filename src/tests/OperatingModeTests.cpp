// SPDX-License-Identifier: Apache-2.0
#include <client/OperatingMode.hpp>
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace toolmesh;
using namespace std::chrono_literals;

TEST_CASE("Standard preset uses the defaults", "[mode]")
{
    auto const& preset = operatingModePreset(OperatingMode::Standard);
    CHECK(preset.name == "standard");
    CHECK(preset.transport.maxConnections == 100);
    CHECK(preset.transport.maxConnectionsPerDestination == 10);
    CHECK(preset.transport.connectTimeout == 10s);
    CHECK(preset.transport.keepaliveEnabled);
    CHECK(preset.transport.compressionEnabled);
    CHECK(preset.transport.compressionAlgorithm == CompressionAlgorithm::Gzip);
    CHECK(preset.transport.compressionThresholdBytes == 1024);
    CHECK(preset.transport.retryStrategy == RetryStrategy::Exponential);
    CHECK(preset.transport.maxRetries == 3);
    CHECK(preset.transport.retryBaseDelay == 100ms);
    CHECK(preset.transport.retryMaxDelay == 10s);
    CHECK(preset.transport.dnsCacheTtl == 300s);
    CHECK(preset.client.batchSize == 10);
    CHECK(preset.client.maxParallelRequests == 5);
    CHECK(preset.client.enableResponseValidation);
    CHECK(!preset.client.enableThrottling);
    CHECK(preset.client.requestsPerSecond == 10.0);
}

TEST_CASE("High throughput preset", "[mode]")
{
    auto const& preset = operatingModePreset(OperatingMode::HighThroughput);
    CHECK(preset.name == "high_throughput");
    CHECK(preset.transport.maxConnections == 200);
    CHECK(preset.transport.maxConnectionsPerDestination == 20);
    CHECK(preset.transport.retryStrategy == RetryStrategy::Linear);
    CHECK(preset.transport.maxRetries == 2);
    CHECK(preset.client.batchSize == 50);
    CHECK(preset.client.maxParallelRequests == 10);
    CHECK(!preset.client.enableResponseValidation);
}

TEST_CASE("Low latency preset", "[mode]")
{
    auto const& preset = operatingModePreset(OperatingMode::LowLatency);
    CHECK(preset.name == "low_latency");
    CHECK(preset.transport.connectTimeout == 2s);
    CHECK(preset.transport.requestTimeout == 5s);
    CHECK(!preset.transport.compressionEnabled);
    CHECK(preset.transport.compressionAlgorithm == CompressionAlgorithm::None);
    CHECK(preset.transport.retryStrategy == RetryStrategy::None);
    CHECK(preset.transport.maxRetries == 0);
    CHECK(preset.client.batchSize == 5);
}

TEST_CASE("Resilient preset", "[mode]")
{
    auto const& preset = operatingModePreset(OperatingMode::Resilient);
    CHECK(preset.name == "resilient");
    CHECK(preset.transport.requestTimeout == 60s);
    CHECK(preset.transport.maxRetries == 5);
    CHECK(preset.transport.retryBaseDelay == 500ms);
    CHECK(preset.transport.retryMaxDelay == 30s);
    CHECK(preset.transport.retryStrategy == RetryStrategy::Exponential);
    CHECK(preset.client.maxParallelRequests == 3);
}

TEST_CASE("parseOperatingMode round-trips every preset name", "[mode]")
{
    for (const auto& preset: operatingModePresets())
    {
        CHECK(parseOperatingMode(preset.name) == preset.mode);
        CHECK(operatingModeName(preset.mode) == preset.name);
    }
}

TEST_CASE("parseOperatingMode falls back to standard with a warning", "[mode]")
{
    auto warnings = std::vector<std::string> {};
    auto mode = OperatingMode::LowLatency;
    {
        auto const capture = log::ScopedCallback([&](log::Level level, std::string_view message) {
            if (level == log::Level::Warning)
                warnings.emplace_back(message);
        });
        mode = parseOperatingMode("turbo");
    }

    CHECK(mode == OperatingMode::Standard);
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].find("turbo") != std::string::npos);
}
