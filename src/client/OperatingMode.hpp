// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <net/TransportConfig.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace toolmesh
{

/// @brief Settings of one ToolClient.
struct ClientConfig
{
    std::size_t batchSize = 10;
    std::size_t maxParallelRequests = 5;
    bool enableResponseValidation = true;
    bool enableThrottling = false;
    double requestsPerSecond = 10.0;
};

/// @brief Named configuration bundles for the transport and client layers.
enum class OperatingMode : std::uint8_t
{
    Standard,
    HighThroughput,
    LowLatency,
    Resilient,
};

/// @brief Transport and client settings selected by an OperatingMode.
struct OperatingModePreset
{
    OperatingMode mode;
    std::string_view name;
    TransportConfig transport;
    ClientConfig client;
};

/// @brief Returns the canonical name of a mode ("standard", "high_throughput", ...).
[[nodiscard]] auto operatingModeName(OperatingMode mode) -> std::string_view;

/// @brief Parses a mode name.
///
/// Unknown names fall back to OperatingMode::Standard and log a warning.
/// @param name The mode name, e.g. "low_latency".
[[nodiscard]] auto parseOperatingMode(std::string_view name) -> OperatingMode;

/// @brief Returns the preset for a mode.
[[nodiscard]] auto operatingModePreset(OperatingMode mode) -> const OperatingModePreset&;

/// @brief Returns all presets in declaration order.
[[nodiscard]] auto operatingModePresets() -> const std::array<OperatingModePreset, 4>&;

} // namespace toolmesh
