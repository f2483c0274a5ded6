// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <client/DestinationRegistry.hpp>
#include <client/OperatingMode.hpp>
#include <core/Error.hpp>
#include <core/Log.hpp>
#include <net/TransportConfig.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace toolmesh
{

/// @brief Everything needed to construct a ToolClient.
struct ToolmeshConfig
{
    DestinationRegistry registry;
    OperatingMode mode = OperatingMode::Standard;

    /// @brief The mode's transport preset with the file's "transport" overrides applied.
    TransportConfig transport = operatingModePreset(OperatingMode::Standard).transport;

    /// @brief The mode's client preset with the file's "client" overrides applied.
    ClientConfig client = operatingModePreset(OperatingMode::Standard).client;

    log::Level logLevel = log::Level::Info;
};

/// @brief Builds a configuration from a registry and a preset without overrides.
[[nodiscard]] auto makeConfig(DestinationRegistry registry, OperatingMode mode) -> ToolmeshConfig;

/// @brief Builds a configuration from a parsed JSON document.
///
/// Recognized top-level keys: "servers" (required), "mode", "transport", "client", "log".
/// Unknown keys are ignored.
/// @param root The JSON document.
/// @param origin Name of the source used in error messages.
/// @return The configuration or a ConfigLoadError.
[[nodiscard]] auto configFromJson(const nlohmann::json& root, std::string_view origin = "<memory>")
    -> Result<ToolmeshConfig>;

/// @brief Loads the configuration from a file path.
/// @param path The path to the config file.
/// @return The loaded configuration or a ConfigLoadError naming the path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<ToolmeshConfig>;

} // namespace toolmesh
