// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <net/HttpTypes.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolmesh
{

/// @brief A named backend service reachable over HTTP.
struct Destination
{
    std::string name;

    /// @brief Base URL without trailing slash, e.g. "http://localhost:9100".
    std::string baseUrl;

    /// @brief Opaque headers attached to every request (e.g. caller-supplied credentials).
    Headers headers;

    /// @brief Default call timeout for this destination, if configured.
    std::optional<std::chrono::milliseconds> timeout;
};

/// @brief Immutable mapping of destination names to their base URLs.
class DestinationRegistry
{
  public:
    /// @brief Constructs an empty registry.
    DestinationRegistry() = default;

    /// @brief Constructs a registry from a list of destinations. Later duplicates win.
    explicit DestinationRegistry(std::vector<Destination> destinations);

    /// @brief Loads a registry from a JSON file with a top-level "servers" object.
    /// @param path The path to the registry file.
    /// @return The registry or a ConfigLoadError naming the path.
    [[nodiscard]] static auto load(std::string_view path) -> Result<DestinationRegistry>;

    /// @brief Parses a registry from JSON text.
    /// @param text The JSON document.
    /// @param origin Name of the source used in error messages.
    [[nodiscard]] static auto parse(std::string_view text, std::string_view origin = "<memory>")
        -> Result<DestinationRegistry>;

    /// @brief Builds a registry from a parsed JSON document.
    /// @param root The document; its "servers" object maps names to objects with "baseUrl".
    /// @param origin Name of the source used in error messages.
    [[nodiscard]] static auto fromJson(const nlohmann::json& root, std::string_view origin = "<memory>")
        -> Result<DestinationRegistry>;

    /// @brief Resolves a destination by name.
    /// @return The destination or DestinationNotFound.
    [[nodiscard]] auto resolve(std::string_view name) const -> Result<Destination>;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool;

  private:
    std::map<std::string, Destination, std::less<>> _destinations;
};

} // namespace toolmesh
