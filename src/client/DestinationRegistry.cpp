// SPDX-License-Identifier: Apache-2.0
#include "DestinationRegistry.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>

namespace toolmesh
{

DestinationRegistry::DestinationRegistry(std::vector<Destination> destinations)
{
    for (auto& destination: destinations)
    {
        while (destination.baseUrl.ends_with('/'))
            destination.baseUrl.pop_back();
        auto name = destination.name;
        _destinations.insert_or_assign(std::move(name), std::move(destination));
    }
}

auto DestinationRegistry::load(std::string_view path) -> Result<DestinationRegistry>
{
    return json::readFile(path, ErrorCode::ConfigLoadError)
        .and_then([path](const nlohmann::json& root) { return fromJson(root, path); });
}

auto DestinationRegistry::parse(std::string_view text, std::string_view origin) -> Result<DestinationRegistry>
{
    auto parsed = json::parse(text, ErrorCode::ConfigLoadError);
    if (!parsed)
        return makeError(ErrorCode::ConfigLoadError, std::format("{}: {}", origin, parsed.error().message));
    return fromJson(*parsed, origin);
}

auto DestinationRegistry::fromJson(const nlohmann::json& root, std::string_view origin)
    -> Result<DestinationRegistry>
{
    if (!root.is_object() || !root.contains("servers") || !root["servers"].is_object())
        return makeError(ErrorCode::ConfigLoadError, std::format("{}: missing \"servers\" object", origin));

    auto destinations = std::vector<Destination> {};
    for (const auto& [name, server]: root["servers"].items())
    {
        auto baseUrl = json::getString(server, "baseUrl", ErrorCode::ConfigLoadError);
        if (!baseUrl || baseUrl->empty())
            return makeError(ErrorCode::ConfigLoadError,
                             std::format("{}: destination '{}' lacks a \"baseUrl\"", origin, name));

        auto destination = Destination {
            .name = name,
            .baseUrl = std::move(*baseUrl),
            .headers = {},
            .timeout = std::nullopt,
        };

        if (server.contains("headers") && server["headers"].is_object())
        {
            for (const auto& [key, value]: server["headers"].items())
            {
                if (value.is_string())
                    destination.headers[key] = value.get<std::string>();
            }
        }

        if (auto const timeoutMs = json::getIntOr(server, "timeoutMs", 0); timeoutMs > 0)
            destination.timeout = std::chrono::milliseconds(timeoutMs);

        destinations.push_back(std::move(destination));
    }

    log::debug("Loaded {} destinations from {}", destinations.size(), origin);
    return DestinationRegistry(std::move(destinations));
}

auto DestinationRegistry::resolve(std::string_view name) const -> Result<Destination>
{
    auto const it = _destinations.find(name);
    if (it == _destinations.end())
        return makeError(ErrorCode::DestinationNotFound, std::format("Unknown destination: {}", name));
    return it->second;
}

auto DestinationRegistry::contains(std::string_view name) const -> bool
{
    return _destinations.find(name) != _destinations.end();
}

auto DestinationRegistry::names() const -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    result.reserve(_destinations.size());
    for (const auto& [name, destination]: _destinations)
        result.push_back(name);
    return result;
}

auto DestinationRegistry::size() const -> std::size_t
{
    return _destinations.size();
}

auto DestinationRegistry::empty() const -> bool
{
    return _destinations.empty();
}

} // namespace toolmesh
