// SPDX-License-Identifier: Apache-2.0
#include <client/ToolClient.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <toolmesh/Config.hpp>

#include <CLI/CLI.hpp>

#include <chrono>
#include <format>
#include <optional>
#include <print>

int main(int argc, char** argv)
{
    auto app = CLI::App { "toolmesh: invoke operations on a fleet of HTTP tool services" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto modeName = std::string {};
    auto dryRun = false;
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to the servers/config file")->required();
    app.add_option("-m,--mode", modeName, "Operating mode (standard|high_throughput|low_latency|resilient)");
    app.add_flag("--dry-run", dryRun, "Answer every request locally without network I/O");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    auto* health = app.add_subcommand("health", "Probe the /health endpoint of every destination");

    auto* invoke = app.add_subcommand("invoke", "Invoke an operation on a destination");
    auto destination = std::string {};
    auto operation = std::string {};
    auto payloadText = std::string { "{}" };
    auto timeoutMs = 0;
    invoke->add_option("destination", destination, "Destination name")->required();
    invoke->add_option("operation", operation, "Operation name")->required();
    invoke->add_option("-p,--payload", payloadText, "JSON arguments");
    invoke->add_option("-t,--timeout", timeoutMs, "Call timeout in milliseconds");

    CLI11_PARSE(app, argc, argv);

    // Load config
    auto configResult = toolmesh::loadConfigFromFile(configPath);
    if (!configResult)
    {
        toolmesh::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;
    toolmesh::log::setLevel(verbose ? toolmesh::log::Level::Debug : config.logLevel);

    // Apply CLI overrides
    if (!modeName.empty())
    {
        auto const& preset = toolmesh::operatingModePreset(toolmesh::parseOperatingMode(modeName));
        config.mode = preset.mode;
        config.transport = preset.transport;
        config.client = preset.client;
    }

    auto client = toolmesh::ToolClient(
        std::move(config), dryRun ? toolmesh::nullBackendFactory() : toolmesh::curlBackendFactory());

    if (health->parsed())
    {
        auto healthy = true;
        for (const auto& status: client.healthCheckAll())
        {
            healthy = healthy && status.healthy;
            if (status.healthy)
                std::println("{:<24} ok    {:>8.1f} ms  [{}]",
                             status.destination,
                             status.responseTimeMs,
                             toolmesh::json::dumpForDisplay(status.capabilities, -1));
            else
                std::println("{:<24} FAIL  {}", status.destination, status.error);
        }
        return healthy ? 0 : 2;
    }

    auto payload = toolmesh::json::parse(payloadText, toolmesh::ErrorCode::InvalidArgument);
    if (!payload)
    {
        toolmesh::log::error("Invalid --payload: {}", payload.error().message);
        return 1;
    }

    auto timeout = std::optional<std::chrono::milliseconds> {};
    if (timeoutMs > 0)
        timeout = std::chrono::milliseconds(timeoutMs);

    auto result = client.invoke(destination, operation, *payload, timeout);
    std::println("{}", toolmesh::json::dumpForDisplay(toolmesh::toJson(result)));

    auto const network = client.networkStats(destination);
    if (network)
        toolmesh::log::debug("{} attempts, {} retries, {:.1f} ms average latency",
                             network->requestsSent,
                             network->retriedRequests,
                             network->avgLatencyMs);
    return result ? 0 : 2;
}
