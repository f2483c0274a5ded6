// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace toolmesh
{

/// @brief HTTP header map. Response headers are stored with lower-cased names.
using Headers = std::map<std::string, std::string>;

/// @brief Returns a lower-cased copy of a header name.
[[nodiscard]] inline auto lowerCase(std::string_view text) -> std::string
{
    auto result = std::string(text);
    std::ranges::transform(
        result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/// @brief The unit a caller submits to a Transport.
struct CallEnvelope
{
    std::string method = "POST";
    std::string url;
    Headers headers;
    std::optional<std::string> body;

    /// @brief Overall deadline for the call including retries and backoff.
    std::optional<std::chrono::milliseconds> timeout;
};

/// @brief A single HTTP round trip as handed to an HttpBackend.
struct WireRequest
{
    std::string method;
    std::string url;
    Headers headers;
    std::string body;
    std::chrono::milliseconds timeout { 30'000 };
    std::chrono::milliseconds connectTimeout { 10'000 };
};

/// @brief The raw result of one HTTP round trip.
struct WireResponse
{
    int status = 0;
    Headers headers;
    std::string body;

    /// @brief Returns a header value by case-insensitive name, or an empty string.
    [[nodiscard]] auto header(std::string_view name) const -> std::string
    {
        auto const it = headers.find(lowerCase(name));
        return it != headers.end() ? it->second : std::string {};
    }
};

/// @brief A decoded response returned by Transport::request().
struct HttpResponse
{
    int status = 0;
    Headers headers;
    std::string rawBody;

    /// @brief Set when the response declared a JSON content type.
    std::optional<nlohmann::json> json;

    [[nodiscard]] auto isJson() const -> bool { return json.has_value(); }

    /// @brief Returns the decoded JSON body, the raw body as a JSON string, or null if empty.
    [[nodiscard]] auto body() const -> nlohmann::json
    {
        if (json)
            return *json;
        if (rawBody.empty())
            return nullptr;
        return rawBody;
    }
};

} // namespace toolmesh
