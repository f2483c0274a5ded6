// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <net/HttpTypes.hpp>
#include <net/TransportConfig.hpp>

#include <string_view>

namespace toolmesh
{

/// @brief Abstract interface for executing single HTTP round trips against one destination.
///
/// A backend owns the pooled connections of one destination. It performs no retries and
/// no payload transformation; that is the job of Transport.
class HttpBackend
{
  public:
    virtual ~HttpBackend() = default;

    /// @brief Allocates the connection pool.
    /// @param config The transport settings (pool bounds, keepalive, DNS cache TTL).
    /// @return Success or an error.
    [[nodiscard]] virtual auto open(const TransportConfig& config) -> VoidResult = 0;

    /// @brief Checks that the host of @p url resolves.
    /// @return Success or a TransportInitError.
    [[nodiscard]] virtual auto resolve(std::string_view url) -> VoidResult = 0;

    /// @brief Executes one HTTP request (blocking).
    /// @param request The request to execute.
    /// @return The response, or a ConnectionError / RequestTimeout.
    [[nodiscard]] virtual auto execute(const WireRequest& request) -> Result<WireResponse> = 0;

    /// @brief Releases the connection pool. Must be idempotent.
    virtual void close() = 0;

    /// @brief Returns true between a successful open() and close().
    [[nodiscard]] virtual auto isOpen() const -> bool = 0;
};

} // namespace toolmesh
