// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <net/HttpBackend.hpp>

#include <memory>

namespace toolmesh
{

/// @brief HttpBackend built on libcurl.
///
/// Keeps a pool of easy handles (at most TransportConfig::maxConnectionsPerDestination)
/// that share one connection cache and one DNS cache. Callers block until a handle is
/// free or their request timeout runs out.
class CurlBackend: public HttpBackend
{
  public:
    CurlBackend();
    ~CurlBackend() override;

    CurlBackend(const CurlBackend&) = delete;
    CurlBackend& operator=(const CurlBackend&) = delete;

    [[nodiscard]] auto open(const TransportConfig& config) -> VoidResult override;
    [[nodiscard]] auto resolve(std::string_view url) -> VoidResult override;
    [[nodiscard]] auto execute(const WireRequest& request) -> Result<WireResponse> override;
    void close() override;
    [[nodiscard]] auto isOpen() const -> bool override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolmesh
