// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <net/HttpBackend.hpp>

#include <atomic>
#include <cstdint>

namespace toolmesh
{

/// @brief Backend that answers every request with a canned response and performs no I/O.
///
/// Used for dry runs and tests where no destination is listening.
class NullBackend: public HttpBackend
{
  public:
    /// @brief Constructs a NullBackend answering 200 with an empty JSON object.
    NullBackend();

    /// @brief Constructs a NullBackend answering with the given response.
    explicit NullBackend(WireResponse response);

    [[nodiscard]] auto open(const TransportConfig& config) -> VoidResult override;
    [[nodiscard]] auto resolve(std::string_view url) -> VoidResult override;
    [[nodiscard]] auto execute(const WireRequest& request) -> Result<WireResponse> override;
    void close() override;
    [[nodiscard]] auto isOpen() const -> bool override;

    /// @brief Returns the number of requests executed so far.
    [[nodiscard]] auto requestCount() const -> std::uint64_t;

  private:
    WireResponse _response;
    std::atomic<bool> _open = false;
    std::atomic<std::uint64_t> _requestCount = 0;
};

} // namespace toolmesh
