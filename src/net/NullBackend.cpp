// SPDX-License-Identifier: Apache-2.0
#include "NullBackend.hpp"

#include <core/Log.hpp>

namespace toolmesh
{

NullBackend::NullBackend():
    NullBackend(WireResponse {
        .status = 200,
        .headers = { { "content-type", "application/json" } },
        .body = "{}",
    })
{
}

NullBackend::NullBackend(WireResponse response): _response(std::move(response))
{
}

auto NullBackend::open(const TransportConfig& /*config*/) -> VoidResult
{
    _open = true;
    return {};
}

auto NullBackend::resolve(std::string_view /*url*/) -> VoidResult
{
    return {};
}

auto NullBackend::execute(const WireRequest& request) -> Result<WireResponse>
{
    if (!_open)
        return makeError(ErrorCode::TransportClosed, "Null backend is not open");

    ++_requestCount;
    log::trace("null backend: {} {} ({} bytes)", request.method, request.url, request.body.size());
    return _response;
}

void NullBackend::close()
{
    _open = false;
}

auto NullBackend::isOpen() const -> bool
{
    return _open;
}

auto NullBackend::requestCount() const -> std::uint64_t
{
    return _requestCount;
}

} // namespace toolmesh
