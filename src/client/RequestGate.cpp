// SPDX-License-Identifier: Apache-2.0
#include "RequestGate.hpp"

#include <algorithm>
#include <thread>

namespace toolmesh
{

ParallelGate::Slot::~Slot()
{
    if (_gate)
        _gate->_slots.release();
}

ParallelGate::ParallelGate(std::size_t capacity):
    _capacity(std::max<std::size_t>(1, capacity)), _slots(static_cast<std::ptrdiff_t>(_capacity))
{
}

auto ParallelGate::acquire(const std::optional<Clock::time_point>& deadline) -> Result<Slot>
{
    if (!deadline)
    {
        _slots.acquire();
        return Slot(*this);
    }

    if (!_slots.try_acquire_until(*deadline))
        return makeError(ErrorCode::RequestTimeout, "Timed out waiting for a free request slot");
    return Slot(*this);
}

Throttle::Throttle(double requestsPerSecond):
    _interval(requestsPerSecond > 0.0 ? std::chrono::duration_cast<std::chrono::nanoseconds>(
                                            std::chrono::duration<double>(1.0 / requestsPerSecond))
                                      : std::chrono::nanoseconds::zero())
{
}

void Throttle::wait()
{
    auto lock = std::lock_guard(_mutex);

    if (_lastRequestTime && _interval > std::chrono::nanoseconds::zero())
    {
        auto const nextAllowed = *_lastRequestTime + _interval;
        if (Clock::now() < nextAllowed)
            std::this_thread::sleep_until(nextAllowed);
    }

    _lastRequestTime = Clock::now();
}

} // namespace toolmesh
