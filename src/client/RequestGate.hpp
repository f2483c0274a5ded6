// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <semaphore>
#include <utility>

namespace toolmesh
{

/// @brief Bounds the number of requests a client dispatches at the same time.
class ParallelGate
{
  public:
    using Clock = std::chrono::steady_clock;

    /// @brief A held slot, released when destroyed.
    class Slot
    {
      public:
        explicit Slot(ParallelGate& gate): _gate(&gate) {}
        Slot(Slot&& other) noexcept: _gate(std::exchange(other._gate, nullptr)) {}
        Slot& operator=(Slot&&) = delete;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot();

      private:
        ParallelGate* _gate;
    };

    explicit ParallelGate(std::size_t capacity);

    /// @brief Waits for a free slot.
    /// @param deadline Gives up at this point in time; waits indefinitely if empty.
    /// @return The slot, or RequestTimeout when the deadline passed first.
    [[nodiscard]] auto acquire(const std::optional<Clock::time_point>& deadline = std::nullopt) -> Result<Slot>;

    [[nodiscard]] auto capacity() const -> std::size_t { return _capacity; }

  private:
    std::size_t _capacity;
    std::counting_semaphore<> _slots;
};

/// @brief Enforces a minimum interval between consecutive requests.
///
/// The wait happens while holding the lock, so concurrent callers pass one at a time and
/// never share a window.
class Throttle
{
  public:
    /// @param requestsPerSecond The request rate ceiling; values <= 0 disable throttling.
    explicit Throttle(double requestsPerSecond);

    /// @brief Blocks until the minimum interval since the previous request has elapsed.
    void wait();

    [[nodiscard]] auto interval() const -> std::chrono::nanoseconds { return _interval; }

  private:
    using Clock = std::chrono::steady_clock;

    std::chrono::nanoseconds _interval;
    std::mutex _mutex;
    std::optional<Clock::time_point> _lastRequestTime;
};

} // namespace toolmesh
