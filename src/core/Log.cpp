// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <atomic>
#include <chrono>
#include <mutex>
#include <print>
#include <string>

namespace toolmesh::log
{

namespace
{
    struct Sink
    {
        std::atomic<Level> level { Level::Info };
        std::mutex mutex;
        LogCallback callback;
    };

    auto sink() -> Sink&
    {
        static auto instance = Sink {};
        return instance;
    }

    constexpr auto LevelNames = std::array<std::string_view, 5> { "ERROR", "WARN", "INFO", "DEBUG", "TRACE" };
} // namespace

void setCallback(LogCallback callback)
{
    auto& s = sink();
    auto lock = std::lock_guard(s.mutex);
    s.callback = std::move(callback);
}

void setLevel(Level level)
{
    sink().level.store(level, std::memory_order_relaxed);
}

auto getLevel() -> Level
{
    return sink().level.load(std::memory_order_relaxed);
}

auto levelName(Level level) -> std::string_view
{
    auto const index = static_cast<std::size_t>(level);
    return index < LevelNames.size() ? LevelNames[index] : "?????";
}

auto levelFromString(std::string_view name, Level fallback) -> Level
{
    if (name == "warning")
        return Level::Warning;

    for (auto i = std::size_t { 0 }; i < LevelNames.size(); ++i)
    {
        auto lowered = std::string(LevelNames[i]);
        std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == name)
            return static_cast<Level>(i);
    }
    return fallback;
}

void write(Level level, std::string_view message)
{
    if (!isEnabled(level))
        return;

    auto& s = sink();
    auto callback = LogCallback {};
    {
        auto lock = std::lock_guard(s.mutex);
        callback = s.callback;
    }

    // Invoked unlocked so that a callback may log itself.
    if (callback)
    {
        callback(level, message);
        return;
    }

    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    auto lock = std::lock_guard(s.mutex);
    std::println(stderr, "{:%H:%M:%S} [{:<5}] {}", now, levelName(level), message);
}

} // namespace toolmesh::log
