// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <string_view>
#include <utility>

namespace toolmesh::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives every message that passes the level filter.
/// @param level The log level of the message.
/// @param message The formatted log message text (without level prefix).
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes log messages to @p callback instead of stderr.
///
/// Messages come from whichever thread issues requests, so the callback may be invoked
/// concurrently and must synchronize its own state. It may log. Pass an empty callback to
/// revert to stderr.
void setCallback(LogCallback callback);

/// @brief Sets the maximum level that is emitted.
void setLevel(Level level);

/// @brief Returns the maximum level that is emitted.
[[nodiscard]] auto getLevel() -> Level;

/// @brief Returns true when messages of @p level pass the current filter.
[[nodiscard]] inline auto isEnabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Returns the upper-case name of a level ("ERROR", "WARN", ...).
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Parses a level name ("error", "warning", "info", "debug", "trace").
/// @param name The level name, case-sensitive.
/// @param fallback Returned for unknown names.
[[nodiscard]] auto levelFromString(std::string_view name, Level fallback = Level::Info) -> Level;

/// @brief Emits an already formatted message, subject to the level filter.
///
/// Goes to the installed callback if any, otherwise to stderr prefixed with a wall-clock
/// timestamp and the level name.
void write(Level level, std::string_view message);

/// @brief Installs a callback for the lifetime of the guard, restoring stderr output afterwards.
class ScopedCallback
{
  public:
    explicit ScopedCallback(LogCallback callback) { setCallback(std::move(callback)); }
    ~ScopedCallback() { setCallback({}); }

    ScopedCallback(const ScopedCallback&) = delete;
    ScopedCallback& operator=(const ScopedCallback&) = delete;
};

namespace detail
{
    template <typename... Args>
    void emit(Level level, std::format_string<Args...> fmt, Args&&... args)
    {
        // Skip formatting entirely for filtered messages.
        if (isEnabled(level))
            write(level, std::format(fmt, std::forward<Args>(args)...));
    }
} // namespace detail

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Error, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Warning, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    detail::emit(Level::Trace, fmt, std::forward<Args>(args)...);
}

} // namespace toolmesh::log
