#pragma once

/// @file include/adsim/log.hpp
/// @brief Level-gated single-line logger on top of {fmt}.
///
/// Lines go to stderr as
///
///     2024-01-01 13:00:05 INFO orchestrator - wrote 24 rows for campaign 7
///
/// A process-wide mutex keeps lines intact when several threads log.
/// Messages below the current level are not formatted.

#include <fmt/format.h>

#include <optional>
#include <string_view>
#include <utility>

namespace adsim::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;
[[nodiscard]] bool enabled(Level level) noexcept;

/// Accepts "debug", "info", "warn"/"warning", "error", "off" (any case).
[[nodiscard]] std::optional<Level> parse_level(std::string_view text) noexcept;

[[nodiscard]] std::string_view to_string(Level level) noexcept;

/// Write one preformatted line. Prefer the typed helpers below.
void write(Level level, std::string_view component, std::string_view message);

template <typename... Args>
void emit(Level lvl, std::string_view component,
          fmt::format_string<Args...> format, Args&&... args) {
    if (!enabled(lvl)) return;
    write(lvl, component, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::string_view component, fmt::format_string<Args...> format, Args&&... args) {
    emit(Level::Debug, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void info(std::string_view component, fmt::format_string<Args...> format, Args&&... args) {
    emit(Level::Info, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(std::string_view component, fmt::format_string<Args...> format, Args&&... args) {
    emit(Level::Warn, component, format, std::forward<Args>(args)...);
}

template <typename... Args>
void error(std::string_view component, fmt::format_string<Args...> format, Args&&... args) {
    emit(Level::Error, component, format, std::forward<Args>(args)...);
}

} // namespace adsim::log
