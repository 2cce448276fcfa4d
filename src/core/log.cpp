/// @file src/core/log.cpp
/// @brief Logger sink: level state, UTC stamp, mutex-guarded stderr writes.

#include "adsim/log.hpp"
#include "adsim/temporal.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>

namespace adsim::log {

namespace {

std::atomic<Level> g_level{Level::Info};

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

/// ASCII case-insensitive equality, no allocation.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x))
            == std::tolower(static_cast<unsigned char>(y));
    });
}

}  // namespace

void set_level(Level lvl) noexcept {
    g_level.store(lvl, std::memory_order_relaxed);
}

Level level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl) noexcept {
    const Level current = level();
    return current != Level::Off && lvl != Level::Off
        && static_cast<int>(lvl) >= static_cast<int>(current);
}

std::optional<Level> parse_level(std::string_view text) noexcept {
    if (iequals(text, "debug"))                            return Level::Debug;
    if (iequals(text, "info"))                             return Level::Info;
    if (iequals(text, "warn") || iequals(text, "warning")) return Level::Warn;
    if (iequals(text, "error"))                            return Level::Error;
    if (iequals(text, "off") || iequals(text, "none"))     return Level::Off;
    return std::nullopt;
}

std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off:   return "OFF";
    }
    return "?";
}

void write(Level lvl, std::string_view component, std::string_view message) {
    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    const std::string stamp = temporal::format_timestamp(now);

    std::lock_guard<std::mutex> guard(sink_mutex());
    fmt::print(stderr, "{} {} {} - {}\n", stamp, to_string(lvl), component, message);
    std::fflush(stderr);
}

}  // namespace adsim::log
