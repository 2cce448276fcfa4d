/// @file src/core/config.cpp
/// @brief Settings::from_env — environment overrides on top of defaults.

#include "adsim/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string_view>

namespace adsim::config {

namespace {

/// ASCII case-insensitive equality, no allocation.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x))
            == std::tolower(static_cast<unsigned char>(y));
    });
}

template <typename T>
[[nodiscard]] std::optional<T> parse_number(const std::string& text) noexcept {
    T value{};
    const char* first = text.data();
    const char* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

}  // namespace

std::optional<bool> parse_bool(std::string_view text) noexcept {
    for (std::string_view yes : {"1", "true", "yes", "on"}) {
        if (iequals(text, yes)) return true;
    }
    for (std::string_view no : {"0", "false", "no", "off"}) {
        if (iequals(text, no)) return false;
    }
    return std::nullopt;
}

Settings Settings::from_env() {
    return from_lookup([](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    });
}

Settings Settings::from_lookup(const Lookup& lookup) {
    Settings s;

    if (auto v = lookup("ADSIM_DB_PATH"); v && !v->empty()) {
        s.db_path = *v;
    }

    if (auto v = lookup("ADSIM_LOG_LEVEL")) {
        if (auto lvl = log::parse_level(*v)) {
            s.log_level = *lvl;
        } else {
            log::warn("config", "ignoring ADSIM_LOG_LEVEL='{}'", *v);
        }
    }

    if (auto v = lookup("ADSIM_PERSIST_DERIVED")) {
        if (auto b = parse_bool(*v)) {
            s.persist_derived = *b;
        } else {
            log::warn("config", "ignoring ADSIM_PERSIST_DERIVED='{}'", *v);
        }
    }

    if (auto v = lookup("ADSIM_BUSY_TIMEOUT_MS")) {
        if (auto ms = parse_number<int>(*v); ms && *ms >= 0) {
            s.busy_timeout_ms = *ms;
        } else {
            log::warn("config", "ignoring ADSIM_BUSY_TIMEOUT_MS='{}'", *v);
        }
    }

    if (auto v = lookup("ADSIM_ASSET_SECONDS")) {
        if (auto secs = parse_number<double>(*v); secs && std::isfinite(*secs) && *secs > 0.0) {
            s.generator.asset_seconds = *secs;
        } else {
            log::warn("config", "ignoring ADSIM_ASSET_SECONDS='{}'", *v);
        }
    }

    s.generator.verbose = s.log_level == log::Level::Debug;
    return s;
}

}  // namespace adsim::config
