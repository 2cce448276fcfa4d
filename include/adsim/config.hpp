#pragma once

/// @file include/adsim/config.hpp
/// @brief Runtime settings read from the environment.
///
/// | Variable                | Field             | Default    |
/// |-------------------------|-------------------|------------|
/// | ADSIM_DB_PATH           | db_path           | ./ads.db   |
/// | ADSIM_LOG_LEVEL         | log_level         | info       |
/// | ADSIM_PERSIST_DERIVED   | persist_derived   | 1          |
/// | ADSIM_BUSY_TIMEOUT_MS   | busy_timeout_ms   | 5000       |
/// | ADSIM_ASSET_SECONDS     | generator.asset_seconds | 30   |
///
/// Unparsable values keep the default and are reported with a warning.

#include "adsim/generator.hpp"
#include "adsim/log.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace adsim::config {

struct Settings {
    /// SQLite database file (":memory:" for a private in-memory database).
    std::string db_path = "./ads.db";

    log::Level log_level = log::Level::Info;

    /// Also write the derived-rate projection table on regeneration.
    bool persist_derived = true;

    /// How long a writer waits on a locked database before failing.
    int busy_timeout_ms = 5000;

    generator::GeneratorConfig generator{};

    /// Build settings from the process environment.
    [[nodiscard]] static Settings from_env();

    /// Build settings from an arbitrary lookup (used by tests).
    using Lookup = std::function<std::optional<std::string>(const char*)>;
    [[nodiscard]] static Settings from_lookup(const Lookup& lookup);
};

/// Parse "1/0", "true/false", "yes/no", "on/off" (any case).
[[nodiscard]] std::optional<bool> parse_bool(std::string_view text) noexcept;

} // namespace adsim::config
