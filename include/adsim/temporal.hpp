#pragma once

/// @file include/adsim/temporal.hpp
/// @brief Temporal Factor Engine — layered seasonality for hourly volumes.
///
/// # Module: Temporal Factor Engine
///
/// ## Responsibility
/// Compute a multiplicative scale factor for any hour of a campaign flight.
/// The factor is the product of four independent sub-factors:
///
///     factor = hourly_boost · dow_factor · ramp_factor · annual_factor
///
///   - Hour of day:  Gaussian uplift inside 09:00–17:00, peaking at 13:00
///                   (1 + 0.45·exp(−½((h−13)/2.5)²)); 1.0 elsewhere.
///   - Day of week:  Mon–Thu 1.00, Fri 0.97, Sat 0.88, Sun 0.92.
///   - Flight ramp:  logistic S-curve 0.85 + 0.30·σ(6(t−½)) over the elapsed
///                   fraction t, times 1 + 0.03·sin(2π·h_elapsed/168).
///   - Annual:       (cos(2π(doy−1)/365) + 1)/10 + 0.8.
///
/// ## Guarantees
/// - Pure functions: no RNG, no state, identical output for identical input
/// - All functions are noexcept
/// - factor() > 0 for every input
///
/// ## NOT Responsible For
/// - Drawing random counts (see generator.hpp)

#include "adsim/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adsim::temporal {

/// Static seasonality model.
class TemporalFactorEngine {
public:
    TemporalFactorEngine() = delete;

    /// Gaussian business-hour uplift. Returns 1.0 outside [9, 17].
    [[nodiscard]] static double hourly_boost(HourTs hour) noexcept;

    /// Day-of-week multiplier.
    [[nodiscard]] static double dow_factor(HourTs hour) noexcept;

    /// Logistic flight ramp times the weekly undulation.
    ///
    /// The elapsed fraction is clamped to [0, 1]; a flight shorter than one
    /// hour is treated as one hour long.
    [[nodiscard]] static double ramp_factor(HourTs flight_start,
                                            HourTs hour,
                                            HourTs flight_end) noexcept;

    /// Cosine over the 1-based day of year, in roughly [0.8, 1.0].
    [[nodiscard]] static double annual_factor(HourTs hour) noexcept;

    /// Combined factor: product of the four sub-factors.
    [[nodiscard]] static double factor(HourTs flight_start,
                                       HourTs hour,
                                       HourTs flight_end) noexcept;

    [[nodiscard]] static double factor(const TemporalContext& ctx) noexcept;
};

// ─── Calendar helpers ─────────────────────────────────────────────────────────

/// Truncate a timestamp to the start of its UTC hour.
[[nodiscard]] HourTs floor_hour(std::chrono::sys_seconds ts) noexcept;

/// Hour-aligned window of a flight: start date 00:00 through end date 23:00.
[[nodiscard]] HourWindow flight_window(const Flight& flight) noexcept;

/// Every hour from `first` to `last` inclusive. Empty if last < first.
[[nodiscard]] std::vector<HourTs> hours_between(HourTs first, HourTs last);

/// Hour of day in 0–23.
[[nodiscard]] int hour_of_day(HourTs hour) noexcept;

/// Day of week, Monday = 0 … Sunday = 6.
[[nodiscard]] int day_of_week(HourTs hour) noexcept;

/// 1-based day of year.
[[nodiscard]] int day_of_year(HourTs hour) noexcept;

/// True for hours in [18, 22].
[[nodiscard]] bool is_evening(HourTs hour) noexcept;

/// Calendar bucketing fields for one hour.
[[nodiscard]] TemporalBreakdown make_breakdown(HourTs hour);

/// "YYYY-MM-DD" for a calendar date.
[[nodiscard]] std::string format_date(Date date);

/// "YYYY-MM-DD HH:MM:SS" for a timestamp (UTC, no suffix).
[[nodiscard]] std::string format_timestamp(std::chrono::sys_seconds ts);

/// Parse "YYYY-MM-DD". Returns nullopt on malformed or invalid dates.
[[nodiscard]] std::optional<Date> parse_date(std::string_view text) noexcept;

/// Parse "YYYY-MM-DD HH:MM:SS". Returns nullopt on malformed input.
[[nodiscard]] std::optional<std::chrono::sys_seconds>
parse_timestamp(std::string_view text) noexcept;

} // namespace adsim::temporal
