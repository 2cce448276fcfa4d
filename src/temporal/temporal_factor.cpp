/// @file src/temporal/temporal_factor.cpp
/// @brief TemporalFactorEngine — seasonality sub-factors and their product.

#include "adsim/temporal.hpp"
#include "adsim/constants.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace adsim::temporal {

namespace {

/// Hours between two timestamps as a double (may be negative).
[[nodiscard]] double hours_from(HourTs from, HourTs to) noexcept {
    const auto secs = (to - from).count();
    return static_cast<double>(secs) / 3600.0;
}

[[nodiscard]] double sigmoid(double x) noexcept {
    return 1.0 / (1.0 + std::exp(-x));
}

}  // namespace

// ─── hourly_boost ─────────────────────────────────────────────────────────────

double TemporalFactorEngine::hourly_boost(HourTs hour) noexcept {
    const int h = hour_of_day(hour);
    if (h < constants::BUSINESS_HOUR_FIRST || h > constants::BUSINESS_HOUR_LAST) {
        return 1.0;
    }
    const double x = (static_cast<double>(h) - constants::HOURLY_PEAK_HOUR)
                     / constants::HOURLY_PEAK_SIGMA;
    return 1.0 + constants::HOURLY_PEAK_GAIN * std::exp(-0.5 * x * x);
}

// ─── dow_factor ───────────────────────────────────────────────────────────────

double TemporalFactorEngine::dow_factor(HourTs hour) noexcept {
    switch (day_of_week(hour)) {
        case 4:  return constants::DOW_FRIDAY;
        case 5:  return constants::DOW_SATURDAY;
        case 6:  return constants::DOW_SUNDAY;
        default: return constants::DOW_WEEKDAY;
    }
}

// ─── ramp_factor ──────────────────────────────────────────────────────────────

double TemporalFactorEngine::ramp_factor(HourTs flight_start,
                                         HourTs hour,
                                         HourTs flight_end) noexcept {
    const double total_hours   = std::max(1.0, hours_from(flight_start, flight_end));
    const double elapsed_hours = hours_from(flight_start, hour);
    const double t = std::clamp(elapsed_hours / total_hours, 0.0, 1.0);

    // S-curve centred mid-flight, spanning [0.85, 1.15].
    const double ramp = constants::RAMP_FLOOR
                      + constants::RAMP_SPAN * sigmoid(constants::RAMP_STEEPNESS * (t - 0.5));

    const double weekly = 1.0 + constants::WEEKLY_AMPLITUDE
                              * std::sin(2.0 * std::numbers::pi * elapsed_hours
                                         / constants::WEEKLY_PERIOD_HOURS);
    return ramp * weekly;
}

// ─── annual_factor ────────────────────────────────────────────────────────────

double TemporalFactorEngine::annual_factor(HourTs hour) noexcept {
    const double doy = static_cast<double>(day_of_year(hour));
    const double x   = 2.0 * std::numbers::pi * (doy - 1.0) / constants::ANNUAL_PERIOD_DAYS;
    return (std::cos(x) + 1.0) * constants::ANNUAL_SCALE + constants::ANNUAL_FLOOR;
}

// ─── factor ───────────────────────────────────────────────────────────────────

double TemporalFactorEngine::factor(HourTs flight_start,
                                    HourTs hour,
                                    HourTs flight_end) noexcept {
    return hourly_boost(hour)
         * dow_factor(hour)
         * ramp_factor(flight_start, hour, flight_end)
         * annual_factor(hour);
}

double TemporalFactorEngine::factor(const TemporalContext& ctx) noexcept {
    return factor(ctx.flight_start, ctx.hour, ctx.flight_end);
}

}  // namespace adsim::temporal
