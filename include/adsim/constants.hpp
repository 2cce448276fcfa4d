#pragma once

#include <cstdint>

/// @file include/adsim/constants.hpp
/// @brief Seasonality shape parameters and realistic metric ranges.

namespace adsim::constants {

// ─── Hour-of-Day Boost ────────────────────────────────────────────────────────

/// Business-hour window (inclusive) in which the Gaussian uplift applies.
static constexpr int BUSINESS_HOUR_FIRST = 9;
static constexpr int BUSINESS_HOUR_LAST  = 17;

static constexpr double HOURLY_PEAK_HOUR  = 13.0;
static constexpr double HOURLY_PEAK_SIGMA = 2.5;
static constexpr double HOURLY_PEAK_GAIN  = 0.45;

// ─── Day-of-Week ──────────────────────────────────────────────────────────────

static constexpr double DOW_WEEKDAY  = 1.00;
static constexpr double DOW_FRIDAY   = 0.97;
static constexpr double DOW_SATURDAY = 0.88;
static constexpr double DOW_SUNDAY   = 0.92;

// ─── Flight Ramp ──────────────────────────────────────────────────────────────

static constexpr double RAMP_FLOOR     = 0.85;
static constexpr double RAMP_SPAN      = 0.30;
static constexpr double RAMP_STEEPNESS = 6.0;

/// Weekly undulation: amplitude and period in hours.
static constexpr double WEEKLY_AMPLITUDE    = 0.03;
static constexpr double WEEKLY_PERIOD_HOURS = 168.0;

// ─── Annual Seasonality ───────────────────────────────────────────────────────

static constexpr double ANNUAL_PERIOD_DAYS = 365.0;
static constexpr double ANNUAL_FLOOR       = 0.8;
static constexpr double ANNUAL_SCALE       = 0.1;

// ─── Audience ─────────────────────────────────────────────────────────────────

/// Evening window (inclusive) used for audibility and audience weighting.
static constexpr int EVENING_FIRST_HOUR = 18;
static constexpr int EVENING_LAST_HOUR  = 22;

static constexpr std::int64_t MIN_FREQUENCY = 1;
static constexpr std::int64_t MAX_FREQUENCY = 5;

// ─── Rate Bounds ──────────────────────────────────────────────────────────────

static constexpr double CTR_MIN = 0.0001;
static constexpr double CTR_MAX = 0.05;

static constexpr double VIDEO_START_RATE_MIN = 0.70;
static constexpr double VIDEO_START_RATE_MAX = 0.99;

static constexpr double AUDIBILITY_MIN = 0.20;
static constexpr double AUDIBILITY_MAX = 0.95;

static constexpr double SKIP_RATE_MIN = 0.05;
static constexpr double SKIP_RATE_MAX = 0.60;

/// Factor ceiling used by the skip and CPM adjustments.
static constexpr double FACTOR_DAMPING_CAP = 1.5;

// ─── Video Asset ──────────────────────────────────────────────────────────────

/// Reference asset length for the average watch-time estimate.
static constexpr double DEFAULT_ASSET_SECONDS = 30.0;

/// Tolerance for comparing eagerly and lazily computed derived metrics.
static constexpr double DERIVED_TOLERANCE = 1e-6;

} // namespace adsim::constants
