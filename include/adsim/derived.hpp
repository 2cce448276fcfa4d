#pragma once

/// @file include/adsim/derived.hpp
/// @brief Derived Metrics Calculator — rates computed from raw counts.
///
/// # Module: Derived Metrics
///
/// ## Responsibility
/// Turn a RawHourlyMetrics row into bounded ratios. Every ratio goes through
/// `safe_div`, so degenerate rows (zero impressions, zero requests, zero
/// starts) produce 0.0 rather than NaN or an error.
///
/// ## Canonical Mapping
///   ctr                      = clicks                  / impressions
///   fill_rate                = eligible_impressions    / requests
///   auction_win_rate         = auctions_won            / eligible_impressions
///   response_rate            = responses               / requests
///   viewability_rate         = viewable_impressions    / impressions
///   render_rate              = viewability_rate
///   audibility_rate          = audible_impressions     / impressions
///   video_start_rate         = video_starts            / impressions
///   video_completion_rate    = video_q100              / video_starts
///   video_skip_rate          = skips                   / video_starts
///   qr_scan_rate             = qr_scans                / impressions
///   interactive_rate         = interactive_engagements / impressions
///   error_rate               = error_count             / requests
///   timeout_rate             = timeout_count           / requests
///   supply_funnel_efficiency = eligible_impressions    / requests
///
/// ## Average Watch Time
/// Viewers are bucketed by the last quartile they reached; each bucket is
/// credited with the midpoint of its segment of the asset:
///
///     segment         viewers        credited at
///     0–25 %          starts − q25   12.5 %
///     25–50 %         q25 − q50      37.5 %
///     50–75 %         q50 − q75      62.5 %
///     75–100 %        q75 − q100     87.5 %
///     complete        q100           100 %
///
///     avg = Σ(viewers × credited) / starts     (0 when starts = 0)
///
/// ## Guarantees
/// - Pure and noexcept; recomputing from persisted raw fields reproduces the
///   eagerly computed values exactly
/// - Never returns NaN or ±Inf for finite inputs

#include "adsim/constants.hpp"
#include "adsim/types.hpp"

namespace adsim::derived {

/// n / d when d > 0, otherwise `fallback`.
[[nodiscard]] double safe_div(double n, double d, double fallback = 0.0) noexcept;

/// Quartile-weighted average seconds watched per start.
[[nodiscard]] double avg_watch_time_seconds(
    const RawHourlyMetrics& raw,
    double asset_seconds = constants::DEFAULT_ASSET_SECONDS) noexcept;

/// Stateless calculator for the derived projection of a raw row.
class DerivedCalculator {
public:
    DerivedCalculator() = delete;

    /// Compute every derived field for one row.
    [[nodiscard]] static DerivedHourlyMetrics
    compute(const RawHourlyMetrics& raw,
            double asset_seconds = constants::DEFAULT_ASSET_SECONDS) noexcept;

    /// True if every rate field lies in [0, 1] and watch time is finite and
    /// non-negative.
    [[nodiscard]] static bool rates_bounded(const DerivedHourlyMetrics& d) noexcept;

    /// True if every field of `a` matches `b` within `tolerance`.
    [[nodiscard]] static bool approx_equal(const DerivedHourlyMetrics& a,
                                           const DerivedHourlyMetrics& b,
                                           double tolerance = constants::DERIVED_TOLERANCE) noexcept;
};

} // namespace adsim::derived
