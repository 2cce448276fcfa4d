/// @file src/derived/derived_metrics.cpp
/// @brief DerivedCalculator — safe-division rates and average watch time.

#include "adsim/derived.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace adsim::derived {

namespace {

[[nodiscard]] double as_double(std::int64_t v) noexcept {
    return static_cast<double>(v);
}

/// Rate fields in declaration order, for the bulk checks below.
[[nodiscard]] std::array<double, 15> rate_fields(const DerivedHourlyMetrics& d) noexcept {
    return {
        d.ctr, d.render_rate, d.viewability_rate, d.fill_rate, d.response_rate,
        d.auction_win_rate, d.audibility_rate, d.video_start_rate,
        d.video_completion_rate, d.video_skip_rate, d.qr_scan_rate,
        d.interactive_rate, d.error_rate, d.timeout_rate, d.supply_funnel_efficiency,
    };
}

}  // namespace

// ─── safe_div ─────────────────────────────────────────────────────────────────

double safe_div(double n, double d, double fallback) noexcept {
    if (!(d > 0.0) || !std::isfinite(n) || !std::isfinite(d)) {
        return fallback;
    }
    return n / d;
}

// ─── avg_watch_time_seconds ───────────────────────────────────────────────────

double avg_watch_time_seconds(const RawHourlyMetrics& raw, double asset_seconds) noexcept {
    if (raw.video_starts <= 0 || !(asset_seconds > 0.0)) {
        return 0.0;
    }

    const auto seg = [](std::int64_t hi, std::int64_t lo) {
        return as_double(std::max<std::int64_t>(0, hi - lo));
    };

    const double total_watch =
          seg(raw.video_starts, raw.video_q25) * (asset_seconds * 0.125)
        + seg(raw.video_q25,    raw.video_q50) * (asset_seconds * 0.375)
        + seg(raw.video_q50,    raw.video_q75) * (asset_seconds * 0.625)
        + seg(raw.video_q75,    raw.video_q100) * (asset_seconds * 0.875)
        + as_double(std::max<std::int64_t>(0, raw.video_q100)) * asset_seconds;

    return safe_div(total_watch, as_double(raw.video_starts));
}

// ─── DerivedCalculator::compute ───────────────────────────────────────────────

DerivedHourlyMetrics DerivedCalculator::compute(const RawHourlyMetrics& raw,
                                                double asset_seconds) noexcept {
    const double imps     = as_double(raw.impressions);
    const double requests = as_double(raw.requests);
    const double eligible = as_double(raw.eligible_impressions);
    const double starts   = as_double(raw.video_starts);

    DerivedHourlyMetrics d;
    d.campaign_id = raw.campaign_id;
    d.hour_ts     = raw.hour_ts;

    d.ctr                      = safe_div(as_double(raw.clicks), imps);
    d.viewability_rate         = safe_div(as_double(raw.viewable_impressions), imps);
    d.render_rate              = d.viewability_rate;
    d.fill_rate                = safe_div(eligible, requests);
    d.response_rate            = safe_div(as_double(raw.responses), requests);
    d.auction_win_rate         = safe_div(as_double(raw.auctions_won), eligible);
    d.audibility_rate          = safe_div(as_double(raw.audible_impressions), imps);
    d.video_start_rate         = safe_div(starts, imps);
    d.video_completion_rate    = safe_div(as_double(raw.video_q100), starts);
    d.video_skip_rate          = safe_div(as_double(raw.skips), starts);
    d.qr_scan_rate             = safe_div(as_double(raw.qr_scans), imps);
    d.interactive_rate         = safe_div(as_double(raw.interactive_engagements), imps);
    d.error_rate               = safe_div(as_double(raw.error_count), requests);
    d.timeout_rate             = safe_div(as_double(raw.timeout_count), requests);
    d.supply_funnel_efficiency = safe_div(eligible, requests);
    d.avg_watch_time_seconds   = avg_watch_time_seconds(raw, asset_seconds);
    return d;
}

// ─── DerivedCalculator::rates_bounded ─────────────────────────────────────────

bool DerivedCalculator::rates_bounded(const DerivedHourlyMetrics& d) noexcept {
    const auto rates = rate_fields(d);
    const bool in_unit = std::all_of(rates.begin(), rates.end(), [](double r) {
        return std::isfinite(r) && r >= 0.0 && r <= 1.0;
    });
    return in_unit
        && std::isfinite(d.avg_watch_time_seconds)
        && d.avg_watch_time_seconds >= 0.0;
}

// ─── DerivedCalculator::approx_equal ──────────────────────────────────────────

bool DerivedCalculator::approx_equal(const DerivedHourlyMetrics& a,
                                     const DerivedHourlyMetrics& b,
                                     double tolerance) noexcept {
    if (a.campaign_id != b.campaign_id || a.hour_ts != b.hour_ts) {
        return false;
    }
    const auto ra = rate_fields(a);
    const auto rb = rate_fields(b);
    for (std::size_t i = 0; i < ra.size(); ++i) {
        if (std::abs(ra[i] - rb[i]) > tolerance) return false;
    }
    return std::abs(a.avg_watch_time_seconds - b.avg_watch_time_seconds) <= tolerance;
}

}  // namespace adsim::derived
