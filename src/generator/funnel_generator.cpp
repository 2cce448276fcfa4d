/// @file src/generator/funnel_generator.cpp
/// @brief FunnelGenerator — sampled raw counts for one campaign-hour.
///
/// Every draw is a separate statement: the operands of `*` are unsequenced,
/// so `rng.uniform(..) * rng.uniform(..)` would make the draw order
/// compiler-dependent.

#include "adsim/generator.hpp"
#include "adsim/derived.hpp"
#include "adsim/log.hpp"
#include "adsim/temporal.hpp"

#include <algorithm>
#include <cmath>

namespace adsim::generator {

namespace {

/// Round half away from zero to a non-negative count. Non-finite → 0.
[[nodiscard]] std::int64_t round_count(double x) noexcept {
    if (!std::isfinite(x) || x <= 0.0) return 0;
    return static_cast<std::int64_t>(std::llround(x));
}

/// Floor to a non-negative count. Non-finite → 0.
[[nodiscard]] std::int64_t floor_count(double x) noexcept {
    if (!std::isfinite(x) || x <= 0.0) return 0;
    return static_cast<std::int64_t>(std::floor(x));
}

[[nodiscard]] double as_double(std::int64_t v) noexcept {
    return static_cast<double>(v);
}

/// Lower bound on viewable impressions.
constexpr double VIEWABILITY_FLOOR = 0.90;

}  // namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

FunnelGenerator::FunnelGenerator(GeneratorConfig config)
    : config_(config)
{}

// ─── generate_hour ────────────────────────────────────────────────────────────

RawHourlyMetrics FunnelGenerator::generate_hour(CampaignId    campaign_id,
                                                HourTs        hour,
                                                double        factor,
                                                RandomStream& rng) const noexcept {
    const double f      = (std::isfinite(factor) && factor > 0.0) ? factor : 1.0;
    const double damped = std::min(constants::FACTOR_DAMPING_CAP, f);

    RawHourlyMetrics m;
    m.campaign_id = campaign_id;
    m.hour_ts     = hour;

    // ── 1. Impressions ────────────────────────────────────────────────────────
    const auto base_impressions = rng.uniform_int(1000, 10000);
    m.impressions = std::max<std::int64_t>(1, round_count(as_double(base_impressions) * f));
    const double imps = as_double(m.impressions);

    // ── 2. Clicks ─────────────────────────────────────────────────────────────
    const double base_ctr     = rng.uniform(0.001, 0.02);
    const double ctr_variance = rng.uniform(0.8, 1.2);
    const double click_rate   = std::clamp(base_ctr * ctr_variance * f,
                                           constants::CTR_MIN, constants::CTR_MAX);
    m.clicks = round_count(imps * click_rate);

    // ── 3. Video starts ───────────────────────────────────────────────────────
    const double base_start = rng.uniform(0.80, 0.95);
    const double start_rate = std::clamp(base_start * f,
                                         constants::VIDEO_START_RATE_MIN,
                                         constants::VIDEO_START_RATE_MAX);
    m.video_starts = round_count(imps * start_rate);
    const double starts = as_double(m.video_starts);

    // ── 4. Quartiles (successive min keeps the rates monotone) ───────────────
    const double q25_draw  = rng.uniform(0.70, 0.95);
    const double q50_draw  = rng.uniform(0.55, 0.90);
    const double q75_draw  = rng.uniform(0.40, 0.80);
    const double q100_draw = rng.uniform(0.25, 0.70);

    const double q25_rate  = std::clamp(q25_draw, 0.60, 0.98);
    const double q50_rate  = std::max(0.40, std::min(q25_rate, q50_draw));
    const double q75_rate  = std::max(0.25, std::min(q50_rate, q75_draw));
    const double q100_rate = std::max(0.10, std::min(q75_rate, q100_draw));

    m.video_q25  = round_count(starts * q25_rate);
    m.video_q50  = round_count(starts * q50_rate);
    m.video_q75  = round_count(starts * q75_rate);
    m.video_q100 = round_count(starts * q100_rate);

    // ── 5. Supply funnel ──────────────────────────────────────────────────────
    const double request_ratio  = rng.uniform(1.1, 1.8);
    const double response_ratio = rng.uniform(0.92, 1.04);
    const double eligible_ratio = rng.uniform(0.90, 0.99);
    const double won_ratio      = rng.uniform(0.90, 0.99);

    m.requests = round_count(imps * request_ratio);
    m.responses = floor_count(std::max(
        0.9 * as_double(m.requests) + 1.0,
        as_double(round_count(imps * response_ratio))));
    m.eligible_impressions = floor_count(std::max(
        0.8 * as_double(m.responses) + 1.0,
        as_double(round_count(imps * eligible_ratio))));
    m.auctions_won = std::min(
        m.eligible_impressions,
        floor_count(std::max(0.8 * as_double(m.eligible_impressions) + 1.0,
                             as_double(round_count(imps * won_ratio)))));

    // ── 6. Quality ────────────────────────────────────────────────────────────
    const double viewability = rng.uniform(0.90, 0.99);
    const double base_audio  = rng.uniform(0.35, 0.80);
    const double audio_bias  = temporal::is_evening(hour) ? 1.05 : 0.95;
    const double audibility  = std::clamp(base_audio * audio_bias,
                                          constants::AUDIBILITY_MIN,
                                          constants::AUDIBILITY_MAX);
    m.viewable_impressions = round_count(imps * viewability);
    m.audible_impressions  = round_count(imps * audibility);

    // ── 7. Engagement ─────────────────────────────────────────────────────────
    const double base_skip     = rng.uniform(0.10, 0.40);
    const double qr_rate       = rng.uniform(0.0003, 0.006);
    const double interact_rate = rng.uniform(0.001, 0.02);

    // Stronger hours skip less.
    const double skip_rate = std::clamp(base_skip * (2.0 - damped),
                                        constants::SKIP_RATE_MIN,
                                        constants::SKIP_RATE_MAX);
    m.skips                   = round_count(starts * skip_rate);
    m.qr_scans                = round_count(imps * qr_rate);
    m.interactive_engagements = round_count(imps * interact_rate);

    // ── 8. Spend ──────────────────────────────────────────────────────────────
    const auto   base_cpm   = rng.uniform_int(1200, 4500);
    const double cpm_jitter = rng.uniform(0.9, 1.1);
    const std::int64_t cpm_cents =
        round_count(as_double(base_cpm) * cpm_jitter * (0.95 + 0.1 * damped));
    m.spend         = m.impressions * cpm_cents / 1000;
    m.effective_cpm = m.spend * 1000 / m.impressions;

    // ── 9. Reliability ────────────────────────────────────────────────────────
    const double error_rate   = rng.uniform(0.0005, 0.004);
    const double timeout_rate = rng.uniform(0.0005, 0.003);
    m.error_count   = round_count(as_double(m.requests) * error_rate);
    m.timeout_count = round_count(as_double(m.requests) * timeout_rate);

    // ── 10. Audience ──────────────────────────────────────────────────────────
    const auto base_frequency = rng.uniform_int(1, 4);
    m.frequency = std::clamp(
        round_count(as_double(base_frequency) * (1.0 + 0.15 * std::max(0.0, f - 1.0))),
        constants::MIN_FREQUENCY, constants::MAX_FREQUENCY);
    m.reach = std::max<std::int64_t>(1, m.impressions / m.frequency);

    // ── 11. Audience mix (no draws) ───────────────────────────────────────────
    m.audience = audience_mix(hour);

    enforce_funnel_invariants(m);

    m.temporal = temporal::make_breakdown(hour);
    m.avg_watch_time_seconds = derived::avg_watch_time_seconds(m, config_.asset_seconds);

    if (config_.verbose) {
        log::debug("generator", "campaign={} hour={} factor={:.4f} imps={} clicks={} starts={}",
                   campaign_id, m.temporal.human_readable, f,
                   m.impressions, m.clicks, m.video_starts);
    }
    return m;
}

// ─── enforce_funnel_invariants ────────────────────────────────────────────────

void FunnelGenerator::enforce_funnel_invariants(RawHourlyMetrics& row) noexcept {
    const auto non_negative = [](std::int64_t& v) { v = std::max<std::int64_t>(0, v); };
    const auto cap = [](std::int64_t& v, std::int64_t ceiling) {
        v = std::clamp<std::int64_t>(v, 0, std::max<std::int64_t>(0, ceiling));
    };

    row.impressions = std::max<std::int64_t>(1, row.impressions);
    const std::int64_t imps = row.impressions;

    // Supply chain: each stage is a subset of the one before.
    non_negative(row.requests);
    cap(row.responses,            row.requests);
    cap(row.eligible_impressions, row.responses);
    cap(row.auctions_won,         row.eligible_impressions);

    // Quality and interactions are subsets of impressions.
    cap(row.viewable_impressions, imps);
    const auto view_floor = static_cast<std::int64_t>(
        std::ceil(VIEWABILITY_FLOOR * as_double(imps) - 1e-9));
    row.viewable_impressions = std::max(row.viewable_impressions, std::min(view_floor, imps));
    cap(row.audible_impressions,     imps);
    cap(row.clicks,                  imps);
    cap(row.qr_scans,                imps);
    cap(row.interactive_engagements, imps);

    // Video funnel: starts ≥ q25 ≥ q50 ≥ q75 ≥ q100 ≥ 0.
    cap(row.video_starts, imps);
    cap(row.video_q25,    row.video_starts);
    cap(row.video_q50,    row.video_q25);
    cap(row.video_q75,    row.video_q50);
    cap(row.video_q100,   row.video_q75);
    cap(row.skips,        row.video_starts);

    cap(row.error_count,   row.requests);
    cap(row.timeout_count, row.requests);

    non_negative(row.spend);
    non_negative(row.effective_cpm);

    row.frequency = std::clamp(row.frequency, constants::MIN_FREQUENCY, constants::MAX_FREQUENCY);
    row.reach     = std::max<std::int64_t>(1, imps / row.frequency);
}

}  // namespace adsim::generator
