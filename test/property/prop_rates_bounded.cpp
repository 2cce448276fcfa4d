/**
 * @file  prop_rates_bounded.cpp
 * @brief Property: ∀ raw rows: every derived rate ∈ [0, 1], never NaN
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_rates_bounded
 *
 * Two populations are tested:
 *   • rows straight from the generator (funnel-consistent by construction)
 *   • arbitrary non-negative rows after enforce_funnel_invariants, including
 *     all-zero rows where every denominator vanishes
 *
 * Watch time must stay within [0, asset_seconds].
 */

#include <rapidcheck.h>

#include "adsim/derived.hpp"
#include "adsim/generator.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>

using namespace adsim;
using namespace adsim::derived;

int main() {
    bool ok = true;

    // ── Property 1: generated rows → bounded rates ───────────────────────────
    ok &= rc::check(
        "rates_bounded: generator output yields rates in [0, 1]",
        [](std::uint64_t seed, std::uint16_t hour_offset) {
            const double factor = *rc::gen::inRange(50, 200) / 100.0;
            generator::FunnelGenerator gen;
            RandomStream rng(seed);
            const HourTs h = std::chrono::sys_seconds{
                std::chrono::sys_days{std::chrono::year{2024} / 1 / 1}}
                + std::chrono::hours{hour_offset};
            const auto raw = gen.generate_hour(1, h, factor, rng);
            const auto d   = DerivedCalculator::compute(raw);

            RC_ASSERT(DerivedCalculator::rates_bounded(d));
            RC_ASSERT(d.avg_watch_time_seconds <= constants::DEFAULT_ASSET_SECONDS + 1e-9);
        }
    );

    // ── Property 2: arbitrary repaired rows → bounded rates ──────────────────
    ok &= rc::check(
        "rates_bounded: repaired arbitrary rows yield rates in [0, 1]",
        [](std::uint16_t imps, std::uint16_t requests, std::uint16_t clicks,
           std::uint16_t starts, std::uint16_t q100, std::uint16_t errors) {
            RawHourlyMetrics raw;
            raw.impressions  = imps;
            raw.requests     = requests;
            raw.responses    = requests;
            raw.clicks       = clicks;
            raw.video_starts = starts;
            raw.video_q25    = q100;
            raw.video_q50    = q100;
            raw.video_q75    = q100;
            raw.video_q100   = q100;
            raw.error_count  = errors;
            generator::FunnelGenerator::enforce_funnel_invariants(raw);

            const auto d = DerivedCalculator::compute(raw);
            RC_ASSERT(DerivedCalculator::rates_bounded(d));
        }
    );

    // ── Property 3: safe_div never leaks NaN or Inf ──────────────────────────
    ok &= rc::check(
        "rates_bounded: safe_div is finite for finite numerators",
        [](double n, double d) {
            RC_PRE(std::isfinite(n));
            const double q = safe_div(n, d);
            RC_ASSERT(!std::isnan(q));
            if (!(d > 0.0)) {
                RC_ASSERT(q == 0.0);
            }
        }
    );

    return ok ? 0 : 1;
}
