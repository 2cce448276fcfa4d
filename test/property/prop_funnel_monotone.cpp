/**
 * @file  prop_funnel_monotone.cpp
 * @brief Property: ∀ seed, factor, hour: generated rows respect the funnel
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_funnel_monotone
 *
 * Invariants checked on every generated hour:
 *   requests ≥ responses ≥ eligible ≥ auctions_won ≥ 0
 *   video_starts ≥ q25 ≥ q50 ≥ q75 ≥ q100 ≥ 0
 *   clicks, video_starts, reach, viewable, audible ≤ impressions
 *   1 ≤ frequency ≤ 5
 *
 * The factor range deliberately includes 0, negatives and huge values:
 * the generator must clamp rather than produce an inverted funnel.
 */

#include <rapidcheck.h>

#include "adsim/generator.hpp"

#include <chrono>
#include <cstdint>

using namespace adsim;
using namespace adsim::generator;

namespace {

HourTs hour_from_offset(std::uint32_t offset) {
    // Any hour of 2020-2029.
    const auto base = std::chrono::sys_days{std::chrono::year{2020} / 1 / 1};
    return std::chrono::sys_seconds{base} + std::chrono::hours{offset % (10 * 8766)};
}

}  // namespace

int main() {
    bool ok = true;

    // ── Property 1: generated rows are funnel-consistent ─────────────────────
    ok &= rc::check(
        "funnel_monotone: every stage is bounded by its parent",
        [](std::uint64_t seed, std::uint32_t offset) {
            const double factor = *rc::gen::inRange(-200, 400) / 100.0;
            FunnelGenerator gen;
            RandomStream rng(seed);
            const auto r = gen.generate_hour(1, hour_from_offset(offset), factor, rng);

            RC_ASSERT(r.impressions >= 1);
            RC_ASSERT(r.requests >= r.responses);
            RC_ASSERT(r.responses >= r.eligible_impressions);
            RC_ASSERT(r.eligible_impressions >= r.auctions_won);
            RC_ASSERT(r.auctions_won >= 0);

            RC_ASSERT(r.video_starts >= r.video_q25);
            RC_ASSERT(r.video_q25 >= r.video_q50);
            RC_ASSERT(r.video_q50 >= r.video_q75);
            RC_ASSERT(r.video_q75 >= r.video_q100);
            RC_ASSERT(r.video_q100 >= 0);

            RC_ASSERT(r.clicks <= r.impressions);
            RC_ASSERT(r.video_starts <= r.impressions);
            RC_ASSERT(r.reach <= r.impressions);
            RC_ASSERT(r.viewable_impressions <= r.impressions);
            RC_ASSERT(r.audible_impressions <= r.impressions);

            RC_ASSERT(r.frequency >= 1);
            RC_ASSERT(r.frequency <= 5);
        }
    );

    // ── Property 2: enforcement repairs arbitrary rows ───────────────────────
    ok &= rc::check(
        "funnel_monotone: enforce_funnel_invariants is idempotent",
        [](std::int32_t imps, std::int32_t starts, std::int32_t q25,
           std::int32_t q50, std::int32_t q75, std::int32_t q100) {
            RawHourlyMetrics r;
            r.impressions  = imps;
            r.video_starts = starts;
            r.video_q25    = q25;
            r.video_q50    = q50;
            r.video_q75    = q75;
            r.video_q100   = q100;

            FunnelGenerator::enforce_funnel_invariants(r);
            RC_ASSERT(r.video_starts >= r.video_q25);
            RC_ASSERT(r.video_q75 >= r.video_q100);
            RC_ASSERT(r.video_q100 >= 0);

            const RawHourlyMetrics once = r;
            FunnelGenerator::enforce_funnel_invariants(r);
            RC_ASSERT(r.impressions == once.impressions);
            RC_ASSERT(r.video_q25 == once.video_q25);
            RC_ASSERT(r.video_q100 == once.video_q100);
            RC_ASSERT(r.viewable_impressions == once.viewable_impressions);
            RC_ASSERT(r.reach == once.reach);
        }
    );

    // ── Property 3: same seed, same row ──────────────────────────────────────
    ok &= rc::check(
        "funnel_monotone: generation is a pure function of the seed",
        [](std::uint64_t seed, std::uint32_t offset) {
            FunnelGenerator gen;
            RandomStream a(seed);
            RandomStream b(seed);
            const HourTs h = hour_from_offset(offset);
            const auto ra = gen.generate_hour(3, h, 1.1, a);
            const auto rb = gen.generate_hour(3, h, 1.1, b);
            RC_ASSERT(ra.impressions == rb.impressions);
            RC_ASSERT(ra.spend == rb.spend);
            RC_ASSERT(ra.video_q100 == rb.video_q100);
        }
    );

    return ok ? 0 : 1;
}
