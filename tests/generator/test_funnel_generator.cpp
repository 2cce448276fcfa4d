/// @file tests/generator/test_funnel_generator.cpp
/// @brief FunnelGenerator: funnel invariants, determinism, degenerate factors,
///        audience mix.

#include "adsim/generator.hpp"
#include "adsim/derived.hpp"
#include "adsim/temporal.hpp"
#include "support/row_equality.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <limits>

using namespace adsim;
using namespace adsim::generator;
using namespace std::chrono;

namespace {

HourTs at(int y, unsigned m, unsigned d, int h) {
    return sys_seconds{sys_days{year{y} / month{m} / day{d}}} + hours{h};
}

void expect_funnel(const RawHourlyMetrics& r) {
    EXPECT_GE(r.impressions, 1);
    EXPECT_GE(r.requests, r.responses);
    EXPECT_GE(r.responses, r.eligible_impressions);
    EXPECT_GE(r.eligible_impressions, r.auctions_won);
    EXPECT_GE(r.auctions_won, 0);

    EXPECT_LE(r.viewable_impressions, r.impressions);
    EXPECT_LE(r.audible_impressions, r.impressions);
    EXPECT_LE(r.clicks, r.impressions);
    EXPECT_LE(r.qr_scans, r.impressions);
    EXPECT_LE(r.interactive_engagements, r.impressions);
    EXPECT_LE(r.reach, r.impressions);

    EXPECT_LE(r.video_starts, r.impressions);
    EXPECT_GE(r.video_starts, r.video_q25);
    EXPECT_GE(r.video_q25, r.video_q50);
    EXPECT_GE(r.video_q50, r.video_q75);
    EXPECT_GE(r.video_q75, r.video_q100);
    EXPECT_GE(r.video_q100, 0);
    EXPECT_LE(r.skips, r.video_starts);

    EXPECT_LE(r.error_count, r.requests);
    EXPECT_LE(r.timeout_count, r.requests);
    EXPECT_GE(r.spend, 0);

    EXPECT_GE(r.frequency, 1);
    EXPECT_LE(r.frequency, 5);
}

}  // namespace

TEST(FunnelGenerator, RowsSatisfyFunnel) {
    FunnelGenerator gen;
    RandomStream rng(42);
    const HourTs start = at(2024, 1, 1, 0);
    for (int h = 0; h < 24 * 14; ++h) {
        const HourTs hour = start + hours{h};
        const double f = temporal::TemporalFactorEngine::factor(start, hour, start + hours{24 * 14 - 1});
        const auto row = gen.generate_hour(5, hour, f, rng);
        SCOPED_TRACE(row.temporal.human_readable);
        expect_funnel(row);
        EXPECT_EQ(row.campaign_id, 5);
        EXPECT_EQ(row.hour_ts, hour);
    }
}

TEST(FunnelGenerator, DeterministicForSameSeed) {
    FunnelGenerator gen;
    RandomStream a(1234);
    RandomStream b(1234);
    const HourTs hour = at(2024, 2, 6, 13);
    for (int i = 0; i < 5; ++i) {
        const auto ra = gen.generate_hour(1, hour, 1.3, a);
        const auto rb = gen.generate_hour(1, hour, 1.3, b);
        adsim::test_support::expect_same_raw(ra, rb);
    }
    EXPECT_EQ(a.draws(), b.draws());
}

TEST(FunnelGenerator, NonFiniteFactorTreatedAsOne) {
    FunnelGenerator gen;
    const HourTs hour = at(2024, 2, 6, 3);

    RandomStream ref(9);
    const auto expected = gen.generate_hour(1, hour, 1.0, ref);

    for (double bad : {std::numeric_limits<double>::quiet_NaN(),
                       std::numeric_limits<double>::infinity(),
                       0.0, -2.0}) {
        RandomStream rng(9);
        const auto row = gen.generate_hour(1, hour, bad, rng);
        EXPECT_EQ(row.impressions, expected.impressions);
        EXPECT_EQ(row.clicks, expected.clicks);
        expect_funnel(row);
    }
}

TEST(FunnelGenerator, HigherFactorMoreImpressions) {
    FunnelGenerator gen;
    const HourTs hour = at(2024, 2, 6, 13);
    RandomStream lo(77);
    RandomStream hi(77);
    // Same base draw, different scale.
    EXPECT_LT(gen.generate_hour(1, hour, 0.8, lo).impressions,
              gen.generate_hour(1, hour, 1.6, hi).impressions);
}

TEST(FunnelGenerator, WatchTimeMatchesDerivedFormula) {
    GeneratorConfig cfg;
    cfg.asset_seconds = 15.0;
    FunnelGenerator gen(cfg);
    RandomStream rng(5);
    const auto row = gen.generate_hour(1, at(2024, 2, 6, 20), 1.1, rng);
    EXPECT_DOUBLE_EQ(row.avg_watch_time_seconds, derived::avg_watch_time_seconds(row, 15.0));
    EXPECT_GT(row.avg_watch_time_seconds, 0.0);
    EXPECT_LE(row.avg_watch_time_seconds, 15.0);
}

TEST(FunnelGenerator, BreakdownFilled) {
    FunnelGenerator gen;
    RandomStream rng(5);
    const auto row = gen.generate_hour(1, at(2024, 2, 6, 20), 1.0, rng);
    EXPECT_EQ(row.temporal.hour_of_day, 20);
    EXPECT_EQ(row.temporal.day_of_week, 1);
    EXPECT_FALSE(row.temporal.is_business_hour);
}

// ─── enforce_funnel_invariants ────────────────────────────────────────────────

TEST(EnforceFunnel, RepairsInvertedRow) {
    RawHourlyMetrics r;
    r.impressions          = 0;
    r.requests             = 10;
    r.responses            = 50;
    r.eligible_impressions = 60;
    r.auctions_won         = 70;
    r.clicks               = 9;
    r.video_starts         = 5;
    r.video_q25            = 2;
    r.video_q50            = 4;
    r.video_q75            = 8;
    r.video_q100           = 9;
    r.skips                = 100;
    r.error_count          = 30;
    r.spend                = -4;
    r.frequency            = 12;

    FunnelGenerator::enforce_funnel_invariants(r);
    expect_funnel(r);
    EXPECT_EQ(r.impressions, 1);
    EXPECT_EQ(r.responses, 10);
    EXPECT_EQ(r.video_q100, r.video_q75);
    EXPECT_EQ(r.frequency, 5);
    EXPECT_EQ(r.reach, 1);
    EXPECT_EQ(r.spend, 0);
}

TEST(EnforceFunnel, RaisesViewabilityToFloor) {
    RawHourlyMetrics r;
    r.impressions          = 1000;
    r.viewable_impressions = 10;
    FunnelGenerator::enforce_funnel_invariants(r);
    EXPECT_EQ(r.viewable_impressions, 900);
}

// ─── audience_mix ─────────────────────────────────────────────────────────────

TEST(AudienceMix, SharesSumToOne) {
    for (HourTs h : {at(2024, 2, 6, 10), at(2024, 2, 6, 20), at(2024, 2, 10, 10)}) {
        const auto mix = FunnelGenerator::audience_mix(h);
        EXPECT_NEAR(mix.device.sum(), 1.0, 1e-9);
        EXPECT_NEAR(mix.age.sum(), 1.0, 1e-9);
        EXPECT_NEAR(mix.gender.sum(), 1.0, 1e-9);
        EXPECT_NEAR(mix.life_stage.sum(), 1.0, 1e-9);
        EXPECT_NEAR(mix.interest.sum(), 1.0, 1e-9);
    }
}

TEST(AudienceMix, EveningLeansTowardCtv) {
    const auto day     = FunnelGenerator::audience_mix(at(2024, 2, 6, 10));
    const auto evening = FunnelGenerator::audience_mix(at(2024, 2, 6, 20));
    EXPECT_GT(evening.device(0), day.device(0));
    EXPECT_GT(evening.age(0), day.age(0));
}

TEST(AudienceMix, JsonGroupsSharesByLabel) {
    const auto mix  = FunnelGenerator::audience_mix(at(2024, 2, 6, 10));
    const auto json = nlohmann::json::parse(mix.to_json());

    ASSERT_TRUE(json.is_object());
    EXPECT_EQ(json.size(), 5u);
    EXPECT_EQ(json.at("device").size(), 3u);
    EXPECT_EQ(json.at("age").size(), 6u);
    EXPECT_EQ(json.at("gender").size(), 2u);
    EXPECT_EQ(json.at("life_stage").size(), 3u);
    EXPECT_EQ(json.at("interest").size(), 5u);

    EXPECT_NEAR(json.at("device").at("CTV").get<double>(), mix.device(0), 1e-4);
    EXPECT_NEAR(json.at("age").at("65+").get<double>(), mix.age(5), 1e-4);
    EXPECT_NEAR(json.at("interest").at("TRAVEL").get<double>(), mix.interest(4), 1e-4);

    for (const auto& [group, shares] : json.items()) {
        double total = 0.0;
        for (const auto& share : shares) {
            total += share.get<double>();
        }
        EXPECT_NEAR(total, 1.0, 1e-3) << group;
    }
}
