/// @file tests/integration/test_full_pipeline.cpp
/// @brief End-to-end: settings → on-disk SQLite → orchestrator → reopen → verify.
///
/// These tests exercise the complete path:
///   Settings → SqliteStore (file) → HourlyOrchestrator →
///   TemporalFactorEngine + FunnelGenerator + DerivedCalculator →
///   atomic write → fresh connection reads the same rows

#include "adsim/config.hpp"
#include "adsim/derived.hpp"
#include "adsim/log.hpp"
#include "adsim/orchestrator.hpp"
#include "adsim/sqlite_store.hpp"
#include "adsim/temporal.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace adsim;
using namespace adsim::storage;
using namespace std::chrono;

namespace {

Date ymd(int y, unsigned m, unsigned d) {
    return sys_days{year{y} / month{m} / day{d}};
}

class FullPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        log::set_level(log::Level::Off);
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        db_path_ = ::testing::TempDir() + "adsim_" + info->name() + ".db";
        std::remove(db_path_.c_str());
    }

    void TearDown() override {
        std::remove(db_path_.c_str());
        log::set_level(log::Level::Info);
    }

    config::Settings settings(std::map<std::string, std::string> overrides = {}) const {
        overrides.emplace("ADSIM_DB_PATH", db_path_);
        overrides.emplace("ADSIM_LOG_LEVEL", "off");
        return config::Settings::from_lookup(
            [overrides](const char* name) -> std::optional<std::string> {
                const auto it = overrides.find(name);
                if (it == overrides.end()) return std::nullopt;
                return it->second;
            });
    }

    std::unique_ptr<SqliteStore> seeded_store(const config::Settings& s) const {
        auto store = SqliteStore::open(s.db_path, s.busy_timeout_ms);
        if (!store || !store->initialize_schema()) return nullptr;
        const bool ok = store->upsert_campaign(Campaign{.id = 11, .name = "Holiday"})
                     && store->upsert_flight(Flight{.campaign_id = 11,
                                                    .start_date  = ymd(2024, 11, 25),
                                                    .end_date    = ymd(2024, 12, 8)});
        if (!ok) return nullptr;
        return store;
    }

    std::string db_path_;
};

}  // namespace

TEST_F(FullPipelineTest, TwoWeekFlightPersistsAndReloads) {
    const auto s = settings();
    {
        auto store = seeded_store(s);
        ASSERT_NE(store, nullptr);
        HourlyOrchestrator orch(*store, OrchestratorConfig{
            .generator       = s.generator,
            .persist_derived = s.persist_derived,
        });
        ASSERT_EQ(orch.regenerate(11, 2024), std::optional<std::size_t>{14 * 24});
    }

    auto reopened = SqliteStore::open(s.db_path);
    ASSERT_NE(reopened, nullptr);
    const auto raw = reopened->load_raw_rows(11);
    const auto der = reopened->load_derived_rows(11);
    ASSERT_EQ(raw.size(), 14u * 24u);
    ASSERT_EQ(der.size(), raw.size());

    EXPECT_EQ(temporal::format_timestamp(raw.front().hour_ts), "2024-11-25 00:00:00");
    EXPECT_EQ(temporal::format_timestamp(raw.back().hour_ts), "2024-12-08 23:00:00");

    for (std::size_t i = 0; i < raw.size(); ++i) {
        const auto& r = raw[i];
        ASSERT_GE(r.video_q25, r.video_q50);
        ASSERT_GE(r.video_q50, r.video_q75);
        ASSERT_GE(r.video_q75, r.video_q100);
        ASSERT_LE(r.clicks, r.impressions);
        ASSERT_TRUE(derived::DerivedCalculator::rates_bounded(der[i]));
        ASSERT_TRUE(derived::DerivedCalculator::approx_equal(
            derived::DerivedCalculator::compute(r, s.generator.asset_seconds), der[i]));
    }

    // Monthly bucket switches on December 1st.
    EXPECT_EQ(raw.front().temporal.monthly_start_day_date, ymd(2024, 11, 1));
    EXPECT_EQ(raw.back().temporal.monthly_start_day_date, ymd(2024, 12, 1));
}

TEST_F(FullPipelineTest, BusinessHoursOutdrawNightsOnAverage) {
    const auto s = settings();
    auto store = seeded_store(s);
    ASSERT_NE(store, nullptr);
    HourlyOrchestrator orch(*store);
    ASSERT_TRUE(orch.regenerate(11, 7).has_value());

    double business = 0.0, night = 0.0;
    int n_business = 0, n_night = 0;
    for (const auto& r : store->load_raw_rows(11)) {
        if (r.temporal.is_business_hour) {
            business += static_cast<double>(r.impressions);
            ++n_business;
        } else if (r.temporal.hour_of_day < 6) {
            night += static_cast<double>(r.impressions);
            ++n_night;
        }
    }
    ASSERT_GT(n_business, 0);
    ASSERT_GT(n_night, 0);
    EXPECT_GT(business / n_business, night / n_night);
}

TEST_F(FullPipelineTest, DerivedPersistenceCanBeDisabled) {
    const auto s = settings({{"ADSIM_PERSIST_DERIVED", "0"}});
    ASSERT_FALSE(s.persist_derived);
    auto store = seeded_store(s);
    ASSERT_NE(store, nullptr);

    HourlyOrchestrator orch(*store, OrchestratorConfig{
        .generator       = s.generator,
        .persist_derived = s.persist_derived,
    });
    ASSERT_EQ(orch.regenerate(11, 1), std::optional<std::size_t>{14 * 24});
    EXPECT_EQ(store->count_derived_rows(11), std::optional<std::size_t>{0});
}

TEST_F(FullPipelineTest, SameSeedAcrossConnectionsIsReproducible) {
    const auto s = settings();
    std::vector<RawHourlyMetrics> first;
    {
        auto store = seeded_store(s);
        ASSERT_NE(store, nullptr);
        HourlyOrchestrator orch(*store);
        ASSERT_TRUE(orch.regenerate(11, 99).has_value());
        first = store->load_raw_rows(11);
    }
    auto store = SqliteStore::open(s.db_path);
    ASSERT_NE(store, nullptr);
    HourlyOrchestrator orch(*store);
    ASSERT_TRUE(orch.regenerate(11, 99).has_value());
    const auto second = store->load_raw_rows(11);

    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].impressions, second[i].impressions);
        EXPECT_EQ(first[i].spend, second[i].spend);
    }
}
