/**
 * @file  bench/bench_generator.cpp
 * @brief Google Benchmark suite for hourly generation and persistence.
 *
 * Benchmarks
 * ----------
 *   BM_TemporalFactor          — four sub-factors for one hour
 *   BM_GenerateHour            — one FunnelGenerator row (draws + clamps)
 *   BM_DerivedCompute          — one DerivedCalculator projection
 *   BM_GenerateFlight/<days>   — generate_rows for a flight, in memory
 *   BM_RegenerateSqlite/<days> — full regenerate into an in-memory database
 *
 * Build (CMake):
 *   cmake -DADSIM_BUILD_BENCH=ON ..
 *   cmake --build . --target bench_generator
 *   ./bench_generator --benchmark_format=json
 *
 * Custom counter "rows_per_sec" = generated hourly rows / second.
 */

#include "benchmark/benchmark.h"

#include "adsim/derived.hpp"
#include "adsim/generator.hpp"
#include "adsim/log.hpp"
#include "adsim/orchestrator.hpp"
#include "adsim/sqlite_store.hpp"
#include "adsim/temporal.hpp"

#include <chrono>

using namespace adsim;
using namespace std::chrono;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static Date day0() {
    return sys_days{year{2024} / 1 / 1};
}

static CampaignFlight flight_of(int days_long) {
    return CampaignFlight{
        .campaign = Campaign{.id = 1, .name = "bench"},
        .flight   = Flight{.campaign_id = 1,
                           .start_date  = day0(),
                           .end_date    = day0() + days{days_long - 1}},
    };
}

// ── Per-hour kernels ───────────────────────────────────────────────────────────

static void BM_TemporalFactor(benchmark::State& state) {
    const HourTs start = sys_seconds{day0()};
    const HourTs end   = start + hours{24 * 30 - 1};
    HourTs h = start;
    for (auto _ : state) {
        benchmark::DoNotOptimize(temporal::TemporalFactorEngine::factor(start, h, end));
        h += hours{1};
        if (h > end) h = start;
    }
}
BENCHMARK(BM_TemporalFactor);

static void BM_GenerateHour(benchmark::State& state) {
    generator::FunnelGenerator gen;
    RandomStream rng(42);
    const HourTs hour = sys_seconds{day0()} + hours{13};
    for (auto _ : state) {
        auto row = gen.generate_hour(1, hour, 1.2, rng);
        benchmark::DoNotOptimize(row);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GenerateHour);

static void BM_DerivedCompute(benchmark::State& state) {
    generator::FunnelGenerator gen;
    RandomStream rng(42);
    const auto raw = gen.generate_hour(1, sys_seconds{day0()}, 1.0, rng);
    for (auto _ : state) {
        benchmark::DoNotOptimize(derived::DerivedCalculator::compute(raw));
    }
}
BENCHMARK(BM_DerivedCompute);

// ── Whole flights ──────────────────────────────────────────────────────────────

/// Never written to; generate_rows touches no storage.
class NullStore final : public storage::MetricsStore {
public:
    std::optional<CampaignFlight> find_campaign_flight(CampaignId) override { return {}; }
    bool write_hourly_rows(CampaignId, std::span<const HourlyRow>, bool, bool) override {
        return true;
    }
    std::vector<RawHourlyMetrics> load_raw_rows(CampaignId) override { return {}; }
    std::vector<DerivedHourlyMetrics> load_derived_rows(CampaignId) override { return {}; }
    std::optional<storage::StorageError> last_error() const override { return {}; }
};

static void BM_GenerateFlight(benchmark::State& state) {
    NullStore store;
    HourlyOrchestrator orch(store);
    const auto cf = flight_of(static_cast<int>(state.range(0)));
    std::size_t rows = 0;
    for (auto _ : state) {
        auto out = orch.generate_rows(cf, 42);
        rows += out.size();
        benchmark::DoNotOptimize(out);
    }
    state.counters["rows_per_sec"] =
        benchmark::Counter(static_cast<double>(rows), benchmark::Counter::kIsRate);
}
BENCHMARK(BM_GenerateFlight)->Arg(1)->Arg(30)->Arg(365);

static void BM_RegenerateSqlite(benchmark::State& state) {
    log::set_level(log::Level::Warn);
    auto store = storage::SqliteStore::open(":memory:");
    const auto cf = flight_of(static_cast<int>(state.range(0)));
    if (!store || !store->initialize_schema()
        || !store->upsert_campaign(cf.campaign) || !store->upsert_flight(cf.flight)) {
        state.SkipWithError("cannot prepare in-memory database");
        return;
    }

    HourlyOrchestrator orch(*store);
    std::size_t rows = 0;
    for (auto _ : state) {
        const auto n = orch.regenerate(1, 42);
        if (!n) {
            state.SkipWithError("regenerate failed");
            break;
        }
        rows += *n;
    }
    state.counters["rows_per_sec"] =
        benchmark::Counter(static_cast<double>(rows), benchmark::Counter::kIsRate);
}
BENCHMARK(BM_RegenerateSqlite)->Arg(1)->Arg(30)->Unit(benchmark::kMillisecond);
