/// @file src/orchestrator/orchestrator.cpp
/// @brief Hourly Orchestrator — lookup, generate, atomic write.

#include "adsim/orchestrator.hpp"
#include "adsim/derived.hpp"
#include "adsim/log.hpp"
#include "adsim/temporal.hpp"

namespace adsim {

namespace {
constexpr std::string_view kComponent = "orchestrator";
}

// ─── Constructor ──────────────────────────────────────────────────────────────

HourlyOrchestrator::HourlyOrchestrator(storage::MetricsStore& store,
                                       OrchestratorConfig     config)
    : store_(store)
    , config_(std::move(config))
    , generator_(config_.generator)
{}

// ─── generate_rows ────────────────────────────────────────────────────────────

std::vector<HourlyRow>
HourlyOrchestrator::generate_rows(const CampaignFlight& cf, RandomStream& rng) const {
    const HourWindow window = temporal::flight_window(cf.flight);
    const auto hours = temporal::hours_between(window.first_hour, window.last_hour);

    std::vector<HourlyRow> rows;
    rows.reserve(hours.size());

    for (const HourTs hour : hours) {
        const double factor = temporal::TemporalFactorEngine::factor(
            window.first_hour, hour, window.last_hour);

        HourlyRow row;
        row.raw     = generator_.generate_hour(cf.campaign.id, hour, factor, rng);
        row.derived = derived::DerivedCalculator::compute(row.raw,
                                                          config_.generator.asset_seconds);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<HourlyRow>
HourlyOrchestrator::generate_rows(const CampaignFlight& cf, RandomStream::Seed seed) const {
    RandomStream rng(seed);
    return generate_rows(cf, rng);
}

// ─── run ──────────────────────────────────────────────────────────────────────

std::optional<RunSummary>
HourlyOrchestrator::run(CampaignId                        campaign_id,
                        std::optional<RandomStream::Seed> seed,
                        bool                              replace) {
    RandomStream rng(seed);
    RunSummary summary{.campaign_id = campaign_id, .seed = rng.seed(), .rows = 0};

    // ── Step 1: Resolve campaign + flight ─────────────────────────────────────
    const auto cf = store_.find_campaign_flight(campaign_id);
    if (!cf) {
        if (const auto err = store_.last_error()) {
            log::error(kComponent, "campaign {}: lookup failed: {}",
                       campaign_id, err->to_string());
            return std::nullopt;
        }
        log::warn(kComponent, "campaign {} or its flight not found", campaign_id);
        return summary;
    }

    // ── Step 2: Generate every hour in memory ─────────────────────────────────
    const auto rows = generate_rows(*cf, rng);

    // ── Step 3: Single atomic write ───────────────────────────────────────────
    if (!store_.write_hourly_rows(campaign_id, rows, replace, config_.persist_derived)) {
        const auto err = store_.last_error();
        log::error(kComponent, "campaign {}: write failed: {}", campaign_id,
                   err ? err->to_string() : std::string("unknown storage error"));
        return std::nullopt;
    }

    summary.rows = rows.size();
    log::info(kComponent, "campaign {} ({}): wrote {} hourly rows, seed {}",
              campaign_id, cf->campaign.name, summary.rows, summary.seed);
    return summary;
}

// ─── regenerate ───────────────────────────────────────────────────────────────

std::optional<std::size_t>
HourlyOrchestrator::regenerate(CampaignId                        campaign_id,
                               std::optional<RandomStream::Seed> seed,
                               bool                              replace) {
    const auto summary = run(campaign_id, seed, replace);
    if (!summary) {
        return std::nullopt;
    }
    return summary->rows;
}

} // namespace adsim
