#pragma once

/// @file include/adsim/orchestrator.hpp
/// @brief Hourly Orchestrator — regenerates a campaign's hourly rows.
///
/// # Module: Hourly Orchestrator
///
/// ## Responsibility
/// Drive the full pipeline for one campaign:
///   Store lookup → flight window → per hour (TemporalFactorEngine →
///   FunnelGenerator → DerivedCalculator) → one atomic Store write
///
/// ## Usage
/// ```cpp
/// auto store = storage::SqliteStore::open("ads.db");
/// HourlyOrchestrator orch(*store);
/// if (auto rows = orch.regenerate(7, 42)) {
///     fmt::print("{} rows\n", *rows);
/// }
/// ```
///
/// ## Guarantees
/// - Deterministic for a fixed (campaign_id, seed, flight)
/// - One RandomStream per run, created inside the call
/// - A failed write leaves the campaign's previous rows untouched
///
/// ## NOT Responsible For
/// - Creating campaigns or flights (see sqlite_store.hpp)

#include "adsim/generator.hpp"
#include "adsim/random_stream.hpp"
#include "adsim/store.hpp"
#include "adsim/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace adsim {

// ─── OrchestratorConfig ───────────────────────────────────────────────────────

struct OrchestratorConfig {
    /// Forwarded to the FunnelGenerator.
    generator::GeneratorConfig generator{};

    /// Write the derived projection next to the raw rows.
    bool persist_derived = true;
};

// ─── RunSummary ───────────────────────────────────────────────────────────────

/// Outcome of one successful regeneration.
struct RunSummary {
    CampaignId         campaign_id = 0;
    RandomStream::Seed seed        = 0;  ///< The seed actually used
    std::size_t        rows        = 0;  ///< 0 when the campaign was not found
};

// ─── HourlyOrchestrator ───────────────────────────────────────────────────────

class HourlyOrchestrator {
public:
    /// The store must outlive the orchestrator.
    explicit HourlyOrchestrator(storage::MetricsStore& store,
                                OrchestratorConfig     config = OrchestratorConfig{});

    /// Regenerate every hour of a campaign's flight.
    ///
    /// # Returns
    /// Number of rows written; `0` if the campaign or its flight does not
    /// exist; `nullopt` on storage failure (see `store.last_error()`).
    [[nodiscard]] std::optional<std::size_t>
    regenerate(CampaignId                        campaign_id,
               std::optional<RandomStream::Seed> seed    = std::nullopt,
               bool                              replace = true);

    /// Same as `regenerate` but also reports the seed, which is drawn from
    /// std::random_device when none is given.
    [[nodiscard]] std::optional<RunSummary>
    run(CampaignId                        campaign_id,
        std::optional<RandomStream::Seed> seed    = std::nullopt,
        bool                              replace = true);

    /// Generate all rows of a flight in memory. Touches no storage.
    [[nodiscard]] std::vector<HourlyRow>
    generate_rows(const CampaignFlight& cf, RandomStream& rng) const;

    [[nodiscard]] std::vector<HourlyRow>
    generate_rows(const CampaignFlight& cf, RandomStream::Seed seed) const;

    [[nodiscard]] const OrchestratorConfig& config() const noexcept { return config_; }

private:
    storage::MetricsStore&     store_;
    OrchestratorConfig         config_;
    generator::FunnelGenerator generator_;
};

} // namespace adsim
