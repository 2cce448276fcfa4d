#pragma once

/// @file include/adsim/generator.hpp
/// @brief Funnel-Consistent Metric Generator — public API.
///
/// # Module: Funnel Generator
///
/// ## Responsibility
/// Produce the raw integer counts for one campaign-hour. A base impression
/// volume is scaled by the temporal factor; every other count is a sampled
/// rate applied to its parent stage of the funnel:
///
///     request → response → eligible → auction-won → impression
///       → viewable / audible → video start → q25 → q50 → q75 → q100
///       → click / QR scan / interaction → spend
///
/// ## Draw Order
/// All randomness flows through the caller's RandomStream in this order:
///   1. impressions base            (uniform_int)
///   2. click rate, click variance  (uniform × 2)
///   3. video-start rate            (uniform)
///   4. q25, q50, q75, q100 rates   (uniform × 4)
///   5. requests, responses, eligible, auctions_won ratios (uniform × 4)
///   6. viewability, audibility     (uniform × 2)
///   7. skip, QR scan, interaction rates (uniform × 3)
///   8. CPM base, CPM jitter        (uniform_int, uniform)
///   9. error, timeout rates        (uniform × 2)
///  10. frequency base              (uniform_int)
/// The audience mix consumes no draws. Changing this order changes every
/// generated dataset.
///
/// ## Guarantees
/// - Never throws, never asserts: out-of-range values are clamped
/// - Every returned row satisfies the funnel invariants (see
///   `enforce_funnel_invariants`)
/// - Non-finite or non-positive factors are treated as 1.0
///
/// ## NOT Responsible For
/// - Computing the temporal factor (see temporal.hpp)
/// - Rates (see derived.hpp)
/// - Persistence (see store.hpp)

#include "adsim/constants.hpp"
#include "adsim/random_stream.hpp"
#include "adsim/types.hpp"

namespace adsim::generator {

// ─── GeneratorConfig ──────────────────────────────────────────────────────────

struct GeneratorConfig {
    /// Asset length used for the average watch-time estimate.
    double asset_seconds = constants::DEFAULT_ASSET_SECONDS;

    /// If true, emit per-hour debug lines through the logger.
    bool verbose = false;
};

// ─── FunnelGenerator ──────────────────────────────────────────────────────────

class FunnelGenerator {
public:
    explicit FunnelGenerator(GeneratorConfig config = GeneratorConfig{});

    /// Generate one hour of raw metrics.
    ///
    /// # Arguments
    /// * `campaign_id` — Copied into the row
    /// * `hour`        — Hour-aligned UTC timestamp
    /// * `factor`      — Temporal factor for this hour (> 0)
    /// * `rng`         — The run's random stream; advanced by a fixed number
    ///                   of draws plus any uniform_int rejections
    [[nodiscard]] RawHourlyMetrics generate_hour(CampaignId    campaign_id,
                                                 HourTs        hour,
                                                 double        factor,
                                                 RandomStream& rng) const noexcept;

    /// Clamp a row into the funnel invariants:
    ///   - every count ≥ 0, impressions ≥ 1
    ///   - requests ≥ responses ≥ eligible_impressions ≥ auctions_won
    ///   - viewable, audible, video_starts, clicks, qr_scans,
    ///     interactive_engagements ≤ impressions
    ///   - video_starts ≥ q25 ≥ q50 ≥ q75 ≥ q100
    ///   - skips ≤ video_starts; error/timeout counts ≤ requests
    ///   - viewable ≥ ⌈0.90 · impressions⌉
    ///   - frequency ∈ [1, 5]; reach = max(1, impressions / frequency)
    static void enforce_funnel_invariants(RawHourlyMetrics& row) noexcept;

    /// Audience composition for an hour: CTV- and youth-leaning in evenings
    /// and on weekends, mobile- and desktop-leaning on weekday daytime.
    [[nodiscard]] static AudienceMix audience_mix(HourTs hour) noexcept;

    [[nodiscard]] const GeneratorConfig& config() const noexcept { return config_; }

private:
    GeneratorConfig config_;
};

} // namespace adsim::generator
