#pragma once

/// @file include/adsim/types.hpp
/// @brief Shared value types for the adsim synthetic ad-metrics generator.
///
/// Every module includes this file. It defines the campaign/flight records
/// read from the store, the hourly raw and derived metric rows written back,
/// and the Eigen share vectors used for the audience composition snapshot.

#include <Eigen/Dense>

#include <chrono>
#include <cstdint>
#include <string>

namespace adsim {

// ─── Identifiers & Time ───────────────────────────────────────────────────────

using CampaignId = std::int64_t;

/// UTC timestamp aligned to a whole hour.
using HourTs = std::chrono::sys_seconds;

/// UTC calendar date (midnight).
using Date = std::chrono::sys_days;

// ─── Campaign & Flight ────────────────────────────────────────────────────────

struct Campaign {
    CampaignId  id;
    std::string name;
};

/// Scheduled delivery window. Both dates are inclusive calendar days.
struct Flight {
    CampaignId campaign_id;
    Date       start_date;
    Date       end_date;
};

struct CampaignFlight {
    Campaign campaign;
    Flight   flight;
};

/// Hour-aligned bounds of a flight: first and last hour, both inclusive.
struct HourWindow {
    HourTs first_hour;
    HourTs last_hour;
};

/// Position of one hour inside its flight.
struct TemporalContext {
    HourTs flight_start;
    HourTs flight_end;
    HourTs hour;
};

// ─── Temporal Breakdown ───────────────────────────────────────────────────────

/// Calendar fields stored next to every hourly row for downstream bucketing.
struct TemporalBreakdown {
    int         hour_of_day      = 0;     ///< 0–23
    int         day_of_week      = 0;     ///< 0 = Monday … 6 = Sunday
    bool        is_business_hour = false; ///< 09:00–17:00 Mon–Fri
    std::string human_readable;           ///< "YYYY-MM-DD HH:00:00 UTC"
    Date        daily_day_date{};
    Date        weekly_start_day_date{};  ///< Monday of the containing week
    Date        monthly_start_day_date{}; ///< First day of the containing month
};

// ─── Audience Mix ─────────────────────────────────────────────────────────────

using DeviceShares    = Eigen::Vector<double, 3>;  ///< CTV, DESKTOP, MOBILE
using AgeShares       = Eigen::Vector<double, 6>;  ///< 18-24 … 65+
using GenderShares    = Eigen::Vector<double, 2>;  ///< F, M
using LifeStageShares = Eigen::Vector<double, 3>;  ///< SINGLE, PARENT, EMPTY_NEST
using InterestShares  = Eigen::Vector<double, 5>;  ///< SPORTS … TRAVEL

/// Informational audience composition for one hour. Each vector sums to 1.
struct AudienceMix {
    DeviceShares    device    = DeviceShares::Zero();
    AgeShares       age       = AgeShares::Zero();
    GenderShares    gender    = GenderShares::Zero();
    LifeStageShares life_stage = LifeStageShares::Zero();
    InterestShares  interest  = InterestShares::Zero();

    /// Compact JSON object keyed by segment label.
    [[nodiscard]] std::string to_json() const;
};

// ─── Hourly Metrics ───────────────────────────────────────────────────────────

/// Raw counts generated for one campaign-hour.
struct RawHourlyMetrics {
    CampaignId campaign_id = 0;
    HourTs     hour_ts{};

    // supply funnel
    std::int64_t requests             = 0;
    std::int64_t responses            = 0;
    std::int64_t eligible_impressions = 0;
    std::int64_t auctions_won         = 0;
    std::int64_t impressions          = 0;

    // quality
    std::int64_t viewable_impressions = 0;
    std::int64_t audible_impressions  = 0;

    // video
    std::int64_t video_starts = 0;
    std::int64_t video_q25    = 0;
    std::int64_t video_q50    = 0;
    std::int64_t video_q75    = 0;
    std::int64_t video_q100   = 0;
    std::int64_t skips        = 0;
    double       avg_watch_time_seconds = 0.0;

    // interaction
    std::int64_t clicks                  = 0;
    std::int64_t qr_scans                = 0;
    std::int64_t interactive_engagements = 0;

    // audience
    std::int64_t reach     = 0;
    std::int64_t frequency = 1;

    // spend (account currency cents)
    std::int64_t spend         = 0;
    std::int64_t effective_cpm = 0;

    // reliability
    std::int64_t error_count   = 0;
    std::int64_t timeout_count = 0;

    TemporalBreakdown temporal;
    AudienceMix       audience;
};

/// Rates computed from a RawHourlyMetrics row. Every field lies in [0, 1]
/// except `avg_watch_time_seconds`.
struct DerivedHourlyMetrics {
    CampaignId campaign_id = 0;
    HourTs     hour_ts{};

    double ctr                      = 0.0;
    double render_rate              = 0.0;
    double viewability_rate         = 0.0;
    double fill_rate                = 0.0;
    double response_rate            = 0.0;
    double auction_win_rate         = 0.0;
    double audibility_rate          = 0.0;
    double video_start_rate         = 0.0;
    double video_completion_rate    = 0.0;
    double video_skip_rate          = 0.0;
    double qr_scan_rate             = 0.0;
    double interactive_rate         = 0.0;
    double error_rate               = 0.0;
    double timeout_rate             = 0.0;
    double supply_funnel_efficiency = 0.0;
    double avg_watch_time_seconds   = 0.0;
};

/// One generated hour as handed to the store.
struct HourlyRow {
    RawHourlyMetrics     raw;
    DerivedHourlyMetrics derived;
};

} // namespace adsim
