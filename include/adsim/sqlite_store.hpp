#pragma once

/// @file include/adsim/sqlite_store.hpp
/// @brief SQLite-backed MetricsStore.
///
/// # Tables
///
///     campaigns(id PK, name)
///     flights(id PK, campaign_id UNIQUE → campaigns, start_date, end_date)
///     campaign_performance(campaign_id, hour_ts, <raw columns>,
///                          PRIMARY KEY (campaign_id, hour_ts))
///     campaign_performance_derived(campaign_id, hour_ts, <rates>,
///                          PRIMARY KEY (campaign_id, hour_ts))
///
/// Dates are stored as "YYYY-MM-DD" and hours as "YYYY-MM-DD HH:MM:SS" (UTC).
///
/// # Atomicity
/// `write_hourly_rows` runs inside `BEGIN IMMEDIATE … COMMIT`. The immediate
/// transaction takes the database write lock up front, so concurrent
/// regenerations of the same campaign serialise and readers never observe a
/// half-replaced campaign. Any failure rolls back.

#include "adsim/store.hpp"

#include <memory>
#include <string>
#include <string_view>

struct sqlite3;

namespace adsim::storage {

class SqliteStore final : public MetricsStore {
public:
    /// Open (or create) a database file. ":memory:" opens a private
    /// in-memory database. Returns nullptr and logs on failure.
    [[nodiscard]] static std::unique_ptr<SqliteStore>
    open(const std::string& path, int busy_timeout_ms = 5000);

    ~SqliteStore() override;

    SqliteStore(const SqliteStore&)            = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    /// Create all tables if absent.
    [[nodiscard]] bool initialize_schema();

    /// Insert or update a campaign row.
    [[nodiscard]] bool upsert_campaign(const Campaign& campaign);

    /// Insert or update the flight of `flight.campaign_id`.
    [[nodiscard]] bool upsert_flight(const Flight& flight);

    /// Number of raw rows stored for a campaign; nullopt on failure.
    [[nodiscard]] std::optional<std::size_t> count_rows(CampaignId id);

    /// Number of derived rows stored for a campaign; nullopt on failure.
    [[nodiscard]] std::optional<std::size_t> count_derived_rows(CampaignId id);

    /// Run arbitrary SQL with no result rows.
    [[nodiscard]] bool execute(std::string_view sql);

    // ── MetricsStore ──────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<CampaignFlight>
    find_campaign_flight(CampaignId id) override;

    [[nodiscard]] bool write_hourly_rows(CampaignId                 id,
                                         std::span<const HourlyRow> rows,
                                         bool                       replace,
                                         bool                       write_derived) override;

    [[nodiscard]] std::vector<RawHourlyMetrics> load_raw_rows(CampaignId id) override;

    [[nodiscard]] std::vector<DerivedHourlyMetrics> load_derived_rows(CampaignId id) override;

    [[nodiscard]] std::optional<StorageError> last_error() const override;

private:
    explicit SqliteStore(sqlite3* db);

    /// Record the connection's current error for `operation`; returns false.
    bool fail(std::string_view operation);
    bool fail(std::string_view operation, std::string message);

    [[nodiscard]] std::optional<std::size_t> count_in(std::string_view table, CampaignId id);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace adsim::storage
