#pragma once

/// @file include/adsim/store.hpp
/// @brief Storage boundary for the hourly orchestrator.
///
/// # Module: MetricsStore
///
/// ## Responsibility
/// Abstract the three operations the generator needs from persistence:
///   - look up a campaign and its flight,
///   - atomically replace (or append) the hourly rows of one campaign,
///   - read rows back.
///
/// ## Error Model
/// Methods never throw. Lookups return `std::nullopt` both when the campaign
/// is absent and when the backend fails; the two cases are told apart by
/// `last_error()`, which is cleared at the start of every call and set only
/// on backend failure. Writes return `false` on failure and leave previously
/// stored rows untouched.

#include "adsim/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace adsim::storage {

/// Backend failure, surfaced unchanged to the caller.
struct StorageError {
    std::string operation;  ///< e.g. "insert campaign_performance"
    std::string message;    ///< Backend error text

    [[nodiscard]] std::string to_string() const;
};

class MetricsStore {
public:
    virtual ~MetricsStore() = default;

    /// Campaign and flight for `id`; nullopt if either is missing or the
    /// lookup failed (check `last_error()`).
    [[nodiscard]] virtual std::optional<CampaignFlight>
    find_campaign_flight(CampaignId id) = 0;

    /// Write all rows for `id` as one all-or-nothing unit. When `replace` is
    /// true every existing row of the campaign is deleted first. When
    /// `write_derived` is true the derived projection is written alongside.
    [[nodiscard]] virtual bool write_hourly_rows(CampaignId                 id,
                                                 std::span<const HourlyRow> rows,
                                                 bool                       replace,
                                                 bool                       write_derived) = 0;

    /// Raw rows of a campaign ordered by hour.
    [[nodiscard]] virtual std::vector<RawHourlyMetrics> load_raw_rows(CampaignId id) = 0;

    /// Persisted derived rows of a campaign ordered by hour.
    [[nodiscard]] virtual std::vector<DerivedHourlyMetrics> load_derived_rows(CampaignId id) = 0;

    /// Error from the most recent call, if it failed.
    [[nodiscard]] virtual std::optional<StorageError> last_error() const = 0;
};

} // namespace adsim::storage
