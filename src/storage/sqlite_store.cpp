/// @file src/storage/sqlite_store.cpp
/// @brief SqliteStore — schema, campaign lookup, atomic hourly replace.

#include "adsim/sqlite_store.hpp"
#include "adsim/log.hpp"
#include "adsim/temporal.hpp"

#include "sqlite_statement.hpp"

#include <fmt/format.h>

#include <sqlite3.h>

namespace adsim::storage {

using detail::Statement;

namespace {

constexpr std::string_view kComponent = "sqlite";

constexpr std::string_view kSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS campaigns (
        id   INTEGER PRIMARY KEY,
        name TEXT    NOT NULL
    );

    CREATE TABLE IF NOT EXISTS flights (
        id          INTEGER PRIMARY KEY AUTOINCREMENT,
        campaign_id INTEGER NOT NULL UNIQUE
                    REFERENCES campaigns(id) ON DELETE CASCADE,
        start_date  TEXT    NOT NULL,
        end_date    TEXT    NOT NULL
    );

    CREATE TABLE IF NOT EXISTS campaign_performance (
        campaign_id             INTEGER NOT NULL
                                REFERENCES campaigns(id) ON DELETE CASCADE,
        hour_ts                 TEXT    NOT NULL,
        requests                INTEGER NOT NULL DEFAULT 0,
        responses               INTEGER NOT NULL DEFAULT 0,
        eligible_impressions    INTEGER NOT NULL DEFAULT 0,
        auctions_won            INTEGER NOT NULL DEFAULT 0,
        impressions             INTEGER NOT NULL,
        viewable_impressions    INTEGER NOT NULL DEFAULT 0,
        audible_impressions     INTEGER NOT NULL DEFAULT 0,
        video_starts            INTEGER NOT NULL DEFAULT 0,
        video_q25               INTEGER NOT NULL DEFAULT 0,
        video_q50               INTEGER NOT NULL DEFAULT 0,
        video_q75               INTEGER NOT NULL DEFAULT 0,
        video_q100              INTEGER NOT NULL DEFAULT 0,
        skips                   INTEGER NOT NULL DEFAULT 0,
        avg_watch_time_seconds  REAL    NOT NULL DEFAULT 0,
        clicks                  INTEGER NOT NULL DEFAULT 0,
        qr_scans                INTEGER NOT NULL DEFAULT 0,
        interactive_engagements INTEGER NOT NULL DEFAULT 0,
        reach                   INTEGER NOT NULL DEFAULT 0,
        frequency               INTEGER NOT NULL DEFAULT 1,
        spend                   INTEGER NOT NULL DEFAULT 0,
        effective_cpm           INTEGER NOT NULL DEFAULT 0,
        error_count             INTEGER NOT NULL DEFAULT 0,
        timeout_count           INTEGER NOT NULL DEFAULT 0,
        human_readable          TEXT    NOT NULL,
        hour_of_day             INTEGER NOT NULL,
        day_of_week             INTEGER NOT NULL,
        is_business_hour        INTEGER NOT NULL CHECK (is_business_hour IN (0,1)),
        daily_day_date          TEXT    NOT NULL,
        weekly_start_day_date   TEXT    NOT NULL,
        monthly_start_day_date  TEXT    NOT NULL,
        audience_json           TEXT,
        PRIMARY KEY (campaign_id, hour_ts)
    );

    CREATE TABLE IF NOT EXISTS campaign_performance_derived (
        campaign_id              INTEGER NOT NULL
                                 REFERENCES campaigns(id) ON DELETE CASCADE,
        hour_ts                  TEXT    NOT NULL,
        ctr                      REAL    NOT NULL,
        render_rate              REAL    NOT NULL,
        viewability_rate         REAL    NOT NULL,
        fill_rate                REAL    NOT NULL,
        response_rate            REAL    NOT NULL,
        auction_win_rate         REAL    NOT NULL,
        audibility_rate          REAL    NOT NULL,
        video_start_rate         REAL    NOT NULL,
        video_completion_rate    REAL    NOT NULL,
        video_skip_rate          REAL    NOT NULL,
        qr_scan_rate             REAL    NOT NULL,
        interactive_rate         REAL    NOT NULL,
        error_rate               REAL    NOT NULL,
        timeout_rate             REAL    NOT NULL,
        supply_funnel_efficiency REAL    NOT NULL,
        avg_watch_time_seconds   REAL    NOT NULL,
        PRIMARY KEY (campaign_id, hour_ts)
    );
)";

constexpr std::string_view kRawColumns =
    "campaign_id, hour_ts, requests, responses, eligible_impressions, auctions_won, "
    "impressions, viewable_impressions, audible_impressions, video_starts, video_q25, "
    "video_q50, video_q75, video_q100, skips, avg_watch_time_seconds, clicks, qr_scans, "
    "interactive_engagements, reach, frequency, spend, effective_cpm, error_count, "
    "timeout_count, human_readable, hour_of_day, day_of_week, is_business_hour, "
    "daily_day_date, weekly_start_day_date, monthly_start_day_date, audience_json";

constexpr std::string_view kDerivedColumns =
    "campaign_id, hour_ts, ctr, render_rate, viewability_rate, fill_rate, response_rate, "
    "auction_win_rate, audibility_rate, video_start_rate, video_completion_rate, "
    "video_skip_rate, qr_scan_rate, interactive_rate, error_rate, timeout_rate, "
    "supply_funnel_efficiency, avg_watch_time_seconds";

/// "?, ?, …" with `n` placeholders.
[[nodiscard]] std::string placeholders(int n) {
    std::string out;
    for (int i = 0; i < n; ++i) {
        out += (i == 0) ? "?" : ", ?";
    }
    return out;
}

[[nodiscard]] bool bind_raw(Statement& stmt, CampaignId id, const RawHourlyMetrics& r) {
    const std::string hour = temporal::format_timestamp(r.hour_ts);
    const auto& t = r.temporal;
    int i = 0;
    return stmt.bind(++i, id)
        && stmt.bind(++i, std::string_view{hour})
        && stmt.bind(++i, r.requests)
        && stmt.bind(++i, r.responses)
        && stmt.bind(++i, r.eligible_impressions)
        && stmt.bind(++i, r.auctions_won)
        && stmt.bind(++i, r.impressions)
        && stmt.bind(++i, r.viewable_impressions)
        && stmt.bind(++i, r.audible_impressions)
        && stmt.bind(++i, r.video_starts)
        && stmt.bind(++i, r.video_q25)
        && stmt.bind(++i, r.video_q50)
        && stmt.bind(++i, r.video_q75)
        && stmt.bind(++i, r.video_q100)
        && stmt.bind(++i, r.skips)
        && stmt.bind(++i, r.avg_watch_time_seconds)
        && stmt.bind(++i, r.clicks)
        && stmt.bind(++i, r.qr_scans)
        && stmt.bind(++i, r.interactive_engagements)
        && stmt.bind(++i, r.reach)
        && stmt.bind(++i, r.frequency)
        && stmt.bind(++i, r.spend)
        && stmt.bind(++i, r.effective_cpm)
        && stmt.bind(++i, r.error_count)
        && stmt.bind(++i, r.timeout_count)
        && stmt.bind(++i, std::string_view{t.human_readable})
        && stmt.bind(++i, static_cast<std::int64_t>(t.hour_of_day))
        && stmt.bind(++i, static_cast<std::int64_t>(t.day_of_week))
        && stmt.bind(++i, static_cast<std::int64_t>(t.is_business_hour ? 1 : 0))
        && stmt.bind(++i, std::string_view{temporal::format_date(t.daily_day_date)})
        && stmt.bind(++i, std::string_view{temporal::format_date(t.weekly_start_day_date)})
        && stmt.bind(++i, std::string_view{temporal::format_date(t.monthly_start_day_date)})
        && stmt.bind(++i, std::string_view{r.audience.to_json()});
}

[[nodiscard]] bool bind_derived(Statement& stmt, CampaignId id, const DerivedHourlyMetrics& d) {
    const std::string hour = temporal::format_timestamp(d.hour_ts);
    int i = 0;
    return stmt.bind(++i, id)
        && stmt.bind(++i, std::string_view{hour})
        && stmt.bind(++i, d.ctr)
        && stmt.bind(++i, d.render_rate)
        && stmt.bind(++i, d.viewability_rate)
        && stmt.bind(++i, d.fill_rate)
        && stmt.bind(++i, d.response_rate)
        && stmt.bind(++i, d.auction_win_rate)
        && stmt.bind(++i, d.audibility_rate)
        && stmt.bind(++i, d.video_start_rate)
        && stmt.bind(++i, d.video_completion_rate)
        && stmt.bind(++i, d.video_skip_rate)
        && stmt.bind(++i, d.qr_scan_rate)
        && stmt.bind(++i, d.interactive_rate)
        && stmt.bind(++i, d.error_rate)
        && stmt.bind(++i, d.timeout_rate)
        && stmt.bind(++i, d.supply_funnel_efficiency)
        && stmt.bind(++i, d.avg_watch_time_seconds);
}

/// Parse a stored date column; an unparsable value maps to the epoch.
[[nodiscard]] Date date_column(const Statement& stmt, int col) {
    return temporal::parse_date(stmt.column_text(col)).value_or(Date{});
}

[[nodiscard]] HourTs hour_column(const Statement& stmt, int col) {
    return temporal::parse_timestamp(stmt.column_text(col)).value_or(HourTs{});
}

}  // namespace

// ─── StorageError ─────────────────────────────────────────────────────────────

std::string StorageError::to_string() const {
    return fmt::format("{}: {}", operation, message);
}

// ─── Impl ─────────────────────────────────────────────────────────────────────

struct SqliteStore::Impl {
    detail::Connection          db;
    std::optional<StorageError> last_error;
};

SqliteStore::SqliteStore(sqlite3* db)
    : impl_(std::make_unique<Impl>())
{
    impl_->db.reset(db);
}

SqliteStore::~SqliteStore() = default;

std::unique_ptr<SqliteStore> SqliteStore::open(const std::string& path, int busy_timeout_ms) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    detail::Connection guard(raw);
    if (rc != SQLITE_OK) {
        log::error(kComponent, "cannot open '{}': {}", path, detail::errmsg(raw));
        return nullptr;
    }
    sqlite3_busy_timeout(raw, busy_timeout_ms);

    std::unique_ptr<SqliteStore> store(new SqliteStore(guard.release()));
    if (!store->execute("PRAGMA foreign_keys = ON;")) {
        log::error(kComponent, "cannot enable foreign keys on '{}'", path);
        return nullptr;
    }
    log::debug(kComponent, "opened '{}'", path);
    return store;
}

// ─── Error bookkeeping ────────────────────────────────────────────────────────

bool SqliteStore::fail(std::string_view operation) {
    return fail(operation, detail::errmsg(impl_->db.get()));
}

bool SqliteStore::fail(std::string_view operation, std::string message) {
    impl_->last_error = StorageError{std::string(operation), std::move(message)};
    log::error(kComponent, "{}", impl_->last_error->to_string());
    return false;
}

std::optional<StorageError> SqliteStore::last_error() const {
    return impl_->last_error;
}

// ─── execute / schema ─────────────────────────────────────────────────────────

bool SqliteStore::execute(std::string_view sql) {
    impl_->last_error.reset();
    const std::string text(sql);
    char* err = nullptr;
    const int rc = sqlite3_exec(impl_->db.get(), text.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string message = err != nullptr ? err : detail::errmsg(impl_->db.get());
        sqlite3_free(err);
        return fail("execute", std::move(message));
    }
    return true;
}

bool SqliteStore::initialize_schema() {
    return execute(kSchemaSql);
}

// ─── Campaign / flight setup ──────────────────────────────────────────────────

bool SqliteStore::upsert_campaign(const Campaign& campaign) {
    impl_->last_error.reset();
    Statement stmt(impl_->db.get(),
        "INSERT INTO campaigns (id, name) VALUES (?, ?) "
        "ON CONFLICT(id) DO UPDATE SET name = excluded.name");
    if (!stmt.ok()) return fail("prepare upsert campaign");
    if (!stmt.bind(1, campaign.id) || !stmt.bind(2, std::string_view{campaign.name})) {
        return fail("bind upsert campaign");
    }
    if (stmt.step() != SQLITE_DONE) return fail("upsert campaign");
    return true;
}

bool SqliteStore::upsert_flight(const Flight& flight) {
    impl_->last_error.reset();
    Statement stmt(impl_->db.get(),
        "INSERT INTO flights (campaign_id, start_date, end_date) VALUES (?, ?, ?) "
        "ON CONFLICT(campaign_id) DO UPDATE SET "
        "start_date = excluded.start_date, end_date = excluded.end_date");
    if (!stmt.ok()) return fail("prepare upsert flight");
    const std::string start = temporal::format_date(flight.start_date);
    const std::string end   = temporal::format_date(flight.end_date);
    if (!stmt.bind(1, flight.campaign_id)
        || !stmt.bind(2, std::string_view{start})
        || !stmt.bind(3, std::string_view{end})) {
        return fail("bind upsert flight");
    }
    if (stmt.step() != SQLITE_DONE) return fail("upsert flight");
    return true;
}

// ─── find_campaign_flight ─────────────────────────────────────────────────────

std::optional<CampaignFlight> SqliteStore::find_campaign_flight(CampaignId id) {
    impl_->last_error.reset();
    Statement stmt(impl_->db.get(),
        "SELECT c.id, c.name, f.start_date, f.end_date "
        "FROM campaigns c JOIN flights f ON f.campaign_id = c.id "
        "WHERE c.id = ?");
    if (!stmt.ok()) {
        fail("prepare find campaign");
        return std::nullopt;
    }
    if (!stmt.bind(1, id)) {
        fail("bind find campaign");
        return std::nullopt;
    }

    const int rc = stmt.step();
    if (rc == SQLITE_DONE) {
        return std::nullopt;  // campaign or flight absent
    }
    if (rc != SQLITE_ROW) {
        fail("find campaign");
        return std::nullopt;
    }

    const std::string start_text = stmt.column_text(2);
    const std::string end_text   = stmt.column_text(3);
    const auto start = temporal::parse_date(start_text);
    const auto end   = temporal::parse_date(end_text);
    if (!start || !end) {
        fail("find campaign",
             fmt::format("malformed flight dates '{}'..'{}' for campaign {}",
                         start_text, end_text, id));
        return std::nullopt;
    }

    return CampaignFlight{
        .campaign = Campaign{.id = stmt.column_int64(0), .name = stmt.column_text(1)},
        .flight   = Flight{.campaign_id = id, .start_date = *start, .end_date = *end},
    };
}

// ─── write_hourly_rows ────────────────────────────────────────────────────────

bool SqliteStore::write_hourly_rows(CampaignId                 id,
                                    std::span<const HourlyRow> rows,
                                    bool                       replace,
                                    bool                       write_derived) {
    sqlite3* db = impl_->db.get();

    if (!execute("BEGIN IMMEDIATE;")) {
        return false;
    }

    // Roll back and keep the first error as the reported one. Some errors
    // already end the transaction inside SQLite, leaving nothing to undo.
    const auto abort_txn = [&](std::string_view operation) {
        fail(operation);
        if (sqlite3_get_autocommit(db) == 0) {
            const int rc = sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
            if (rc != SQLITE_OK) {
                log::error(kComponent, "campaign {}: rollback after '{}' failed: {}",
                           id, operation, sqlite3_errmsg(db));
            }
        }
        return false;
    };

    if (replace) {
        for (std::string_view table : {std::string_view{"campaign_performance"},
                                       std::string_view{"campaign_performance_derived"}}) {
            Statement del(db, fmt::format("DELETE FROM {} WHERE campaign_id = ?", table));
            if (!del.ok() || !del.bind(1, id) || del.step() != SQLITE_DONE) {
                return abort_txn(fmt::format("delete {}", table));
            }
        }
    }

    Statement insert_raw(db, fmt::format("INSERT INTO campaign_performance ({}) VALUES ({})",
                                         kRawColumns, placeholders(33)));
    if (!insert_raw.ok()) return abort_txn("prepare insert campaign_performance");

    for (const auto& row : rows) {
        if (!bind_raw(insert_raw, id, row.raw) || insert_raw.step() != SQLITE_DONE) {
            return abort_txn("insert campaign_performance");
        }
        insert_raw.reset();
    }

    if (write_derived) {
        Statement insert_derived(db,
            fmt::format("INSERT INTO campaign_performance_derived ({}) VALUES ({})",
                        kDerivedColumns, placeholders(18)));
        if (!insert_derived.ok()) return abort_txn("prepare insert campaign_performance_derived");

        for (const auto& row : rows) {
            if (!bind_derived(insert_derived, id, row.derived)
                || insert_derived.step() != SQLITE_DONE) {
                return abort_txn("insert campaign_performance_derived");
            }
            insert_derived.reset();
        }
    }

    if (sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        return abort_txn("commit");
    }

    log::debug(kComponent, "campaign {}: wrote {} rows (replace={}, derived={})",
               id, rows.size(), replace, write_derived);
    return true;
}

// ─── load_raw_rows ────────────────────────────────────────────────────────────

std::vector<RawHourlyMetrics> SqliteStore::load_raw_rows(CampaignId id) {
    impl_->last_error.reset();
    std::vector<RawHourlyMetrics> out;

    Statement stmt(impl_->db.get(),
        fmt::format("SELECT {} FROM campaign_performance WHERE campaign_id = ? ORDER BY hour_ts",
                    kRawColumns));
    if (!stmt.ok() || !stmt.bind(1, id)) {
        fail("prepare load campaign_performance");
        return out;
    }

    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        RawHourlyMetrics r;
        int c = 0;
        r.campaign_id             = stmt.column_int64(c++);
        r.hour_ts                 = hour_column(stmt, c++);
        r.requests                = stmt.column_int64(c++);
        r.responses               = stmt.column_int64(c++);
        r.eligible_impressions    = stmt.column_int64(c++);
        r.auctions_won            = stmt.column_int64(c++);
        r.impressions             = stmt.column_int64(c++);
        r.viewable_impressions    = stmt.column_int64(c++);
        r.audible_impressions     = stmt.column_int64(c++);
        r.video_starts            = stmt.column_int64(c++);
        r.video_q25               = stmt.column_int64(c++);
        r.video_q50               = stmt.column_int64(c++);
        r.video_q75               = stmt.column_int64(c++);
        r.video_q100              = stmt.column_int64(c++);
        r.skips                   = stmt.column_int64(c++);
        r.avg_watch_time_seconds  = stmt.column_double(c++);
        r.clicks                  = stmt.column_int64(c++);
        r.qr_scans                = stmt.column_int64(c++);
        r.interactive_engagements = stmt.column_int64(c++);
        r.reach                   = stmt.column_int64(c++);
        r.frequency               = stmt.column_int64(c++);
        r.spend                   = stmt.column_int64(c++);
        r.effective_cpm           = stmt.column_int64(c++);
        r.error_count             = stmt.column_int64(c++);
        r.timeout_count           = stmt.column_int64(c++);

        r.temporal.human_readable         = stmt.column_text(c++);
        r.temporal.hour_of_day            = static_cast<int>(stmt.column_int64(c++));
        r.temporal.day_of_week            = static_cast<int>(stmt.column_int64(c++));
        r.temporal.is_business_hour       = stmt.column_int64(c++) != 0;
        r.temporal.daily_day_date         = date_column(stmt, c++);
        r.temporal.weekly_start_day_date  = date_column(stmt, c++);
        r.temporal.monthly_start_day_date = date_column(stmt, c++);
        // audience_json is write-only; the mix is not parsed back.
        out.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) {
        fail("load campaign_performance");
    }
    return out;
}

// ─── load_derived_rows ────────────────────────────────────────────────────────

std::vector<DerivedHourlyMetrics> SqliteStore::load_derived_rows(CampaignId id) {
    impl_->last_error.reset();
    std::vector<DerivedHourlyMetrics> out;

    Statement stmt(impl_->db.get(),
        fmt::format("SELECT {} FROM campaign_performance_derived "
                    "WHERE campaign_id = ? ORDER BY hour_ts", kDerivedColumns));
    if (!stmt.ok() || !stmt.bind(1, id)) {
        fail("prepare load campaign_performance_derived");
        return out;
    }

    int rc = SQLITE_ROW;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        DerivedHourlyMetrics d;
        int c = 0;
        d.campaign_id              = stmt.column_int64(c++);
        d.hour_ts                  = hour_column(stmt, c++);
        d.ctr                      = stmt.column_double(c++);
        d.render_rate              = stmt.column_double(c++);
        d.viewability_rate         = stmt.column_double(c++);
        d.fill_rate                = stmt.column_double(c++);
        d.response_rate            = stmt.column_double(c++);
        d.auction_win_rate         = stmt.column_double(c++);
        d.audibility_rate          = stmt.column_double(c++);
        d.video_start_rate         = stmt.column_double(c++);
        d.video_completion_rate    = stmt.column_double(c++);
        d.video_skip_rate          = stmt.column_double(c++);
        d.qr_scan_rate             = stmt.column_double(c++);
        d.interactive_rate         = stmt.column_double(c++);
        d.error_rate               = stmt.column_double(c++);
        d.timeout_rate             = stmt.column_double(c++);
        d.supply_funnel_efficiency = stmt.column_double(c++);
        d.avg_watch_time_seconds   = stmt.column_double(c++);
        out.push_back(d);
    }
    if (rc != SQLITE_DONE) {
        fail("load campaign_performance_derived");
    }
    return out;
}

// ─── Row counts ───────────────────────────────────────────────────────────────

std::optional<std::size_t> SqliteStore::count_in(std::string_view table, CampaignId id) {
    impl_->last_error.reset();
    Statement stmt(impl_->db.get(),
                   fmt::format("SELECT COUNT(*) FROM {} WHERE campaign_id = ?", table));
    if (!stmt.ok() || !stmt.bind(1, id) || stmt.step() != SQLITE_ROW) {
        fail(fmt::format("count {}", table));
        return std::nullopt;
    }
    return static_cast<std::size_t>(stmt.column_int64(0));
}

std::optional<std::size_t> SqliteStore::count_rows(CampaignId id) {
    return count_in("campaign_performance", id);
}

std::optional<std::size_t> SqliteStore::count_derived_rows(CampaignId id) {
    return count_in("campaign_performance_derived", id);
}

}  // namespace adsim::storage
