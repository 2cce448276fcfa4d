/// @file src/temporal/calendar.cpp
/// @brief UTC calendar helpers: hour alignment, flight windows, breakdowns,
///        and date/timestamp text round-tripping for the store.

#include "adsim/temporal.hpp"
#include "adsim/constants.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>

namespace adsim::temporal {

using namespace std::chrono;

namespace {

/// Parse exactly `width` decimal digits starting at `pos`.
[[nodiscard]] std::optional<int> parse_fixed(std::string_view text,
                                             std::size_t pos,
                                             std::size_t width) noexcept {
    if (pos + width > text.size()) return std::nullopt;
    int value = 0;
    const char* first = text.data() + pos;
    const char* last  = first + width;
    // from_chars accepts a leading '-'.
    if (!std::all_of(first, last, [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

}  // namespace

// ─── Alignment ────────────────────────────────────────────────────────────────

HourTs floor_hour(sys_seconds ts) noexcept {
    return sys_seconds{floor<hours>(ts)};
}

HourWindow flight_window(const Flight& flight) noexcept {
    // Start at 00:00 of the first day, end at the last full hour of the last day.
    return HourWindow{
        .first_hour = sys_seconds{flight.start_date},
        .last_hour  = sys_seconds{flight.end_date} + hours{23},
    };
}

std::vector<HourTs> hours_between(HourTs first, HourTs last) {
    std::vector<HourTs> out;
    if (last < first) {
        return out;
    }
    const auto span = duration_cast<hours>(last - first).count();
    out.reserve(static_cast<std::size_t>(span) + 1);
    for (HourTs h = first; h <= last; h += hours{1}) {
        out.push_back(h);
    }
    return out;
}

// ─── Calendar fields ──────────────────────────────────────────────────────────

int hour_of_day(HourTs hour) noexcept {
    const auto day = floor<days>(hour);
    return static_cast<int>(floor<hours>(hour - day).count());
}

int day_of_week(HourTs hour) noexcept {
    // ISO encoding: Monday = 1 … Sunday = 7.
    const weekday wd{floor<days>(hour)};
    return static_cast<int>(wd.iso_encoding()) - 1;
}

int day_of_year(HourTs hour) noexcept {
    const auto day = floor<days>(hour);
    const year_month_day ymd{day};
    const sys_days jan1{ymd.year() / January / 1};
    return static_cast<int>((day - jan1).count()) + 1;
}

bool is_evening(HourTs hour) noexcept {
    const int h = hour_of_day(hour);
    return h >= constants::EVENING_FIRST_HOUR && h <= constants::EVENING_LAST_HOUR;
}

TemporalBreakdown make_breakdown(HourTs hour) {
    const auto day = floor<days>(hour);
    const year_month_day ymd{day};
    const int h   = hour_of_day(hour);
    const int dow = day_of_week(hour);

    return TemporalBreakdown{
        .hour_of_day      = h,
        .day_of_week      = dow,
        .is_business_hour = dow < 5
                            && h >= constants::BUSINESS_HOUR_FIRST
                            && h <= constants::BUSINESS_HOUR_LAST,
        .human_readable   = format_timestamp(hour) + " UTC",
        .daily_day_date         = day,
        .weekly_start_day_date  = day - days{dow},
        .monthly_start_day_date = sys_days{ymd.year() / ymd.month() / 1},
    };
}

// ─── Text round-trip ──────────────────────────────────────────────────────────

std::string format_date(Date date) {
    const year_month_day ymd{date};
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

std::string format_timestamp(sys_seconds ts) {
    const auto day = floor<days>(ts);
    const hh_mm_ss hms{ts - day};
    return fmt::format("{} {:02d}:{:02d}:{:02d}",
                       format_date(day),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count());
}

std::optional<Date> parse_date(std::string_view text) noexcept {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    const auto y = parse_fixed(text, 0, 4);
    const auto m = parse_fixed(text, 5, 2);
    const auto d = parse_fixed(text, 8, 2);
    if (!y || !m || !d) return std::nullopt;

    const year_month_day ymd{year{*y},
                             month{static_cast<unsigned>(*m)},
                             day{static_cast<unsigned>(*d)}};
    if (!ymd.ok()) return std::nullopt;
    return sys_days{ymd};
}

std::optional<sys_seconds> parse_timestamp(std::string_view text) noexcept {
    if (text.size() != 19 || text[10] != ' ' || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }
    const auto date = parse_date(text.substr(0, 10));
    const auto hh   = parse_fixed(text, 11, 2);
    const auto mm   = parse_fixed(text, 14, 2);
    const auto ss   = parse_fixed(text, 17, 2);
    if (!date || !hh || !mm || !ss) return std::nullopt;
    if (*hh > 23 || *mm > 59 || *ss > 59) return std::nullopt;

    return sys_seconds{*date} + hours{*hh} + minutes{*mm} + seconds{*ss};
}

}  // namespace adsim::temporal
