#include "sentinel/market_session.hpp"
#include "sentinel/logging.hpp"

#include <algorithm>

namespace sentinel {

namespace {

constexpr long kMinutesPerDay = 24 * 60;

long floor_div(long a, long b) {
    long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

long minutes_since_epoch(Timestamp t) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
    return floor_div(static_cast<long>(secs), 60);
}

CivilDate date_of(Timestamp t) {
    return civil_from_days(floor_div(minutes_since_epoch(t), kMinutesPerDay));
}

int minute_of_day(Timestamp t) {
    long m = minutes_since_epoch(t);
    return static_cast<int>(m - floor_div(m, kMinutesPerDay) * kMinutesPerDay);
}

// nth (1-based) occurrence of weekday in month.
CivilDate nth_weekday(int year, unsigned month, unsigned weekday, unsigned n) {
    CivilDate first{year, month, 1};
    unsigned delta = (weekday + 7 - weekday_of(first)) % 7;
    return CivilDate{year, month, 1 + delta + 7 * (n - 1)};
}

} // namespace

StaticCalendar::StaticCalendar(MarketSessionConfig config) : config_(std::move(config)) {}

std::optional<SessionHours> StaticCalendar::session_for(const CivilDate& date) const {
    unsigned wd = weekday_of(date);
    if (wd == 0 || wd == 6) {
        return std::nullopt;
    }
    if (std::find(config_.holidays.begin(), config_.holidays.end(), date) != config_.holidays.end()) {
        return std::nullopt;
    }
    SessionHours hours{config_.open_minute, config_.close_minute};
    auto early = config_.early_closes.find(date);
    if (early != config_.early_closes.end()) {
        hours.close_minute = early->second;
    }
    return hours;
}

MarketSessionOracle::MarketSessionOracle(std::shared_ptr<const CalendarSource> calendar,
                                         const MarketSessionConfig& config)
    : calendar_(std::move(calendar)),
      utc_offset_std_(config.utc_offset_std),
      observe_us_dst_(config.observe_us_dst),
      logger_(make_logger("market_session")) {}

bool MarketSessionOracle::dst_in_effect(Timestamp utc) const {
    if (!observe_us_dst_) {
        return false;
    }
    // Transitions happen at 02:00 standard time in March and 02:00 daylight
    // (01:00 standard) time in November.
    Timestamp local_std = utc + std::chrono::hours(utc_offset_std_);
    int year = date_of(local_std).year;
    Timestamp start = make_utc(nth_weekday(year, 3, 0, 2), 2);
    Timestamp end = make_utc(nth_weekday(year, 11, 0, 1), 1);
    return local_std >= start && local_std < end;
}

Timestamp MarketSessionOracle::to_local(Timestamp utc) const {
    int offset = utc_offset_std_ + (dst_in_effect(utc) ? 1 : 0);
    return utc + std::chrono::hours(offset);
}

Timestamp MarketSessionOracle::local_to_utc(const CivilDate& date, int minute) const {
    Timestamp local = make_utc(date) + std::chrono::minutes(minute);
    Timestamp guess = local - std::chrono::hours(utc_offset_std_);
    if (dst_in_effect(guess - std::chrono::hours(1))) {
        return guess - std::chrono::hours(1);
    }
    return guess;
}

CivilDate MarketSessionOracle::session_date(Timestamp now) const {
    return date_of(to_local(now));
}

bool MarketSessionOracle::is_market_open(Timestamp now) const {
    Timestamp local = to_local(now);
    try {
        auto hours = calendar_->session_for(date_of(local));
        if (!hours) {
            return false;
        }
        int minute = minute_of_day(local);
        return minute >= hours->open_minute && minute < hours->close_minute;
    } catch (const std::exception& e) {
        logger_->warn("Calendar unavailable, assuming market closed: {}", e.what());
        return false;
    }
}

Timestamp MarketSessionOracle::next_boundary(Timestamp now) const {
    Timestamp local = to_local(now);
    CivilDate today = date_of(local);
    try {
        auto hours = calendar_->session_for(today);
        int minute = minute_of_day(local);
        if (hours && minute >= hours->open_minute && minute < hours->close_minute) {
            return local_to_utc(today, hours->close_minute);
        }
        long base = days_from_civil(today);
        for (int i = 0; i <= kLookaheadDays; ++i) {
            CivilDate day = civil_from_days(base + i);
            auto session = i == 0 ? hours : calendar_->session_for(day);
            if (!session) {
                continue;
            }
            Timestamp open = local_to_utc(day, session->open_minute);
            if (open > now) {
                return open;
            }
        }
        logger_->warn("No trading session within {} days of {}", kLookaheadDays, today.to_string());
        return now + std::chrono::hours(24);
    } catch (const std::exception& e) {
        logger_->warn("Calendar unavailable, next boundary check in {} min: {}",
                      kCalendarRetry.count(), e.what());
        return now + kCalendarRetry;
    }
}

} // namespace sentinel
