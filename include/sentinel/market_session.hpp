#pragma once

#include "clock.hpp"
#include "config.hpp"

#include <memory>
#include <optional>
#include <spdlog/spdlog.h>

namespace sentinel {

// Regular trading hours for one exchange date, minutes after local midnight.
struct SessionHours {
    int open_minute = 0;
    int close_minute = 0;
};

class CalendarSource {
public:
    virtual ~CalendarSource() = default;

    // nullopt when the exchange is closed all day. Throws when the calendar
    // data cannot be obtained.
    virtual std::optional<SessionHours> session_for(const CivilDate& date) const = 0;
};

// Weekends, configured holidays and early closes.
class StaticCalendar : public CalendarSource {
public:
    explicit StaticCalendar(MarketSessionConfig config);

    std::optional<SessionHours> session_for(const CivilDate& date) const override;

private:
    MarketSessionConfig config_;
};

class MarketSessionOracle {
public:
    MarketSessionOracle(std::shared_ptr<const CalendarSource> calendar, const MarketSessionConfig& config);

    // Fails closed: returns false when the calendar is unavailable.
    bool is_market_open(Timestamp now) const;

    // Close of the current session when open, otherwise the next open. When
    // the calendar is unavailable returns a short retry horizon instead.
    Timestamp next_boundary(Timestamp now) const;

    // Exchange-local calendar date of now.
    CivilDate session_date(Timestamp now) const;

    static constexpr std::chrono::minutes kCalendarRetry{15};
    static constexpr int kLookaheadDays = 14;

private:
    std::shared_ptr<const CalendarSource> calendar_;
    int utc_offset_std_;
    bool observe_us_dst_;
    std::shared_ptr<spdlog::logger> logger_;

    Timestamp to_local(Timestamp utc) const;
    Timestamp local_to_utc(const CivilDate& date, int minute) const;
    bool dst_in_effect(Timestamp utc) const;
};

} // namespace sentinel
