#pragma once

#include "types.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace sentinel {

// Source of time for the control loop. Production uses SystemClock;
// tests and replays drive a ManualClock.
class Clock {
public:
    virtual ~Clock() = default;

    virtual Timestamp now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;

    // Blocks on cv until deadline or until pred() holds. Returns pred().
    virtual bool wait_until(std::unique_lock<std::mutex>& lock,
                            std::condition_variable& cv,
                            Timestamp deadline,
                            const std::function<bool()>& pred) = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
    void sleep_for(std::chrono::milliseconds duration) override;
    bool wait_until(std::unique_lock<std::mutex>& lock,
                    std::condition_variable& cv,
                    Timestamp deadline,
                    const std::function<bool()>& pred) override;
};

// Time only moves when advanced explicitly or when something sleeps.
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp{});

    Timestamp now() const override;
    void sleep_for(std::chrono::milliseconds duration) override;
    bool wait_until(std::unique_lock<std::mutex>& lock,
                    std::condition_variable& cv,
                    Timestamp deadline,
                    const std::function<bool()>& pred) override;

    void set(Timestamp t);
    void advance(std::chrono::milliseconds duration);

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

struct CivilDate {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;

    bool operator==(const CivilDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CivilDate& other) const { return !(*this == other); }
    bool operator<(const CivilDate& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }

    std::string to_string() const;
};

// Days since 1970-01-01 for a proleptic Gregorian date, and back.
long days_from_civil(const CivilDate& date);
CivilDate civil_from_days(long days);
// 0 = Sunday ... 6 = Saturday
unsigned weekday_of(const CivilDate& date);

std::optional<CivilDate> parse_date(const std::string& text);
// "HH:MM" to minutes after midnight
std::optional<int> parse_time_of_day(const std::string& text);

std::string format_timestamp(Timestamp t);
Timestamp make_utc(const CivilDate& date, int hour = 0, int minute = 0, int second = 0);

} // namespace sentinel
