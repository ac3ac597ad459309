#include "sentinel/clock.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace sentinel {

Timestamp SystemClock::now() const {
    return std::chrono::system_clock::now();
}

void SystemClock::sleep_for(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

bool SystemClock::wait_until(std::unique_lock<std::mutex>& lock,
                             std::condition_variable& cv,
                             Timestamp deadline,
                             const std::function<bool()>& pred) {
    return cv.wait_until(lock, deadline, pred);
}

ManualClock::ManualClock(Timestamp start) : now_(start) {}

Timestamp ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::sleep_for(std::chrono::milliseconds duration) {
    advance(duration);
}

bool ManualClock::wait_until(std::unique_lock<std::mutex>& lock,
                             std::condition_variable& cv,
                             Timestamp deadline,
                             const std::function<bool()>& pred) {
    (void)lock;
    (void)cv;
    if (pred()) {
        return true;
    }
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (deadline > now_) {
            now_ = deadline;
        }
    }
    return pred();
}

void ManualClock::set(Timestamp t) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = t;
}

void ManualClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += duration;
}

std::string CivilDate::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    return buf;
}

// Howard Hinnant's civil calendar algorithms.
long days_from_civil(const CivilDate& date) {
    int y = date.year - (date.month <= 2 ? 1 : 0);
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned mp = date.month > 2 ? date.month - 3 : date.month + 9;
    const unsigned doy = (153 * mp + 2) / 5 + date.day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

CivilDate civil_from_days(long days) {
    days += 719468;
    const long era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long y = static_cast<long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

unsigned weekday_of(const CivilDate& date) {
    long z = days_from_civil(date);
    return static_cast<unsigned>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
}

std::optional<CivilDate> parse_date(const std::string& text) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    char tail = 0;
    if (std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return std::nullopt;
    }
    CivilDate date{y, m, d};
    // Reject dates like 2025-02-30 that normalise to another day.
    if (civil_from_days(days_from_civil(date)) != date) {
        return std::nullopt;
    }
    return date;
}

std::optional<int> parse_time_of_day(const std::string& text) {
    int h = -1;
    int m = -1;
    char tail = 0;
    if (std::sscanf(text.c_str(), "%2d:%2d%c", &h, &m, &tail) != 2) {
        return std::nullopt;
    }
    if (h < 0 || h > 23 || m < 0 || m > 59) {
        return std::nullopt;
    }
    return h * 60 + m;
}

std::string format_timestamp(Timestamp t) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(t);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(t - secs).count();
    if (millis < 0) {
        millis += 1000;
        secs -= std::chrono::seconds(1);
    }
    std::time_t tt = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

Timestamp make_utc(const CivilDate& date, int hour, int minute, int second) {
    auto days = std::chrono::hours(24) * days_from_civil(date);
    return Timestamp{} + days + std::chrono::hours(hour) + std::chrono::minutes(minute) +
           std::chrono::seconds(second);
}

} // namespace sentinel
