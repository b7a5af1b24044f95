#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include "ledger_core/contracts/types.h"

namespace ledger_core {

constexpr EpochNanos kNanosPerSecond = 1'000'000'000;
constexpr EpochNanos kNanosPerDay = 86'400 * kNanosPerSecond;

class Timestamp {
public:
    Timestamp() = default;
    explicit Timestamp(EpochNanos ns) : ns_(ns) {}

    static std::optional<Timestamp> FromSql(const std::string& text) {
        std::tm tm = {};
        tm.tm_isdst = 0;

        std::istringstream iss_datetime(text);
        iss_datetime >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (iss_datetime.fail()) {
            tm = {};
            std::istringstream iss_date(text);
            iss_date >> std::get_time(&tm, "%Y-%m-%d");
            if (iss_date.fail()) {
                return std::nullopt;
            }
            tm.tm_hour = 0;
            tm.tm_min = 0;
            tm.tm_sec = 0;
        }

        const std::time_t seconds = timegm(&tm);
        if (seconds < 0) {
            return std::nullopt;
        }
        return Timestamp(static_cast<EpochNanos>(seconds) * kNanosPerSecond);
    }

    static Timestamp Now() {
        const auto now = std::chrono::time_point_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now());
        return Timestamp(now.time_since_epoch().count());
    }

    std::string ToSql() const {
        const auto seconds = static_cast<std::time_t>(ns_ / kNanosPerSecond);
        std::tm tm = {};
        gmtime_r(&seconds, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    EpochNanos ToEpochNanos() const { return ns_; }

    bool operator>(const Timestamp& other) const { return ns_ > other.ns_; }
    bool operator<(const Timestamp& other) const { return ns_ < other.ns_; }
    bool operator>=(const Timestamp& other) const { return ns_ >= other.ns_; }
    bool operator<=(const Timestamp& other) const { return ns_ <= other.ns_; }
    bool operator==(const Timestamp& other) const { return ns_ == other.ns_; }
    bool operator!=(const Timestamp& other) const { return ns_ != other.ns_; }

private:
    EpochNanos ns_{0};
};

inline EpochNanos ResolveNow(const NowFn& now) {
    return now ? now() : Timestamp::Now().ToEpochNanos();
}

inline bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

inline int DaysInMonth(int year, int month) {
    static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

// UTC calendar date used for posting dates and fiscal period boundaries.
struct CivilDate {
    int year{1970};
    int month{1};
    int day{1};

    bool IsValid() const {
        return year >= 1 && year <= 9999 && month >= 1 && month <= 12 && day >= 1 &&
               day <= DaysInMonth(year, month);
    }

    std::string ToString() const {
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
        return buffer;
    }

    static std::optional<CivilDate> Parse(const std::string& text) {
        CivilDate date;
        char dash1 = 0;
        char dash2 = 0;
        std::istringstream iss(text);
        iss >> date.year >> dash1 >> date.month >> dash2 >> date.day;
        if (iss.fail() || dash1 != '-' || dash2 != '-' || !iss.eof() || !date.IsValid()) {
            return std::nullopt;
        }
        return date;
    }

    int Compare(const CivilDate& other) const {
        if (year != other.year) {
            return year < other.year ? -1 : 1;
        }
        if (month != other.month) {
            return month < other.month ? -1 : 1;
        }
        if (day != other.day) {
            return day < other.day ? -1 : 1;
        }
        return 0;
    }

    bool operator==(const CivilDate& other) const { return Compare(other) == 0; }
    bool operator!=(const CivilDate& other) const { return Compare(other) != 0; }
    bool operator<(const CivilDate& other) const { return Compare(other) < 0; }
    bool operator<=(const CivilDate& other) const { return Compare(other) <= 0; }
    bool operator>(const CivilDate& other) const { return Compare(other) > 0; }
    bool operator>=(const CivilDate& other) const { return Compare(other) >= 0; }
};

inline CivilDate FirstDayOfMonth(int year, int month) {
    return CivilDate{year, month, 1};
}

inline CivilDate LastDayOfMonth(int year, int month) {
    return CivilDate{year, month, DaysInMonth(year, month)};
}

// Moves by whole months, clamping the day to the target month length.
inline CivilDate AddMonths(const CivilDate& date, int months) {
    const int zero_based = date.year * 12 + (date.month - 1) + months;
    CivilDate out;
    out.year = zero_based / 12;
    out.month = zero_based % 12 + 1;
    out.day = std::min(date.day, DaysInMonth(out.year, out.month));
    return out;
}

// Days-from-civil conversion (proleptic Gregorian, UTC).
inline std::int64_t DaysFromCivil(const CivilDate& date) {
    int y = date.year;
    const int m = date.month;
    const int d = date.day;
    y -= m <= 2 ? 1 : 0;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const int yoe = y - era * 400;
    const int doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<std::int64_t>(era) * 146097 + doe - 719468;
}

inline CivilDate CivilFromDays(std::int64_t days) {
    days += 719468;
    const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const auto doe = static_cast<int>(days - era * 146097);
    const int yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int mp = (5 * doy + 2) / 153;
    CivilDate out;
    out.day = doy - (153 * mp + 2) / 5 + 1;
    out.month = mp < 10 ? mp + 3 : mp - 9;
    out.year = static_cast<int>(yoe + era * 400) + (out.month <= 2 ? 1 : 0);
    return out;
}

inline CivilDate ToCivilDate(EpochNanos ns) {
    std::int64_t days = ns / kNanosPerDay;
    if (ns % kNanosPerDay < 0) {
        --days;
    }
    return CivilFromDays(days);
}

inline EpochNanos StartOfDayNanos(const CivilDate& date) {
    return DaysFromCivil(date) * kNanosPerDay;
}

inline const char* MonthAbbreviation(int month) {
    static constexpr const char* kNames[12] = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    if (month < 1 || month > 12) {
        return "???";
    }
    return kNames[month - 1];
}

}  // namespace ledger_core
