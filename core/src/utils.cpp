#include "utils.hpp"
#include <iomanip> // For std::put_time, std::get_time
#include <sstream> // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow
#include <cctype>
#include <chrono>

namespace core {

    std::string toString(SignalAction action) {
        switch (action) {
            case SignalAction::None:       return "None";
            case SignalAction::EnterLong:  return "EnterLong";
            case SignalAction::ExitLong:   return "ExitLong";
            case SignalAction::EnterShort: return "EnterShort";
            case SignalAction::ExitShort:  return "ExitShort";
        }
        return "UnknownAction";
    }

    std::string toString(Side side) {
        return side == Side::Long ? "long" : "short";
    }

namespace utils {

    namespace {
        constexpr long long kSecondsPerDay = 86400;

        long long toEpochSeconds(const Timestamp& ts) {
            return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
        }

        // Floor division so that instants before the epoch map to the right day
        long long floorDiv(long long a, long long b) {
            long long q = a / b;
            if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
            return q;
        }

        Date nthSundayOf(int year, int month, int nth) {
            Date first{year, month, 1};
            int wd = dayOfWeek(first);
            int first_sunday = 1 + (7 - wd) % 7;
            return Date{year, month, first_sunday + 7 * (nth - 1)};
        }
    } // end anonymous namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, digits.length());
            }
        }

        // 3. Timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration = std::chrono::seconds(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                     throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        } else {
             throw std::runtime_error("Timestamp missing or invalid timezone offset/indicator: " + iso_string);
        }

        // 4. Interpret the broken-down time as UTC, then remove the offset
        Date date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
        long long seconds = daysFromCivil(date) * kSecondsPerDay
                          + tm.tm_hour * 3600LL + tm.tm_min * 60LL + tm.tm_sec;

        Timestamp base_tp_utc{std::chrono::seconds(seconds)};
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        long long seconds = toEpochSeconds(ts);
        long long days = floorDiv(seconds, kSecondsPerDay);
        long long secs_of_day = seconds - days * kSecondsPerDay;
        Date date = civilFromDays(days);

        std::ostringstream oss;
        oss << dateToString(date) << 'T'
            << std::setfill('0') << std::setw(2) << secs_of_day / 3600 << ':'
            << std::setw(2) << (secs_of_day % 3600) / 60 << ':'
            << std::setw(2) << secs_of_day % 60 << "+00:00";
        return oss.str();
    }

    Date parseDate(const std::string& text) {
        Date date;
        char dash1 = 0;
        char dash2 = 0;
        std::istringstream ss(text);
        if (!(ss >> date.year >> dash1 >> date.month >> dash2 >> date.day) || dash1 != '-' || dash2 != '-') {
            throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + text);
        }
        if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
            throw std::invalid_argument("Date out of range: " + text);
        }
        return date;
    }

    std::string dateToString(const Date& date) {
        std::ostringstream oss;
        oss << std::setfill('0') << std::setw(4) << date.year << '-'
            << std::setw(2) << date.month << '-' << std::setw(2) << date.day;
        return oss.str();
    }

    // Days since 1970-01-01 (H. Hinnant's civil calendar algorithm)
    long long daysFromCivil(const Date& date) {
        long long y = date.year;
        const unsigned m = static_cast<unsigned>(date.month);
        const unsigned d = static_cast<unsigned>(date.day);
        y -= m <= 2;
        const long long era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<long long>(doe) - 719468;
    }

    Date civilFromDays(long long days) {
        days += 719468;
        const long long era = (days >= 0 ? days : days - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(days - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const long long y = static_cast<long long>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        const unsigned d = doy - (153 * mp + 2) / 5 + 1;
        const unsigned m = mp < 10 ? mp + 3 : mp - 9;
        return Date{static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
    }

    Date addDays(const Date& date, int days) {
        return civilFromDays(daysFromCivil(date) + days);
    }

    int dayOfWeek(const Date& date) {
        long long z = daysFromCivil(date);
        return static_cast<int>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
    }

    Date lastFridayOfMonth(const Date& date) {
        Date first_of_next = date.month == 12 ? Date{date.year + 1, 1, 1}
                                              : Date{date.year, date.month + 1, 1};
        Date candidate = addDays(first_of_next, -1);
        while (dayOfWeek(candidate) != 5) {
            candidate = addDays(candidate, -1);
        }
        return candidate;
    }

    Date lastFridayOfPreviousMonth(const Date& date) {
        Date candidate = addDays(Date{date.year, date.month, 1}, -1);
        while (dayOfWeek(candidate) != 5) {
            candidate = addDays(candidate, -1);
        }
        return candidate;
    }

    Date monthlyRebalanceDate(const Date& today) {
        Date current = lastFridayOfMonth(today);
        if (today > current) {
            return current;
        }
        return lastFridayOfPreviousMonth(today);
    }

    Date previousTradingDay(const Date& date) {
        Date candidate = addDays(date, -1);
        while (dayOfWeek(candidate) == 0 || dayOfWeek(candidate) == 6) {
            candidate = addDays(candidate, -1);
        }
        return candidate;
    }

    // DST runs from the second Sunday of March 02:00 EST (07:00Z)
    // to the first Sunday of November 02:00 EDT (06:00Z).
    bool isUsEasternDaylightTime(const Timestamp& ts) {
        long long seconds = toEpochSeconds(ts);
        int year = civilFromDays(floorDiv(seconds, kSecondsPerDay)).year;
        long long dst_start = daysFromCivil(nthSundayOf(year, 3, 2)) * kSecondsPerDay + 7 * 3600;
        long long dst_end = daysFromCivil(nthSundayOf(year, 11, 1)) * kSecondsPerDay + 6 * 3600;
        return seconds >= dst_start && seconds < dst_end;
    }

    std::tm toUsEastern(const Timestamp& ts) {
        long long offset = isUsEasternDaylightTime(ts) ? -4 * 3600 : -5 * 3600;
        long long local = toEpochSeconds(ts) + offset;
        long long days = floorDiv(local, kSecondsPerDay);
        long long secs_of_day = local - days * kSecondsPerDay;
        Date date = civilFromDays(days);

        std::tm out = {};
        out.tm_year = date.year - 1900;
        out.tm_mon = date.month - 1;
        out.tm_mday = date.day;
        out.tm_hour = static_cast<int>(secs_of_day / 3600);
        out.tm_min = static_cast<int>((secs_of_day % 3600) / 60);
        out.tm_sec = static_cast<int>(secs_of_day % 60);
        out.tm_wday = dayOfWeek(date);
        return out;
    }

    Date usEasternDate(const Timestamp& ts) {
        std::tm local = toUsEastern(ts);
        return Date{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
    }

    Timestamp usEasternTimestamp(const Date& date, int hour, int minute, int second) {
        long long wall = daysFromCivil(date) * kSecondsPerDay + hour * 3600LL + minute * 60LL + second;
        Timestamp standard{std::chrono::seconds(wall + 5 * 3600)};
        if (!isUsEasternDaylightTime(standard)) {
            return standard;
        }
        return Timestamp{std::chrono::seconds(wall + 4 * 3600)};
    }

    Timestamp onUsEasternDate(const Timestamp& now, const Date& date) {
        std::tm local = toUsEastern(now);
        return usEasternTimestamp(date, local.tm_hour, local.tm_min, local.tm_sec);
    }

    std::string goodTillDate(const Timestamp& now, int hour, int minute) {
        std::tm local = toUsEastern(now);
        Date date{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};

        int now_seconds = local.tm_hour * 3600 + local.tm_min * 60 + local.tm_sec;
        int target_seconds = hour * 3600 + minute * 60;
        if (now_seconds > target_seconds) {
            date = addDays(date, 1);
        }

        std::ostringstream oss;
        oss << dateToString(date) << 'T'
            << std::setfill('0') << std::setw(2) << hour << ':'
            << std::setw(2) << minute << ":00";
        return oss.str();
    }

} // namespace utils
} // namespace core
