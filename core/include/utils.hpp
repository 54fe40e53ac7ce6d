#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>
#include <ctime>

namespace core {
namespace utils {

    // Convert Timestamp to ISO 8601 string in UTC (e.g. 2025-11-12T21:00:00+00:00)
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601 string (with Z or +HH:MM offset) to Timestamp
    Timestamp stringToTimestamp(const std::string& iso_string);

    // --- Calendar helpers (proleptic Gregorian) ---

    // Parse "YYYY-MM-DD". Throws std::invalid_argument on malformed input.
    Date parseDate(const std::string& text);
    std::string dateToString(const Date& date);

    long long daysFromCivil(const Date& date);
    Date civilFromDays(long long days);
    Date addDays(const Date& date, int days);

    // 0 = Sunday ... 6 = Saturday
    int dayOfWeek(const Date& date);

    Date lastFridayOfMonth(const Date& date);
    Date lastFridayOfPreviousMonth(const Date& date);

    // End date used by the monthly rotation strategies: the last Friday of the
    // current month once it has passed, otherwise the last Friday of the previous month.
    Date monthlyRebalanceDate(const Date& today);

    // Most recent weekday strictly before `date`. Exchange holidays are not modelled.
    Date previousTradingDay(const Date& date);

    // --- US/Eastern wall clock (exchange time) ---

    bool isUsEasternDaylightTime(const Timestamp& ts);
    std::tm toUsEastern(const Timestamp& ts);
    Date usEasternDate(const Timestamp& ts);

    // Instant at which the US/Eastern wall clock reads `date hour:minute:second`
    Timestamp usEasternTimestamp(const Date& date, int hour, int minute, int second = 0);

    // `now` moved onto `date`, keeping its US/Eastern time of day
    Timestamp onUsEasternDate(const Timestamp& now, const Date& date);

    // "YYYY-MM-DDTHH:MM:SS" at hour:minute US/Eastern today, or tomorrow when
    // that time has already passed at `now`.
    std::string goodTillDate(const Timestamp& now, int hour, int minute);

} // namespace utils
} // namespace core
