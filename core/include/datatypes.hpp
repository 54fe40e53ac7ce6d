#pragma once // Use #pragma once for include guards (common practice)

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <map>    // For positions
#include <optional> // For nullable fields like open_interest

namespace core {

    // Using system_clock for time points, can be adjusted if needed
    using Timestamp = std::chrono::system_clock::time_point;


    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes
        std::optional<long long> open_interest; // Optional for non-futures/options

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Order instruction emitted by a strategy.
    // EnterLong/ExitLong are BUY/SELL, EnterShort/ExitShort are SELLSHORT/BUYTOCOVER.
    enum class SignalAction {
        None,
        EnterLong,
        ExitLong,
        EnterShort,
        ExitShort
    };

    enum class Side {
        Long,
        Short
    };

    // Aggregate holding reported by the brokerage. Not attributable to a strategy.
    struct Position {
        std::string symbol;
        long long quantity = 0; // Positive for long, negative for short
        double average_cost = 0.0;
    };

    // Account figures needed to size the capital pool
    struct AccountSnapshot {
        double buying_power = 0.0;
        double gross_position_value = 0.0;
        double net_liquidation = 0.0;
        std::vector<Position> positions;
    };

    // Calendar date without time of day (exchange local)
    struct Date {
        int year = 1970;
        int month = 1;
        int day = 1;

        bool operator==(const Date& other) const {
            return year == other.year && month == other.month && day == other.day;
        }
        bool operator!=(const Date& other) const { return !(*this == other); }
        bool operator<(const Date& other) const {
            if (year != other.year) return year < other.year;
            if (month != other.month) return month < other.month;
            return day < other.day;
        }
        bool operator<=(const Date& other) const { return !(other < *this); }
        bool operator>(const Date& other) const { return other < *this; }
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    std::string toString(SignalAction action);
    std::string toString(Side side);

} // namespace core
