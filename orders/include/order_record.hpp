#pragma once

#include <string>

namespace orders {

    // One row of the consolidated order file. Field order matches the CSV columns.
    struct OrderRecord {
        std::string symbol;
        std::string action;          // BUY, SELL, SELLSHORT, BUYTOCOVER
        long long quantity = 0;
        std::string order_type;      // MARKET, LIMIT
        std::string limit_price;     // Formatted to the tick precision, empty for MARKET
        std::string stop_price;
        std::string security_type;   // STK, CFD
        std::string exchange;
        std::string timezone;
        std::string time_in_force;   // DAY, GTC, GTD
        std::string good_till_date;  // YYYY-MM-DDTHH:MM:SS, GTD only
        std::string attach_moc = "NO";
        std::string strategy;
        std::string outside_rth = "NO";
        std::string all_or_none = "NO";
        std::string hidden = "NO";
        std::string display_size = "0";
        std::string display_size_is_percentage = "NO";
    };

} // namespace orders
