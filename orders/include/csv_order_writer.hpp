#pragma once

#include "order_record.hpp"
#include "datatypes.hpp"
#include <string>
#include <vector>

namespace orders {

    // Writes the consolidated order batch as CSV
    class CsvOrderWriter {
    public:
        explicit CsvOrderWriter(std::string output_dir);

        // <output_dir>/daily_orders_<YYYY-MM-DD>.csv
        std::string pathFor(const core::Date& date) const;

        // Overwrites the day's file. No records gives a header-only file.
        // Returns the path written. Throws core::OutputException.
        std::string write(const std::vector<OrderRecord>& records, const core::Date& date) const;

        static const std::vector<std::string>& header();

        // Per-strategy, per-action counts at info level
        static void logSummary(const std::vector<OrderRecord>& records);

    private:
        std::string output_dir_;
    };

} // namespace orders
