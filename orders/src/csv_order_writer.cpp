#include "csv_order_writer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <filesystem>
#include <fstream>
#include <map>
#include <utility>

namespace orders {

namespace {

    // Quote fields containing separators or quotes
    std::string csvField(const std::string& value) {
        if (value.find_first_of(",\"\n") == std::string::npos) return value;
        std::string quoted = "\"";
        for (char c : value) {
            if (c == '"') quoted += '"';
            quoted += c;
        }
        quoted += '"';
        return quoted;
    }

} // end anonymous namespace

CsvOrderWriter::CsvOrderWriter(std::string output_dir) : output_dir_(std::move(output_dir)) {}

const std::vector<std::string>& CsvOrderWriter::header() {
    static const std::vector<std::string> columns = {
        "Symbol", "Action", "Quantity", "OrderType", "LimitPrice", "StopPrice",
        "SecurityType", "Exchange", "Timezone", "TimeInForce", "GoodTillDate", "AttachMOC",
        "Strategy", "OutsideRTH", "AllOrNone", "Hidden", "DisplaySize", "DisplaySizeIsPercentage"
    };
    return columns;
}

std::string CsvOrderWriter::pathFor(const core::Date& date) const {
    std::filesystem::path path(output_dir_);
    path /= "daily_orders_" + core::utils::dateToString(date) + ".csv";
    return path.string();
}

std::string CsvOrderWriter::write(const std::vector<OrderRecord>& records, const core::Date& date) const {
    auto logger = core::logging::getLogger();
    std::string path = pathFor(date);

    try {
        if (!output_dir_.empty()) {
            std::filesystem::create_directories(output_dir_);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw core::OutputException(fmt::format("Cannot create output directory '{}': {}", output_dir_, e.what()));
    }

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw core::OutputException("Failed to open order file: " + path);
    }

    file << fmt::format("{}", fmt::join(header(), ",")) << '\n';
    for (const auto& r : records) {
        file << csvField(r.symbol) << ',' << r.action << ',' << r.quantity << ','
             << r.order_type << ',' << r.limit_price << ',' << r.stop_price << ','
             << r.security_type << ',' << r.exchange << ',' << r.timezone << ','
             << r.time_in_force << ',' << r.good_till_date << ',' << r.attach_moc << ','
             << csvField(r.strategy) << ',' << r.outside_rth << ',' << r.all_or_none << ','
             << r.hidden << ',' << r.display_size << ',' << r.display_size_is_percentage << '\n';
    }

    file.flush();
    if (!file.good()) {
        throw core::OutputException("Failed writing order file: " + path);
    }

    logger->info("Wrote {} orders to {}", records.size(), path);
    return path;
}

void CsvOrderWriter::logSummary(const std::vector<OrderRecord>& records) {
    auto logger = core::logging::getLogger();
    if (records.empty()) {
        logger->info("No orders generated.");
        return;
    }

    std::map<std::pair<std::string, std::string>, int> counts;
    for (const auto& r : records) {
        ++counts[{r.strategy, r.action}];
    }
    logger->info("Order summary ({} total):", records.size());
    for (const auto& [key, count] : counts) {
        logger->info("  {:<10} {:<10} {}", key.first, key.second, count);
    }
}

} // namespace orders
