// cli/src/main.cpp

// Standard includes
#include <string>
#include <vector>
#include <map>
#include <exception>
#include <chrono>
#include <cstdlib>     // Needed for std::getenv
#include <memory>

// Project includes
#include "logging.hpp"
#include "exceptions.hpp"
#include "datatypes.hpp"
#include "utils.hpp"
#include "indicators.hpp"
#include "engine_config.hpp"
#include "strategy_factory.hpp"
#include "capital_allocator.hpp"
#include "signal_engine.hpp"
#include "sqlite_market_data_provider.hpp"
#include "brokerage_client.hpp"
#include "order_builder.hpp"
#include "csv_order_writer.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

namespace {

    struct CliOptions {
        std::string config_path = "config/strategies.json";
        std::string output_dir;   // Empty: use the configured directory
        std::string date;         // Empty: today in US/Eastern
        bool dry_run = false;
        bool show_help = false;
    };

    void printUsage(const char* program) {
        spdlog::info("Usage: {} [--config <path>] [--output-dir <dir>] [--date YYYY-MM-DD] [--dry-run]", program);
    }

    // Throws core::ConfigException on unknown or incomplete arguments
    CliOptions parseArguments(int argc, char* argv[]) {
        CliOptions options;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto nextValue = [&](const std::string& flag) -> std::string {
                if (i + 1 >= argc) throw core::ConfigException("Missing value for " + flag);
                return argv[++i];
            };

            if (arg == "--config") options.config_path = nextValue(arg);
            else if (arg == "--output-dir") options.output_dir = nextValue(arg);
            else if (arg == "--date") options.date = nextValue(arg);
            else if (arg == "--dry-run") options.dry_run = true;
            else if (arg == "--help" || arg == "-h") options.show_help = true;
            else throw core::ConfigException("Unknown argument: " + arg);
        }
        return options;
    }

    std::string envOr(const char* name, const std::string& fallback) {
        const char* value = std::getenv(name);
        return (value && *value) ? std::string(value) : fallback;
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    // Define logger pointer early in the main scope
    std::shared_ptr<spdlog::logger> logger = nullptr;
    std::string stage = "startup";

    try {
        // --- Initialize Logging ---
        core::logging::LogSettings log_settings;
        log_settings.directory = envOr("SIGNAL_LOG_DIR", "logs");
        core::logging::initialize(log_settings);
        logger = core::logging::getLogger();
        logger->info("Signal generator starting...");

        // --- Configuration ---
        stage = "config";
        CliOptions options = parseArguments(argc, argv);
        if (options.show_help) {
            printUsage(argv[0]);
            return 0;
        }

        strategy_engine::EngineConfig config = strategy_engine::loadEngineConfig(options.config_path);
        if (!options.output_dir.empty()) config.output_dir = options.output_dir;

        core::Timestamp now = std::chrono::system_clock::now();
        core::Date today;
        try {
            today = options.date.empty() ? core::utils::usEasternDate(now) : core::utils::parseDate(options.date);
        } catch (const std::invalid_argument& e) {
            throw core::ConfigException(e.what());
        }
        // A replayed date keeps the current time of day so GTD expiry lands on that date
        if (!options.date.empty()) now = core::utils::onUsEasternDate(now, today);
        logger->info("Evaluation date: {}{}", core::utils::dateToString(today), options.dry_run ? " (dry run)" : "");

        auto strategies = strategy_engine::StrategyFactory::createStrategies(config);
        indicators::initialize();

        // --- Brokerage ---
        stage = "auth";
        data::RestBrokerageClient brokerage(envOr("IB_API_URL", config.brokerage_url));
        brokerage.authenticate(envOr("IB_USERNAME", ""), envOr("IB_PASSWORD", ""));

        stage = "account";
        core::AccountSnapshot account = brokerage.getAccountSummary();
        account.positions = brokerage.getPositions();

        // --- Capital ---
        stage = "allocation";
        strategy_engine::CapitalAllocator allocator(config.safety_buffer);
        std::vector<std::pair<std::string, double>> fractions;
        for (const auto& strategy_config : config.strategies) {
            fractions.emplace_back(strategy_config.id, strategy_config.allocation);
        }
        std::map<std::string, double> budgets;
        for (const auto& budget : allocator.allocate(account, fractions)) {
            budgets[budget.strategy] = budget.allocated;
            logger->info("Budget {:<10} ${:.2f}", budget.strategy, budget.allocated);
        }

        // --- Market data ---
        stage = "data";
        data::SqliteMarketDataProvider provider(config.database_path);
        try {
            provider.checkFreshness(config.freshness_symbol, today);
        } catch (const core::DataUnavailableException& e) {
            logger->warn("{}", e.what());
        }

        // --- Strategies ---
        stage = "strategies";
        strategy_engine::SignalEngine engine(config, provider);
        auto results = engine.run(strategies, budgets, account.positions, now, today);

        // --- Output ---
        stage = "output";
        auto records = orders::OrderBuilder::consolidate(config, results);
        orders::CsvOrderWriter::logSummary(records);

        if (options.dry_run) {
            for (const auto& r : records) {
                logger->info("[dry-run] {} {} {} {} {} {} {}", r.strategy, r.action, r.quantity, r.symbol,
                             r.order_type, r.limit_price, r.time_in_force);
            }
        } else {
            orders::CsvOrderWriter writer(config.output_dir);
            writer.write(records, today);
        }

        indicators::shutdown();
        logger->info("Signal generator finished successfully.");

    } catch (const core::SignalGeneratorException& e) {
        if (logger) logger->critical("Stage '{}' failed: {}", stage, e.what());
        else spdlog::critical("Stage '{}' failed: {}", stage, e.what());
        return 1;
    } catch (const std::exception& e) {
        if (logger) logger->critical("Stage '{}' failed with unexpected error: {}", stage, e.what());
        else spdlog::critical("Stage '{}' failed with unexpected error: {}", stage, e.what());
        return 1;
    }

    spdlog::shutdown();
    return 0;
}
