#include "order_builder.hpp"
#include "price_utils.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace orders {

    std::string actionString(core::SignalAction action) {
        switch (action) {
            case core::SignalAction::EnterLong:  return "BUY";
            case core::SignalAction::ExitLong:   return "SELL";
            case core::SignalAction::EnterShort: return "SELLSHORT";
            case core::SignalAction::ExitShort:  return "BUYTOCOVER";
            case core::SignalAction::None:       break;
        }
        throw std::invalid_argument("No order action for signal " + core::toString(action));
    }

    std::string formatPrice(double price) {
        return fmt::format("{:.{}f}", price, indicators::tickDecimals(price));
    }

    std::optional<OrderRecord> OrderBuilder::build(const strategy_engine::StrategyConfig& config,
                                                   const strategy_engine::OrderIntent& intent) {
        auto logger = core::logging::getLogger();
        if (intent.action == core::SignalAction::None) {
            logger->warn("{}: dropping {} intent without an action", config.id, intent.symbol);
            return std::nullopt;
        }
        if (intent.quantity <= 0) {
            logger->warn("{}: dropping {} {} with quantity {}", config.id,
                         actionString(intent.action), intent.symbol, intent.quantity);
            return std::nullopt;
        }

        OrderRecord record;
        record.symbol = intent.symbol;
        record.action = actionString(intent.action);
        record.quantity = intent.quantity;
        record.order_type = strategy_engine::toString(intent.order_type);

        if (intent.order_type == strategy_engine::OrderType::Limit) {
            if (!std::isfinite(intent.limit_price) || intent.limit_price <= 0.0) {
                logger->warn("{}: dropping {} LIMIT {} with price {}", config.id, record.action,
                             intent.symbol, intent.limit_price);
                return std::nullopt;
            }
            record.limit_price = formatPrice(indicators::roundToTick(intent.limit_price));
        }

        record.security_type = config.security_type;
        record.exchange = config.exchange;
        record.time_in_force = strategy_engine::toString(intent.time_in_force);
        if (intent.time_in_force == strategy_engine::TimeInForce::Gtd) {
            record.good_till_date = intent.good_till_date;
        }
        record.attach_moc = intent.attach_moc ? "YES" : "NO";
        record.strategy = config.id;
        return record;
    }

    std::vector<OrderRecord> OrderBuilder::build(const strategy_engine::StrategyConfig& config,
                                                 const std::vector<strategy_engine::OrderIntent>& intents) {
        std::vector<OrderRecord> records;
        records.reserve(intents.size());
        for (const auto& intent : intents) {
            if (auto record = build(config, intent)) {
                records.push_back(std::move(*record));
            }
        }
        return records;
    }

    std::vector<OrderRecord> OrderBuilder::consolidate(const strategy_engine::EngineConfig& config,
                                                       const std::vector<strategy_engine::StrategyResult>& results) {
        auto logger = core::logging::getLogger();
        std::vector<OrderRecord> records;
        for (const auto& result : results) {
            if (!result.ok) {
                logger->warn("Strategy '{}' contributes no orders: {}", result.strategy, result.error);
                continue;
            }
            auto it = std::find_if(config.strategies.begin(), config.strategies.end(),
                                   [&result](const strategy_engine::StrategyConfig& c) { return c.id == result.strategy; });
            if (it == config.strategies.end()) {
                logger->error("No configuration for strategy '{}'; its {} intents are dropped.",
                              result.strategy, result.intents.size());
                continue;
            }
            auto built = build(*it, result.intents);
            records.insert(records.end(), built.begin(), built.end());
        }
        return records;
    }

} // namespace orders
