#include "brokerage_client.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace data {

namespace {

    // Numeric field that the gateway may send either as a number or as a string
    double numberField(const nlohmann::json& object, const std::string& key) {
        if (!object.contains(key) || object[key].is_null()) {
            throw core::ApiRequestException("Missing field '" + key + "' in brokerage response");
        }
        const auto& value = object[key];
        if (value.is_number()) return value.get<double>();
        if (value.is_string()) {
            try {
                return std::stod(value.get<std::string>());
            } catch (const std::exception& e) {
                throw core::ApiRequestException(fmt::format("Field '{}' is not numeric: {}", key, e.what()));
            }
        }
        throw core::ApiRequestException("Field '" + key + "' has an unexpected type");
    }

} // end anonymous namespace

core::AccountSnapshot parseAccountSummary(const std::string& body) {
    try {
        nlohmann::json json_response = nlohmann::json::parse(body);
        if (!json_response.is_object() || !json_response.contains("account") || !json_response["account"].is_object()) {
            throw core::ApiRequestException("Unexpected JSON structure: 'account' not found.");
        }
        const auto& account = json_response["account"];

        core::AccountSnapshot snapshot;
        snapshot.buying_power = numberField(account, "buyingPower");
        snapshot.gross_position_value = numberField(account, "grossPositionValue");
        snapshot.net_liquidation = account.contains("netLiquidation") ? numberField(account, "netLiquidation") : 0.0;
        return snapshot;
    } catch (const nlohmann::json::parse_error& e) {
        throw core::ApiRequestException(fmt::format("Failed to parse account summary: {}", e.what()));
    }
}

std::vector<core::Position> parsePositions(const std::string& body) {
    auto logger = core::logging::getLogger();
    try {
        nlohmann::json json_response = nlohmann::json::parse(body);
        if (!json_response.is_object() || !json_response.contains("positions") || !json_response["positions"].is_array()) {
            throw core::ApiRequestException("Unexpected JSON structure: 'positions' is not an array.");
        }

        std::vector<core::Position> positions;
        for (const auto& item : json_response["positions"]) {
            if (!item.is_object() || !item.contains("symbol") || !item["symbol"].is_string()) {
                logger->warn("Skipping malformed position entry: {}", item.dump());
                continue;
            }
            core::Position position;
            position.symbol = item["symbol"].get<std::string>();
            position.quantity = static_cast<long long>(std::llround(numberField(item, "position")));
            position.average_cost = item.contains("avgCost") ? numberField(item, "avgCost") : 0.0;
            if (position.quantity == 0) continue;
            positions.push_back(position);
        }
        return positions;
    } catch (const nlohmann::json::parse_error& e) {
        throw core::ApiRequestException(fmt::format("Failed to parse positions: {}", e.what()));
    }
}

std::string parseAccessToken(const std::string& body) {
    try {
        nlohmann::json json_response = nlohmann::json::parse(body);
        if (!json_response.is_object() || !json_response.contains("access_token") || !json_response["access_token"].is_string()) {
            throw core::AuthenticationException("Login response carries no access_token");
        }
        return json_response["access_token"].get<std::string>();
    } catch (const nlohmann::json::parse_error& e) {
        throw core::ApiRequestException(fmt::format("Failed to parse login response: {}", e.what()));
    }
}

RestBrokerageClient::RestBrokerageClient(std::string base_url, int timeout_ms)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms)
{
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    core::logging::getLogger()->debug("RestBrokerageClient created for {}", base_url_);
}

void RestBrokerageClient::authenticate(const std::string& username, const std::string& password) {
    auto logger = core::logging::getLogger();
    if (username.empty() || password.empty()) {
        throw core::AuthenticationException("Brokerage credentials are not set");
    }

    nlohmann::json body = {{"username", username}, {"password", password}};
    std::string full_url = base_url_ + "/api/auth/login";
    logger->debug("Authenticating against {}", full_url);

    cpr::Response response = cpr::Post(cpr::Url{full_url},
                                       cpr::Header{{"Content-Type", "application/json"},
                                                   {"Accept", "application/json"}},
                                       cpr::Body{body.dump()},
                                       cpr::Timeout{timeout_ms_});

    if (response.error) {
        throw core::ApiRequestException(fmt::format("Login request failed (CPR error): Code={}, Message='{}'",
                                                    static_cast<int>(response.error.code), response.error.message));
    }
    if (response.status_code == 401 || response.status_code == 403) {
        throw core::AuthenticationException(fmt::format("Login rejected with status {}", response.status_code));
    }
    if (response.status_code != 200) {
        throw core::ApiRequestException(fmt::format("Login failed: Status Code={}, Body='{}'",
                                                    response.status_code, response.text));
    }

    access_token_ = parseAccessToken(response.text);
    logger->info("Authenticated with brokerage gateway.");
}

std::string RestBrokerageClient::getJson(const std::string& endpoint) {
    auto logger = core::logging::getLogger();
    if (access_token_.empty()) {
        throw core::AuthenticationException("Not authenticated with brokerage gateway");
    }

    std::string full_url = base_url_ + endpoint;
    logger->debug("Requesting brokerage URL: {}", full_url);

    cpr::Header headers = {
        {"Accept", "application/json"},
        {"Authorization", "Bearer " + access_token_}
    };
    cpr::Response response = cpr::Get(cpr::Url{full_url}, headers, cpr::Timeout{timeout_ms_});

    logger->debug("Brokerage response status: {}, body size: {}", response.status_code, response.text.length());

    if (response.error) {
        throw core::ApiRequestException(fmt::format("Request to {} failed (CPR error): Code={}, Message='{}'",
                                                    endpoint, static_cast<int>(response.error.code),
                                                    response.error.message));
    }
    if (response.status_code == 401 || response.status_code == 403) {
        access_token_.clear();
        throw core::AuthenticationException(fmt::format("{} returned {}; token rejected", endpoint, response.status_code));
    }
    if (response.status_code != 200) {
        throw core::ApiRequestException(fmt::format("{} failed: Status Code={}, Body='{}'",
                                                    endpoint, response.status_code, response.text));
    }
    return response.text;
}

core::AccountSnapshot RestBrokerageClient::getAccountSummary() {
    core::AccountSnapshot snapshot = parseAccountSummary(getJson("/api/account-summary"));
    core::logging::getLogger()->info("Account: buying power ${:.2f}, gross positions ${:.2f}, net liquidation ${:.2f}",
                                     snapshot.buying_power, snapshot.gross_position_value, snapshot.net_liquidation);
    return snapshot;
}

std::vector<core::Position> RestBrokerageClient::getPositions() {
    std::vector<core::Position> positions = parsePositions(getJson("/api/positions"));
    core::logging::getLogger()->info("Loaded {} open positions.", positions.size());
    return positions;
}

} // namespace data
