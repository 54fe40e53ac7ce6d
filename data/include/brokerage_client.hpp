#pragma once

#include <string>
#include <vector>
#include "datatypes.hpp"

namespace data {

    // Read-only view of the brokerage account
    class IBrokerageClient {
    public:
        virtual ~IBrokerageClient() = default;

        // Throws core::AuthenticationException when the credentials are rejected
        virtual void authenticate(const std::string& username, const std::string& password) = 0;

        // Buying power, gross position value and net liquidation.
        // Throws core::ApiRequestException.
        virtual core::AccountSnapshot getAccountSummary() = 0;

        // Aggregate holdings, signed by side. Throws core::ApiRequestException.
        virtual std::vector<core::Position> getPositions() = 0;
    };

    // Response body parsers. Numeric fields may arrive as numbers or strings.
    // All throw core::ApiRequestException on malformed JSON or missing fields.

    // { "account": { "buyingPower", "grossPositionValue", "netLiquidation"? } }
    core::AccountSnapshot parseAccountSummary(const std::string& body);

    // { "positions": [ { "symbol", "position", "avgCost"? } ] }; flat entries dropped
    std::vector<core::Position> parsePositions(const std::string& body);

    // { "access_token": ... }; throws core::AuthenticationException when absent
    std::string parseAccessToken(const std::string& body);

    // JSON-over-HTTP gateway client:
    //   POST /api/auth/login       -> { "access_token": ... }
    //   GET  /api/account-summary  -> { "account": { "buyingPower", "grossPositionValue", "netLiquidation" } }
    //   GET  /api/positions        -> { "positions": [ { "symbol", "position", "avgCost" } ] }
    class RestBrokerageClient : public IBrokerageClient {
    public:
        explicit RestBrokerageClient(std::string base_url, int timeout_ms = 15000);

        void authenticate(const std::string& username, const std::string& password) override;
        core::AccountSnapshot getAccountSummary() override;
        std::vector<core::Position> getPositions() override;

        bool isAuthenticated() const { return !access_token_.empty(); }

    private:
        // GET with the bearer token; returns the response body
        std::string getJson(const std::string& endpoint);

        std::string base_url_;
        int timeout_ms_;
        std::string access_token_;
    };

} // namespace data
