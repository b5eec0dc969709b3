#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "settlement/claim_processor.hpp"
#include "pricing/pool_manager.hpp"

namespace settle {

class Engine;

namespace api {

struct ApiRequest {
    std::string method;                         // "GET", "POST", "PATCH"
    std::string target;                         // Path, optionally with a query string
    std::map<std::string, std::string> headers; // Lower-case names
    std::string body;

    std::string header(const std::string& name) const;
};

struct ApiResponse {
    int status{200};
    std::string content_type{"application/json"};
    std::string body;
};

// HTTP status for each error code
int http_status_for(ErrorCode code);

// {"error", "message", "category"} plus retryToken for settlement_pending
nlohmann::json error_body(const SettlementError& e);

nlohmann::json to_json(const Market& market);
nlohmann::json to_json(const PoolSnapshot& snapshot);
nlohmann::json to_json(const Bet& bet);
nlohmann::json to_json(const PayoutResult& result);
nlohmann::json to_json(const UnclaimedWinnings& winnings);

/**
 * Maps HTTP requests onto the engine. Transport-free so the whole surface
 * can be exercised without a socket; HttpServer only converts to and from
 * Beast messages.
 *
 * The requester is the X-User-Id header set by the authenticating gateway.
 * Every rejection is logged with its error code.
 */
class ApiRouter {
public:
    explicit ApiRouter(Engine& engine);

    ApiResponse handle(const ApiRequest& request);

private:
    Engine& engine_;

    ApiResponse dispatch(const ApiRequest& request, const std::vector<std::string>& path);

    ApiResponse health();
    ApiResponse metrics();
    ApiResponse create_market(const ApiRequest& request);
    ApiResponse get_market(const std::string& market_id);
    ApiResponse market_bets(const std::string& market_id);
    ApiResponse resolve_market(const ApiRequest& request, const std::string& market_id);
    ApiResponse place_bet(const ApiRequest& request);
    ApiResponse get_bet(const ApiRequest& request, const std::string& bet_id);
    ApiResponse claim(const ApiRequest& request, const std::string& bet_id);
    ApiResponse retry_claim(const ApiRequest& request, const std::string& bet_id);
    ApiResponse unclaimed(const ApiRequest& request, const std::string& user_id);
    ApiResponse user_bets(const ApiRequest& request, const std::string& user_id);

    // Throws ForbiddenError unless requester is user_id or an admin
    void require_self_or_admin(const std::string& requester, const std::string& user_id,
                               const std::string& what) const;

    // Throws UnauthenticatedError when X-User-Id is missing
    std::string require_user(const ApiRequest& request) const;
};

} // namespace api
} // namespace settle
