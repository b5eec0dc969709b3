#include "api/api_router.hpp"
#include "core/engine.hpp"
#include "pricing/pool_manager.hpp"
#include "utils/metrics.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace settle {
namespace api {

using json = nlohmann::json;

namespace {

std::vector<std::string> split_path(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

json parse_body(const ApiRequest& request) {
    if (request.body.empty()) {
        return json::object();
    }
    json body = json::parse(request.body);
    if (!body.is_object()) {
        throw InvalidRequestError("Request body must be a JSON object");
    }
    return body;
}

// JSON integers above INT64_MAX are stored unsigned and would wrap on get<int64_t>()
bool fits_int64(const json& value) {
    return !value.is_number_unsigned() ||
           value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
}

// Decimal string, or a JSON number in whole units
Amount amount_from(const json& value, const std::string& field) {
    if (value.is_string()) {
        return Amount::parse(value.get<std::string>());
    }
    if (value.is_number_integer()) {
        if (!fits_int64(value)) {
            throw InvalidAmountError(field + " out of range");
        }
        return Amount::from_units(value.get<int64_t>());
    }
    if (value.is_number_float()) {
        return Amount::from_double(value.get<double>());
    }
    throw InvalidAmountError(field + " must be a decimal string or number");
}

std::optional<int64_t> optional_int(const json& body, const std::string& field) {
    if (!body.contains(field) || body[field].is_null()) {
        return std::nullopt;
    }
    if (!body[field].is_number_integer() || !fits_int64(body[field])) {
        throw InvalidRequestError(field + " must be an integer in int64 range");
    }
    return body[field].get<int64_t>();
}

std::string required_string(const json& body, const std::string& field) {
    if (!body.contains(field) || !body[field].is_string() || body[field].get<std::string>().empty()) {
        throw InvalidRequestError(field + " is required");
    }
    return body[field].get<std::string>();
}

ApiResponse json_response(int status, const json& body) {
    ApiResponse res;
    res.status = status;
    res.body = body.dump();
    return res;
}

ApiResponse route_not_found(const ApiRequest& request) {
    spdlog::warn("No route for {} {}", request.method, request.target);
    return json_response(404, {{"error", "route_not_found"},
                               {"message", "No route for " + request.method + " " + request.target},
                               {"category", "not_found"}});
}

} // namespace

std::string ApiRequest::header(const std::string& name) const {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = headers.find(key);
    return it == headers.end() ? "" : it->second;
}

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_AMOUNT:
        case ErrorCode::INVALID_REQUEST:
        case ErrorCode::AMOUNT_TOO_SMALL:
            return 400;
        case ErrorCode::UNAUTHENTICATED:
            return 401;
        case ErrorCode::INSUFFICIENT_FUNDS:
            return 402;
        case ErrorCode::MARKET_CLOSED:
        case ErrorCode::FORBIDDEN:
            return 403;
        case ErrorCode::MARKET_NOT_FOUND:
        case ErrorCode::BET_NOT_FOUND:
            return 404;
        case ErrorCode::ALREADY_RESOLVED:
        case ErrorCode::NOT_RESOLVED:
        case ErrorCode::ALREADY_CLAIMED:
        case ErrorCode::POOL_CONFLICT:
            return 409;
        case ErrorCode::SETTLEMENT_PENDING:
        case ErrorCode::WALLET_UNAVAILABLE:
            return 503;
        case ErrorCode::STORAGE:
            return 500;
    }
    return 500;
}

json error_body(const SettlementError& e) {
    json body = {
        {"error", to_string(e.code())},
        {"message", e.what()},
        {"category", to_string(e.category())}
    };
    if (auto pending = dynamic_cast<const SettlementPendingError*>(&e)) {
        body["retryToken"] = pending->retry_token();
    }
    return body;
}

// ============================================================================
// JSON VIEWS
// ============================================================================

json to_json(const Market& m) {
    json j = {
        {"marketId", m.market_id},
        {"title", m.title},
        {"categoryId", m.category_id},
        {"creatorId", m.creator_id},
        {"status", to_string(m.status)},
        {"outcome", m.outcome ? json(to_string(*m.outcome)) : json(nullptr)},
        {"yesPool", m.yes_pool.to_string()},
        {"noPool", m.no_pool.to_string()},
        {"seedLiquidity", m.seed_liquidity.to_string()},
        {"totalVolume", m.total_volume.to_string()},
        {"betCount", m.bet_count},
        {"yesPrice", price_for(m.yes_pool, m.no_pool, Side::YES).to_string()},
        {"noPrice", price_for(m.yes_pool, m.no_pool, Side::NO).to_string()},
        {"endDate", time_utils::to_iso8601(m.end_date)},
        {"createdAt", time_utils::to_iso8601(m.created_at)},
        {"platformFeeBps", m.platform_fee_bps ? json(*m.platform_fee_bps) : json(nullptr)},
        {"creatorFeeBps", m.creator_fee_bps ? json(*m.creator_fee_bps) : json(nullptr)}
    };
    if (m.status == MarketStatus::RESOLVED) {
        j["resolvedAt"] = time_utils::to_iso8601(m.resolved_at);
        j["resolutionNote"] = m.resolution_note;
    }
    return j;
}

json to_json(const PoolSnapshot& snap) {
    json j = to_json(snap.market);
    j["yesPrice"] = snap.yes_price.to_string();
    j["noPrice"] = snap.no_price.to_string();
    return j;
}

json to_json(const Bet& b) {
    return {
        {"betId", b.bet_id},
        {"marketId", b.market_id},
        {"userId", b.user_id},
        {"side", to_string(b.side)},
        {"grossAmount", b.gross_amount.to_string()},
        {"platformFee", b.platform_fee.to_string()},
        {"creatorFee", b.creator_fee.to_string()},
        {"netStake", b.net_stake.to_string()},
        {"price", b.price.to_string()},
        {"createdAt", time_utils::to_iso8601(b.created_at)},
        {"resolved", b.resolved},
        {"payout", b.payout ? json(b.payout->to_string()) : json(nullptr)},
        {"claimed", b.claimed},
        {"claimedAt", b.claimed ? json(time_utils::to_iso8601(b.claimed_at)) : json(nullptr)},
        {"payoutStatus", to_string(b.payout_status)}
    };
}

namespace {

json bets_json(const std::vector<Bet>& bets) {
    json list = json::array();
    for (const auto& b : bets) {
        list.push_back(to_json(b));
    }
    return list;
}

} // namespace

json to_json(const PayoutResult& r) {
    return {
        {"betId", r.bet_id},
        {"marketId", r.market_id},
        {"userId", r.user_id},
        {"won", r.won},
        {"payout", r.payout.to_string()},
        {"transferStatus", to_string(r.transfer_status)},
        {"idempotencyKey", r.idempotency_key}
    };
}

json to_json(const UnclaimedWinnings& w) {
    json bets = json::array();
    for (const auto& entry : w.bets) {
        json b = to_json(entry.bet);
        b["expectedPayout"] = entry.payout.to_string();
        bets.push_back(std::move(b));
    }
    return {
        {"userId", w.user_id},
        {"total", w.total.to_string()},
        {"bets", std::move(bets)}
    };
}

// ============================================================================
// ROUTER
// ============================================================================

ApiRouter::ApiRouter(Engine& engine)
    : engine_(engine)
{
}

ApiResponse ApiRouter::handle(const ApiRequest& request) {
    ScopedLatency latency(SETTLE_HISTOGRAM("api_request"));
    SETTLE_COUNTER("api_requests").increment();

    try {
        return dispatch(request, split_path(request.target));
    } catch (const SettlementError& e) {
        SETTLE_COUNTER("api_rejections").increment();
        if (e.category() == ErrorCategory::DEPENDENCY || e.category() == ErrorCategory::INTERNAL) {
            spdlog::error("{} {} failed [{}]: {}", request.method, request.target,
                          to_string(e.code()), e.what());
        } else {
            spdlog::warn("{} {} rejected [{}]: {}", request.method, request.target,
                         to_string(e.code()), e.what());
        }
        return json_response(http_status_for(e.code()), error_body(e));
    } catch (const json::exception& e) {
        SETTLE_COUNTER("api_rejections").increment();
        InvalidRequestError invalid(std::string("Malformed JSON: ") + e.what());
        spdlog::warn("{} {} rejected [invalid_request]: {}", request.method, request.target, e.what());
        return json_response(400, error_body(invalid));
    } catch (const std::exception& e) {
        SETTLE_COUNTER("api_errors").increment();
        spdlog::error("{} {} internal error: {}", request.method, request.target, e.what());
        return json_response(500, {{"error", "internal"}, {"message", e.what()}, {"category", "internal"}});
    }
}

ApiResponse ApiRouter::dispatch(const ApiRequest& request, const std::vector<std::string>& path) {
    const std::string& method = request.method;

    if (path.size() == 1 && path[0] == "health" && method == "GET") {
        return health();
    }
    if (path.size() == 1 && path[0] == "metrics" && method == "GET") {
        return metrics();
    }

    if (!path.empty() && path[0] == "markets") {
        if (path.size() == 1 && method == "POST") return create_market(request);
        if (path.size() == 2 && method == "GET") return get_market(path[1]);
        if (path.size() == 3 && path[2] == "bets" && method == "GET") return market_bets(path[1]);
        if (path.size() == 3 && path[2] == "resolve" && method == "PATCH") {
            return resolve_market(request, path[1]);
        }
    }

    if (!path.empty() && path[0] == "bets") {
        if (path.size() == 1 && method == "POST") return place_bet(request);
        if (path.size() == 2 && method == "GET") return get_bet(request, path[1]);
    }

    if (!path.empty() && path[0] == "claims" && method == "POST") {
        if (path.size() == 2) return claim(request, path[1]);
        if (path.size() == 3 && path[2] == "retry") return retry_claim(request, path[1]);
    }

    if (path.size() == 3 && path[0] == "users" && method == "GET") {
        if (path[2] == "unclaimed") return unclaimed(request, path[1]);
        if (path[2] == "bets") return user_bets(request, path[1]);
    }

    return route_not_found(request);
}

std::string ApiRouter::require_user(const ApiRequest& request) const {
    std::string user = request.header("x-user-id");
    if (user.empty()) {
        throw UnauthenticatedError("X-User-Id header is required");
    }
    return user;
}

ApiResponse ApiRouter::health() {
    return json_response(200, {{"status", "ok"}, {"time", time_utils::to_iso8601(now_ms())}});
}

ApiResponse ApiRouter::metrics() {
    ApiResponse res;
    res.content_type = "text/plain; version=0.0.4";
    res.body = MetricsRegistry::instance().to_prometheus();
    return res;
}

ApiResponse ApiRouter::create_market(const ApiRequest& request) {
    std::string user = require_user(request);
    json body = parse_body(request);

    CreateMarketRequest req;
    req.title = required_string(body, "title");
    req.creator_id = user;
    if (body.contains("categoryId") && body["categoryId"].is_string()) {
        req.category_id = body["categoryId"].get<std::string>();
    }

    if (!body.contains("endDate")) {
        throw InvalidRequestError("endDate is required");
    }
    const json& end = body["endDate"];
    if (end.is_string()) {
        req.end_date = time_utils::from_iso8601(end.get<std::string>());
    } else if (end.is_number_integer() && fits_int64(end)) {
        req.end_date = end.get<int64_t>();
    } else {
        throw InvalidRequestError("endDate must be an ISO 8601 string or epoch milliseconds");
    }

    if (body.contains("seedLiquidity") && !body["seedLiquidity"].is_null()) {
        req.seed_liquidity = amount_from(body["seedLiquidity"], "seedLiquidity");
    }
    req.platform_fee_bps = optional_int(body, "platformFeeBps");
    req.creator_fee_bps = optional_int(body, "creatorFeeBps");

    return json_response(200, to_json(engine_.create_market(req)));
}

ApiResponse ApiRouter::get_market(const std::string& market_id) {
    return json_response(200, to_json(engine_.pools().snapshot(market_id)));
}

ApiResponse ApiRouter::market_bets(const std::string& market_id) {
    if (!engine_.store().get_market(market_id)) {
        throw MarketNotFoundError(market_id);
    }
    return json_response(200, {{"marketId", market_id},
                               {"bets", bets_json(engine_.store().get_bets_for_market(market_id))}});
}

ApiResponse ApiRouter::resolve_market(const ApiRequest& request, const std::string& market_id) {
    std::string user = require_user(request);
    json body = parse_body(request);

    Side outcome = side_from_string(required_string(body, "outcome"));
    std::string note;
    if (body.contains("note") && body["note"].is_string()) {
        note = body["note"].get<std::string>();
    }

    return json_response(200, to_json(engine_.resolution().resolve(market_id, outcome, user, note)));
}

ApiResponse ApiRouter::place_bet(const ApiRequest& request) {
    std::string user = require_user(request);
    json body = parse_body(request);

    std::string market_id = required_string(body, "marketId");
    Side side = side_from_string(required_string(body, "side"));
    if (!body.contains("grossAmount")) {
        throw InvalidAmountError("grossAmount is required");
    }
    Amount gross = amount_from(body["grossAmount"], "grossAmount");

    return json_response(200, to_json(engine_.bets().place_bet(market_id, user, side, gross)));
}

ApiResponse ApiRouter::get_bet(const ApiRequest& request, const std::string& bet_id) {
    std::string user = require_user(request);
    auto bet = engine_.store().get_bet(bet_id);
    if (!bet) {
        throw BetNotFoundError(bet_id);
    }
    if (bet->user_id != user && !engine_.config().is_admin(user)) {
        throw ForbiddenError("Bet " + bet_id + " belongs to another user");
    }
    return json_response(200, to_json(*bet));
}

ApiResponse ApiRouter::claim(const ApiRequest& request, const std::string& bet_id) {
    std::string user = require_user(request);
    return json_response(200, to_json(engine_.claims().claim(bet_id, user)));
}

ApiResponse ApiRouter::retry_claim(const ApiRequest& request, const std::string& bet_id) {
    std::string user = require_user(request);
    return json_response(200, to_json(engine_.claims().retry_transfer(bet_id, user)));
}

ApiResponse ApiRouter::unclaimed(const ApiRequest& request, const std::string& user_id) {
    require_self_or_admin(require_user(request), user_id, "winnings");
    return json_response(200, to_json(engine_.claims().unclaimed_winnings(user_id)));
}

ApiResponse ApiRouter::user_bets(const ApiRequest& request, const std::string& user_id) {
    require_self_or_admin(require_user(request), user_id, "bets");
    return json_response(200, {{"userId", user_id},
                               {"bets", bets_json(engine_.store().get_bets_for_user(user_id))}});
}

void ApiRouter::require_self_or_admin(const std::string& requester, const std::string& user_id,
                                      const std::string& what) const {
    if (requester != user_id && !engine_.config().is_admin(requester)) {
        throw ForbiddenError("Cannot view another user's " + what);
    }
}

} // namespace api
} // namespace settle
