#include "resolution/resolution_service.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>

namespace settle {

ResolutionService::ResolutionService(LedgerStore& store, PoolManager& pools, const Config& config)
    : store_(store)
    , pools_(pools)
    , config_(config)
{
}

Market ResolutionService::resolve(const std::string& market_id, Side outcome,
                                  const std::string& requester_id, const std::string& note) {
    auto held = pools_.lock(market_id);
    const Market& market = held.market();

    if (requester_id != market.creator_id && !config_.is_admin(requester_id)) {
        throw ForbiddenError("Only the market creator or an admin can resolve market " + market_id);
    }

    if (market.status == MarketStatus::RESOLVED) {
        throw AlreadyResolvedError(market_id);
    }

    if (!store_.resolve_market_if_open(market_id, outcome, now_ms(), note)) {
        held.reload();
        throw AlreadyResolvedError(market_id);
    }

    held.reload();
    SETTLE_COUNTER("markets_resolved").increment();
    spdlog::info("Market {} resolved {} by {} ({} bets, volume {})",
                 market_id, to_string(outcome), requester_id,
                 held.market().bet_count, held.market().total_volume.to_string());

    return held.market();
}

} // namespace settle
