#pragma once

#include <string>
#include "common/types.hpp"
#include "config/config.hpp"
#include "persistence/ledger_store.hpp"
#include "pricing/pool_manager.hpp"

namespace settle {

/**
 * One-way open -> resolved transition. Runs under the market lock so no bet
 * interleaves; the store's conditional update makes every later call fail
 * with AlreadyResolvedError whatever outcome it asks for.
 */
class ResolutionService {
public:
    ResolutionService(LedgerStore& store, PoolManager& pools, const Config& config);

    // Requester must be the market creator or an admin user.
    Market resolve(const std::string& market_id, Side outcome,
                   const std::string& requester_id, const std::string& note = "");

private:
    LedgerStore& store_;
    PoolManager& pools_;
    const Config& config_;
};

} // namespace settle
