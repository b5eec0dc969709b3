#pragma once

#include "common/types.hpp"
#include "config/config.hpp"

namespace settle {

struct FeeSchedule {
    int64_t platform_bps{0};
    int64_t creator_bps{0};
};

struct FeeBreakdown {
    Amount platform_fee;
    Amount creator_fee;
    Amount net_stake;       // gross - platform_fee - creator_fee, exactly
};

// Per-market overrides win over the configured defaults.
FeeSchedule fee_schedule_for(const Market& market, const FeeConfig& defaults);

// Each fee is gross * bps / 10000 rounded half-even; the net takes the remainder.
FeeBreakdown compute_fees(Amount gross, const FeeSchedule& schedule);

} // namespace settle
