#include "betting/fees.hpp"

namespace settle {

FeeSchedule fee_schedule_for(const Market& market, const FeeConfig& defaults) {
    FeeSchedule schedule;
    schedule.platform_bps = market.platform_fee_bps.value_or(defaults.platform_fee_bps);
    schedule.creator_bps = market.creator_fee_bps.value_or(defaults.creator_fee_bps);
    return schedule;
}

FeeBreakdown compute_fees(Amount gross, const FeeSchedule& schedule) {
    FeeBreakdown fees;
    fees.platform_fee = gross.mul_bps(schedule.platform_bps);
    fees.creator_fee = gross.mul_bps(schedule.creator_bps);
    fees.net_stake = gross - fees.platform_fee - fees.creator_fee;
    return fees;
}

} // namespace settle
