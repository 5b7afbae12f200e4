#include "risk/GuardEvaluator.h"

#include <spdlog/fmt/fmt.h>

namespace gridcycle {
namespace risk {

const char* toString(GuardReason reason) {
    switch (reason) {
        case GuardReason::NONE: return "None";
        case GuardReason::BLACKOUT: return "Blackout";
        case GuardReason::MAX_REDUCE_BREACHED: return "MaxReduceBreached";
        case GuardReason::DRAWDOWN_CAP: return "DrawdownCap";
        case GuardReason::LOW_MARGIN: return "LowMargin";
        case GuardReason::SPREAD_TOO_WIDE: return "SpreadTooWide";
        case GuardReason::CAPACITY_REACHED: return "CapacityReached";
        case GuardReason::EXPOSURE_CAP: return "ExposureCap";
    }
    return "None";
}

GuardDecision GuardEvaluator::evaluate(
    const Tick& market,
    const AccountSnapshot& account,
    const GuardContext& context,
    const GuardConfig& config,
    Timestamp now
) {
    bool continuation_only = false;

    // 1) 블랙아웃
    std::string window_name;
    if (inBlackout(config, now, &window_name)) {
        if (context.cycle_in_flight && config.allow_cycle_completion_in_blackout) {
            continuation_only = true;
        } else {
            return GuardDecision::block(
                GuardReason::BLACKOUT,
                fmt::format("blackout window '{}' active", window_name));
        }
    }

    // 2) 평가금 감소 한도 (긴급 정지)
    GuardDecision reduce = checkEquityReduction(account, context, config);
    if (!reduce.allowed) {
        return reduce;
    }

    // 3) 사이클 최대 낙폭
    if (config.max_drawdown && context.max_drawdown_observed >= *config.max_drawdown) {
        return GuardDecision::block(
            GuardReason::DRAWDOWN_CAP,
            fmt::format("max drawdown {:.2f} >= {:.2f}",
                        context.max_drawdown_observed, *config.max_drawdown));
    }

    // 4) 여유 증거금
    if (config.min_free_margin && account.free_margin < *config.min_free_margin) {
        return GuardDecision::block(
            GuardReason::LOW_MARGIN,
            fmt::format("free margin {:.2f} < min {:.2f}",
                        account.free_margin, *config.min_free_margin));
    }

    // 5) 스프레드
    const double spread = market.spread();
    if (config.max_spread && spread > *config.max_spread) {
        return GuardDecision::block(
            GuardReason::SPREAD_TOO_WIDE,
            fmt::format("spread {:.3f} > max {:.3f}", spread, *config.max_spread));
    }

    // 6) 포지션/주문 수
    const bool positions_full = config.max_positions && context.open_positions >= *config.max_positions;
    const bool orders_full = config.max_orders && context.pending_orders >= *config.max_orders;
    if (positions_full || orders_full) {
        return GuardDecision::block(
            GuardReason::CAPACITY_REACHED,
            fmt::format("capacity reached (pos {}/{}, orders {}/{})",
                        context.open_positions,
                        config.max_positions ? std::to_string(*config.max_positions) : "inf",
                        context.pending_orders,
                        config.max_orders ? std::to_string(*config.max_orders) : "inf"));
    }

    GuardDecision decision = GuardDecision::allow();
    decision.continuation_only = continuation_only;
    if (continuation_only) {
        decision.detail = fmt::format("blackout window '{}' active, continuing current cycle", window_name);
    }
    return decision;
}

GuardDecision GuardEvaluator::checkEquityReduction(
    const AccountSnapshot& account,
    const GuardContext& context,
    const GuardConfig& config
) {
    if (!config.max_reduce_balance) {
        return GuardDecision::allow();
    }
    const double reduced = context.cycle_start_balance - account.equity;
    if (reduced > *config.max_reduce_balance) {
        return GuardDecision::block(
            GuardReason::MAX_REDUCE_BREACHED,
            fmt::format("equity {:.2f} reduced {:.2f} from cycle start {:.2f} (limit {:.2f})",
                        account.equity, reduced, context.cycle_start_balance,
                        *config.max_reduce_balance));
    }
    return GuardDecision::allow();
}

GuardDecision GuardEvaluator::checkExposure(
    Volume current_exposure,
    Volume additional_volume,
    const GuardConfig& config
) {
    if (!config.max_total_exposure) {
        return GuardDecision::allow();
    }
    if (current_exposure + additional_volume > *config.max_total_exposure) {
        return GuardDecision::block(
            GuardReason::EXPOSURE_CAP,
            fmt::format("exposure {:.2f} + {:.2f} > max {:.2f}",
                        current_exposure, additional_volume, *config.max_total_exposure));
    }
    return GuardDecision::allow();
}

bool GuardEvaluator::inBlackout(const GuardConfig& config, Timestamp now, std::string* window_name) {
    for (const auto& window : config.blackout_windows) {
        if (window.contains(now, config.utc_offset_minutes)) {
            if (window_name) {
                *window_name = window.name;
            }
            return true;
        }
    }
    return false;
}

bool GuardEvaluator::inQuietHours(const GuardConfig& config, Timestamp now) {
    return config.quiet_hours && config.quiet_hours->contains(now, config.utc_offset_minutes);
}

} // namespace risk
} // namespace gridcycle
