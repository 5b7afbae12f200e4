#pragma once

#include <optional>
#include <string>

#include "risk/GuardConfig.h"
#include "strategy/GridBuilder.h"
#include "strategy/PatternDetector.h"

namespace gridcycle {
namespace engine {

// 엔진 설정
struct EngineConfig {
    strategy::GridParameters grid;

    double trade_amount = 0.1;                       // 기본 수량 (lot)
    std::optional<double> cycle_target_profit;       // 없으면 trade_amount * multiplier
    double target_profit_multiplier = 1000.0;
    std::optional<double> withdrawal_threshold;      // 세션 누적 수익 출금 기준

    int tick_interval_ms = 200;
    int paused_poll_interval_ms = 1000;
    int venue_failure_alert_threshold = 3;

    bool reanchor_on_fill = true;                    // 체결 시 체결가 기준 재구성
    strategy::SuppressionPolicy suppression_policy = strategy::SuppressionPolicy::OPPOSITE_SIDE;
    int suppression_min_streak = 2;

    risk::GuardConfig guards;

    // 잘못된 값이면 InvalidConfigurationError
    void validate() const;
};

} // namespace engine
} // namespace gridcycle
