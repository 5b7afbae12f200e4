#pragma once

#include "common/Types.h"
#include "risk/GuardConfig.h"
#include <string>

namespace gridcycle {
namespace risk {

enum class GuardReason {
    NONE,
    BLACKOUT,
    MAX_REDUCE_BREACHED,
    DRAWDOWN_CAP,
    LOW_MARGIN,
    SPREAD_TOO_WIDE,
    CAPACITY_REACHED,
    EXPOSURE_CAP
};

const char* toString(GuardReason reason);

struct GuardDecision {
    bool allowed = true;
    GuardReason reason = GuardReason::NONE;
    bool emergency_stop = false;       // MAX_REDUCE_BREACHED 에서만 true
    bool continuation_only = false;    // 블랙아웃 중 진행 사이클만 허용 (신규 사이클 불가)
    std::string detail;

    static GuardDecision allow() { return GuardDecision{}; }
    static GuardDecision block(GuardReason reason, std::string detail) {
        GuardDecision d;
        d.allowed = false;
        d.reason = reason;
        d.emergency_stop = (reason == GuardReason::MAX_REDUCE_BREACHED);
        d.detail = std::move(detail);
        return d;
    }
};

// 호출자가 채우는 전략 측 상태
struct GuardContext {
    Amount cycle_start_balance = 0.0;
    Amount max_drawdown_observed = 0.0;
    int open_positions = 0;        // 전략 소유 포지션 수
    int pending_orders = 0;        // 전략 소유 대기 주문 수
    bool cycle_in_flight = false;  // placed/filled 주문 존재
};

// 순수 정책 함수 모음. 긴급 정지 신호 외의 부수효과 없음.
class GuardEvaluator {
public:
    // 검사 순서: blackout -> max reduce -> drawdown -> free margin -> spread -> capacity
    // 첫 실패에서 중단
    static GuardDecision evaluate(
        const Tick& market,
        const AccountSnapshot& account,
        const GuardContext& context,
        const GuardConfig& config,
        Timestamp now
    );

    static GuardDecision checkEquityReduction(
        const AccountSnapshot& account,
        const GuardContext& context,
        const GuardConfig& config
    );

    // 현재 노출 + 신규 주문 lot 합이 한도를 넘는지
    static GuardDecision checkExposure(
        Volume current_exposure,
        Volume additional_volume,
        const GuardConfig& config
    );

    static bool inBlackout(const GuardConfig& config, Timestamp now, std::string* window_name = nullptr);
    static bool inQuietHours(const GuardConfig& config, Timestamp now);
};

} // namespace risk
} // namespace gridcycle
