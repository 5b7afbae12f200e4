#pragma once

#include "risk/TimeWindow.h"
#include <optional>
#include <string>
#include <vector>

namespace gridcycle {
namespace risk {

enum class GuardKind {
    MAX_DRAWDOWN,         // 사이클 최대 낙폭 (금액)
    MAX_POSITIONS,
    MAX_ORDERS,
    MAX_SPREAD,
    MAX_REDUCE,           // 사이클 시작 잔고 대비 평가금 감소 한도 -> 긴급 정지
    MIN_FREE_MARGIN,
    MAX_TOTAL_EXPOSURE    // 전략 포지션 + 신규 주문 총 lot
};

const char* toString(GuardKind kind);
std::optional<GuardKind> parseGuardKind(const std::string& name);

// 모든 임계값은 optional (미설정 = 제한 없음).
// 변경은 다음 틱부터 적용된다.
struct GuardConfig {
    std::optional<double> max_drawdown;
    std::optional<int> max_positions;
    std::optional<int> max_orders;
    std::optional<double> max_spread;
    std::optional<double> max_reduce_balance;
    std::optional<double> min_free_margin = 100.0;
    std::optional<double> max_total_exposure;

    std::vector<TimeWindow> blackout_windows;
    bool allow_cycle_completion_in_blackout = true;

    // 저유동성 시간대: 다음 사이클 기본 수량에 factor 적용
    std::optional<TimeWindow> quiet_hours;
    double quiet_hours_factor = 0.5;

    int utc_offset_minutes = 420;   // GMT+7

    // value 가 비어 있으면 해당 가드 해제
    void setThreshold(GuardKind kind, std::optional<double> value);
    std::optional<double> threshold(GuardKind kind) const;

    // 개수 임계값: 반올림 후 int 범위로 고정 (음수/비유한값은 InvalidConfigurationError)
    static int toCount(double value);

    // 이름이 같은 창은 교체
    void upsertBlackoutWindow(const TimeWindow& window);
};

} // namespace risk
} // namespace gridcycle
