#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace gridcycle {
namespace strategy {

// 연속 체결 감지 시 어느 쪽 1층을 건너뛸지
enum class SuppressionPolicy {
    OPPOSITE_SIDE,   // 매수 연속 -> 다음 매도 1층 생략 (돌파 추종)
    SAME_SIDE,       // 매수 연속 -> 다음 매수 1층 생략 (노출 축소)
    NONE             // 감지만 하고 생략하지 않음
};

const char* toString(SuppressionPolicy policy);
SuppressionPolicy parseSuppressionPolicy(const std::string& name);

struct PatternSignal {
    bool suppress_next_buy = false;
    bool suppress_next_sell = false;
    int buy_streak = 0;      // 인덱스 차이 1로 이어진 최장 매수 체결 수
    int sell_streak = 0;

    bool detected() const { return suppress_next_buy || suppress_next_sell; }
};

class PatternDetector {
public:
    explicit PatternDetector(SuppressionPolicy policy = SuppressionPolicy::OPPOSITE_SIDE,
                             int min_streak = 2);

    PatternSignal detect(const std::vector<GridOrder>& filled_orders) const;

    SuppressionPolicy policy() const { return policy_; }
    int minStreak() const { return min_streak_; }

private:
    static int longestRun(std::vector<int> indices, int step);

    SuppressionPolicy policy_;
    int min_streak_;
};

} // namespace strategy
} // namespace gridcycle
